#pragma once

#include "log/Registry.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <tuple>
#include <type_traits>
#include <utility>
#include <boost/asio/error.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

namespace ds::concurrency {

/**
 * Coalesces bursts of calls into a single trailing call.
 *
 * Every invocation stores its arguments and re-arms the timer to fire `wait` after
 * that invocation, cancelling whatever was pending. Only the latest arguments are
 * delivered, at most once per quiet period.
 *
 * The callback runs on the thread driving the io_context. Invoke the wrapper from
 * that same thread; it is not thread-safe. Copies share one timer. Destroying the
 * last copy drops the pending call.
 */
template <typename... Args>
class Debouncer {
public:
    using Callback = std::function<void(Args...)>;

    Debouncer(boost::asio::io_context& ioc, Callback callback, const std::chrono::milliseconds wait)
        : state_(std::make_shared<State>(ioc, std::move(callback), wait)) {}

    void operator()(Args... args) const {
        auto& s = *state_;
        s.pending.emplace(std::move(args)...);
        const auto generation = ++s.generation;

        // Re-arming cancels the outstanding wait; the generation check also covers a
        // completion that was already queued when we re-armed.
        s.timer.expires_after(s.wait);
        s.timer.async_wait([weak = std::weak_ptr<State>(state_), generation](const boost::system::error_code& ec) {
            if (ec == boost::asio::error::operation_aborted) return;
            const auto state = weak.lock();
            if (!state || state->generation != generation || !state->pending) return;

            auto latest = std::move(*state->pending);
            state->pending.reset();
            std::apply(state->callback, std::move(latest));
        });
    }

    [[nodiscard]] std::chrono::milliseconds wait() const { return state_->wait; }

private:
    struct State {
        State(boost::asio::io_context& ioc, Callback cb, const std::chrono::milliseconds w)
            : timer(ioc), callback(std::move(cb)), wait(w) {}

        boost::asio::steady_timer timer;
        Callback callback;
        std::chrono::milliseconds wait;
        std::optional<std::tuple<std::decay_t<Args>...>> pending;
        uint64_t generation = 0;
    };

    std::shared_ptr<State> state_;
};

// Each call yields an independent wrapper with its own timer.
template <typename... Args>
Debouncer<Args...> debounce(boost::asio::io_context& ioc,
                            std::type_identity_t<std::function<void(Args...)>> callback,
                            const std::chrono::milliseconds wait) {
    log::Registry::concurrency()->debug("[Debouncer] New wrapper, wait {}ms", wait.count());
    return Debouncer<Args...>(ioc, std::move(callback), wait);
}

}
