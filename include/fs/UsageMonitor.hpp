#pragma once

#include "concurrency/Debouncer.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>

namespace ds::fs {

struct DiskUsage {
    std::filesystem::path dir;
    uintmax_t used_bytes = 0;
    std::optional<uintmax_t> available_bytes; // nullopt when the filesystem could not be queried
};

// "<used> used, <available> free", with "unknown" for an unknown free space.
std::string summary(const DiskUsage& usage);

// Tracks a download directory. Writers call touch() per chunk; the listener sees one
// fresh snapshot once the writes settle for the configured quiet period.
class UsageMonitor {
public:
    using Listener = std::function<void(const DiskUsage&)>;

    UsageMonitor(boost::asio::io_context& ioc,
                 std::filesystem::path dir,
                 std::chrono::milliseconds quietPeriod,
                 Listener onUpdate);

    UsageMonitor(const UsageMonitor&) = delete;
    UsageMonitor& operator=(const UsageMonitor&) = delete;

    [[nodiscard]] DiskUsage sample() const;

    void touch();

    [[nodiscard]] const std::filesystem::path& dir() const { return dir_; }

private:
    std::filesystem::path dir_;
    Listener onUpdate_;
    concurrency::Debouncer<> refresh_;
};

}
