#include "util/bytes.hpp"
#include "log/Registry.hpp"

#include <array>
#include <cctype>
#include <charconv>
#include <cmath>
#include <limits>
#include <optional>
#include <fmt/format.h>

using namespace ds::util;
using namespace ds::log;

namespace {

constexpr std::array<const char*, 5> SUFFIX = {"B", "KB", "MB", "GB", "TB"};

std::string_view trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
    return s;
}

std::string toLower(const std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (const char c : s) out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    return out;
}

std::optional<uintmax_t> unitMultiplier(const std::string_view unit) {
    if (unit == "b") return 1;
    if (unit == "kb") return 1_KiB;
    if (unit == "mb") return 1_MiB;
    if (unit == "gb") return 1_GiB;
    return std::nullopt;
}

}

std::string ds::util::formatBytes(const uintmax_t bytes) {
    auto value = static_cast<double>(bytes);
    std::size_t unit = 0;

    // Capped at TB, larger values keep scaling in TB.
    while (value >= 1024.0 && unit + 1 < SUFFIX.size()) {
        value /= 1024.0;
        ++unit;
    }

    return fmt::format("{:.1f} {}", value, SUFFIX[unit]);
}

std::optional<uintmax_t> ds::util::tryParseSizeToBytes(const std::string_view sizeString) {
    const auto trimmed = trim(sizeString);
    if (trimmed.empty()) {
        Registry::util()->warn("[Bytes] Empty size string");
        return std::nullopt;
    }

    // <digits and dots><optional whitespace><unit>
    const auto lowered = toLower(trimmed);
    const std::string_view text(lowered);
    const auto numLen = text.find_first_not_of("0123456789.");
    const auto multiplier = numLen == 0 || numLen == std::string_view::npos
                                ? std::nullopt
                                : unitMultiplier(trim(text.substr(numLen)));
    if (!multiplier) {
        Registry::util()->warn("[Bytes] Could not parse size string: \"{}\"", sizeString);
        return std::nullopt;
    }

    // Longest leading number wins, "1.2.3" reads as 1.2
    double num = 0.0;
    const auto ec = std::from_chars(text.data(), text.data() + numLen, num).ec;
    if (ec == std::errc::result_out_of_range) {
        Registry::util()->warn("[Bytes] Size string out of range: \"{}\"", sizeString);
        return std::nullopt;
    }
    if (ec != std::errc() || !std::isfinite(num)) {
        Registry::util()->warn("[Bytes] Invalid number in size string: \"{}\"", sizeString);
        return std::nullopt;
    }

    const auto bytes = std::round(num * static_cast<double>(*multiplier));
    if (bytes >= static_cast<double>(std::numeric_limits<uintmax_t>::max())) {
        Registry::util()->warn("[Bytes] Size string out of range: \"{}\"", sizeString);
        return std::nullopt;
    }

    return static_cast<uintmax_t>(bytes);
}

uintmax_t ds::util::parseSizeToBytes(const std::string_view sizeString) {
    return tryParseSizeToBytes(sizeString).value_or(0);
}
