#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace ds::util {

constexpr uintmax_t operator""_KiB(const unsigned long long v) { return v * 1024ULL; }
constexpr uintmax_t operator""_MiB(const unsigned long long v) { return v * 1024ULL * 1024ULL; }
constexpr uintmax_t operator""_GiB(const unsigned long long v) { return v * 1024ULL * 1024ULL * 1024ULL; }

// "<value> <unit>" with one decimal place, scaled by 1024 up to TB (e.g. 1610612736 -> "1.5 GB").
std::string formatBytes(uintmax_t bytes);

// Parses "<number>[ ]<b|kb|mb|gb>" case-insensitively (e.g. "1500 MB", "2.5gb").
// The longest valid leading number is used ("1.2.3 GB" is 1.2 GB).
// Returns std::nullopt and logs a warning on empty input, a pattern mismatch, an invalid number
// or a value that does not fit in uintmax_t.
std::optional<uintmax_t> tryParseSizeToBytes(std::string_view sizeString);

// tryParseSizeToBytes with 0 standing in for any failure.
uintmax_t parseSizeToBytes(std::string_view sizeString);

}
