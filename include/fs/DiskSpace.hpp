#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>

namespace ds::fs {

// Bytes available to unprivileged users on the filesystem holding path (f_bavail * f_frsize).
// std::nullopt when statvfs fails; the failure is logged, never thrown.
std::optional<uintmax_t> getAvailableDiskSpace(const std::filesystem::path& path);

// Pre-flight check before a transfer: requires the payload plus 10% headroom plus reserveBytes.
// Unknown free space counts as insufficient.
bool hasSufficientSpace(const std::filesystem::path& path, uintmax_t requiredBytes, uintmax_t reserveBytes = 0);

}
