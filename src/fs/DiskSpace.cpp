#include "fs/DiskSpace.hpp"
#include "log/Registry.hpp"
#include "util/bytes.hpp"

#include <cerrno>
#include <cstring>
#include <limits>
#include <sys/statvfs.h>

using namespace ds::log;
using namespace ds::util;

namespace {

uintmax_t saturatingAdd(const uintmax_t a, const uintmax_t b) {
    if (a > std::numeric_limits<uintmax_t>::max() - b) return std::numeric_limits<uintmax_t>::max();
    return a + b;
}

}

std::optional<uintmax_t> ds::fs::getAvailableDiskSpace(const std::filesystem::path& path) {
    struct statvfs st{};
    if (::statvfs(path.c_str(), &st) < 0) {
        Registry::fs()->error("[DiskSpace] Error checking disk space for {}: {}", path.string(), strerror(errno));
        return std::nullopt;
    }

    return static_cast<uintmax_t>(st.f_bavail) * static_cast<uintmax_t>(st.f_frsize);
}

bool ds::fs::hasSufficientSpace(const std::filesystem::path& path, const uintmax_t requiredBytes, const uintmax_t reserveBytes) {
    const auto available = getAvailableDiskSpace(path);
    if (!available) {
        Registry::fs()->warn("[DiskSpace] Free space unknown for {}, treating as insufficient", path.string());
        return false;
    }

    const auto needed = saturatingAdd(saturatingAdd(requiredBytes, requiredBytes / 10), reserveBytes);
    if (*available < needed) {
        Registry::fs()->warn("[DiskSpace] Insufficient space on {}: need {}, have {}",
                             path.string(), formatBytes(needed), formatBytes(*available));
        return false;
    }

    Registry::fs()->debug("[DiskSpace] {} available on {} (need {})",
                          formatBytes(*available), path.string(), formatBytes(needed));
    return true;
}
