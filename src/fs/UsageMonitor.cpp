#include "fs/UsageMonitor.hpp"
#include "fs/DirectorySize.hpp"
#include "fs/DiskSpace.hpp"
#include "util/bytes.hpp"
#include "log/Registry.hpp"

using namespace ds::fs;
using namespace ds::util;
using namespace ds::log;

std::string ds::fs::summary(const DiskUsage& usage) {
    const auto available = usage.available_bytes ? formatBytes(*usage.available_bytes) : std::string("unknown");
    return formatBytes(usage.used_bytes) + " used, " + available + " free";
}

UsageMonitor::UsageMonitor(boost::asio::io_context& ioc,
                           std::filesystem::path dir,
                           const std::chrono::milliseconds quietPeriod,
                           Listener onUpdate)
    : dir_(std::move(dir)),
      onUpdate_(std::move(onUpdate)),
      refresh_(concurrency::debounce<>(ioc, [this] {
          const auto usage = sample();
          Registry::fs()->debug("[UsageMonitor] {}: {}", dir_.string(), summary(usage));
          if (onUpdate_) onUpdate_(usage);
      }, quietPeriod)) {}

DiskUsage UsageMonitor::sample() const {
    return {dir_, getDirectorySize(dir_), getAvailableDiskSpace(dir_)};
}

void UsageMonitor::touch() { refresh_(); }
