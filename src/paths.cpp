#include "paths.hpp"

#include <cstdlib>
#include <unistd.h>

namespace ds::paths {

static constexpr const auto* DEFAULT_CONFIG_PATH = "/etc/downstash/config.yaml";
static constexpr const auto* DEFAULT_LOG_PATH = "/var/log/downstash";

static std::filesystem::path logPathOverride;

std::filesystem::path getConfigPath() {
    if (const char* env = std::getenv("DOWNSTASH_CONFIG"); env && *env) return env;
    return DEFAULT_CONFIG_PATH;
}

std::filesystem::path getLogPath() {
    if (!logPathOverride.empty()) return logPathOverride;
    return DEFAULT_LOG_PATH;
}

void setLogPathForTesting() {
    logPathOverride = std::filesystem::temp_directory_path() / ("downstash_test_logs_" + std::to_string(::getpid()));
}

}
