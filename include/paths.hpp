#pragma once

#include <filesystem>

namespace ds::paths {

// DOWNSTASH_CONFIG overrides the default /etc/downstash/config.yaml
std::filesystem::path getConfigPath();

std::filesystem::path getLogPath();

// Redirects logs into a scratch directory under the system temp dir.
void setLogPathForTesting();

}
