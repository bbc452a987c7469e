#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <spdlog/spdlog.h>

namespace ds::config {

constexpr static uintmax_t DEFAULT_MIN_FREE_SPACE_BYTES = static_cast<uintmax_t>(1) * 1024 * 1024 * 1024; // 1GB

struct DownloadsConfig {
    std::filesystem::path download_dir = "/var/lib/downstash/downloads";
    uintmax_t min_free_space_bytes = DEFAULT_MIN_FREE_SPACE_BYTES;
    std::chrono::milliseconds progress_debounce = std::chrono::milliseconds(250);
};

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum downstash   = spdlog::level::info;   // Startup, config, CLI results
    spdlog::level::level_enum fs          = spdlog::level::warn;   // statvfs failures, unreadable entries
    spdlog::level::level_enum util        = spdlog::level::warn;   // Malformed size strings
    spdlog::level::level_enum concurrency = spdlog::level::warn;
};

struct LogLevelsConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::info;
    spdlog::level::level_enum file_log_level = spdlog::level::warn;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct LoggingConfig {
    std::filesystem::path log_dir = "/var/log/downstash";
    LogLevelsConfig levels;
};

struct Config {
    LoggingConfig logging;
    DownloadsConfig downloads;
};

Config loadConfig(const std::filesystem::path& path);

// Effective configuration as YAML, in the same layout loadConfig() reads.
std::string toYaml(const Config& config);

}
