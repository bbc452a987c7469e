#pragma once

#include "config/Config.hpp"
#include "util/bytes.hpp"

#include <fmt/format.h>
#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace ds::config;

static std::string to_std_string(const spdlog::string_view_t sv) { return {sv.data(), sv.size()}; }

template<>
struct convert<SubsystemLogLevelsConfig> {
    static Node encode(const SubsystemLogLevelsConfig& rhs) {
        Node node;
        node["downstash"]   = to_std_string(spdlog::level::to_string_view(rhs.downstash));
        node["fs"]          = to_std_string(spdlog::level::to_string_view(rhs.fs));
        node["util"]        = to_std_string(spdlog::level::to_string_view(rhs.util));
        node["concurrency"] = to_std_string(spdlog::level::to_string_view(rhs.concurrency));
        return node;
    }

    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.downstash = spdlog::level::from_str(node["downstash"].as<std::string>("info"));
        rhs.fs = spdlog::level::from_str(node["fs"].as<std::string>("warn"));
        rhs.util = spdlog::level::from_str(node["util"].as<std::string>("warn"));
        rhs.concurrency = spdlog::level::from_str(node["concurrency"].as<std::string>("warn"));
        return true;
    }
};

template<>
struct convert<LogLevelsConfig> {
    static Node encode(const LogLevelsConfig& rhs) {
        Node node;
        node["console_log_level"] = to_std_string(spdlog::level::to_string_view(rhs.console_log_level));
        node["file_log_level"]    = to_std_string(spdlog::level::to_string_view(rhs.file_log_level));
        node["subsystem_levels"]  = rhs.subsystem_levels;
        return node;
    }

    static bool decode(const Node& node, LogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.console_log_level = spdlog::level::from_str(node["console_log_level"].as<std::string>("info"));
        rhs.file_log_level = spdlog::level::from_str(node["file_log_level"].as<std::string>("warn"));
        if (const auto sub = node["subsystem_levels"]) rhs.subsystem_levels = sub.as<SubsystemLogLevelsConfig>();
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static Node encode(const LoggingConfig& rhs) {
        Node node;
        node["log_dir"] = rhs.log_dir.string();
        node["levels"] = rhs.levels;
        return node;
    }

    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.log_dir = node["log_dir"].as<std::string>("/var/log/downstash");
        if (const auto levels = node["levels"]) rhs.levels = levels.as<LogLevelsConfig>();
        return true;
    }
};

template<>
struct convert<DownloadsConfig> {
    static Node encode(const DownloadsConfig& rhs) {
        Node node;
        node["download_dir"] = rhs.download_dir.string();
        node["min_free_space"] = fmt::format("{} b", rhs.min_free_space_bytes);
        node["progress_debounce_ms"] = rhs.progress_debounce.count();
        return node;
    }

    static bool decode(const Node& node, DownloadsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.download_dir = node["download_dir"].as<std::string>("/var/lib/downstash/downloads");
        if (const auto minFree = node["min_free_space"])
            rhs.min_free_space_bytes = ds::util::parseSizeToBytes(minFree.as<std::string>());
        rhs.progress_debounce = std::chrono::milliseconds(node["progress_debounce_ms"].as<unsigned int>(250));
        return true;
    }
};

}
