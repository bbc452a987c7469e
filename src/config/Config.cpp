#include "config/Config.hpp"
#include "config/config_yaml.hpp"

#include <yaml-cpp/yaml.h>

namespace ds::config {

Config loadConfig(const std::filesystem::path& path) {
    Config cfg;
    YAML::Node root = YAML::LoadFile(path.string());

    if (auto node = root["logging"]) YAML::convert<LoggingConfig>::decode(node, cfg.logging);
    if (auto node = root["downloads"]) YAML::convert<DownloadsConfig>::decode(node, cfg.downloads);

    return cfg;
}

std::string toYaml(const Config& config) {
    YAML::Node root;
    root["logging"] = config.logging;
    root["downloads"] = config.downloads;

    YAML::Emitter out;
    out << root;
    return {out.c_str()};
}

}
