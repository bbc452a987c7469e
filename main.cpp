// Config
#include "config/ConfigRegistry.hpp"
#include "config/Config.hpp"

// Disk
#include "fs/DiskSpace.hpp"
#include "fs/UsageMonitor.hpp"
#include "util/bytes.hpp"

// Misc
#include "log/Registry.hpp"
#include "paths.hpp"

// Libraries
#include <boost/asio/io_context.hpp>
#include <fmt/core.h>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>

using namespace ds::config;
using namespace ds::fs;
using namespace ds::util;
using namespace ds::log;

namespace {

struct Options {
    std::optional<std::filesystem::path> configPath;
    std::optional<std::string> need;
    std::optional<std::filesystem::path> dir;
    bool printConfig = false;
};

void usage() {
    std::cerr << "usage: downstash-check [--config <file>] [--need <size>] [--print-config] [dir]\n"
                 "  --need <size>   exit 0 if <size> (e.g. \"1500 MB\") fits in dir, 1 otherwise\n";
}

std::optional<Options> parseArgs(const int argc, char** argv) {
    Options opts;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if ((arg == "--config" || arg == "--need") && i + 1 < argc) {
            if (arg == "--config") opts.configPath = argv[++i];
            else opts.need = argv[++i];
        } else if (arg == "--print-config") {
            opts.printConfig = true;
        } else if (arg.rfind("--", 0) == 0 || opts.dir) {
            return std::nullopt;
        } else {
            opts.dir = arg;
        }
    }
    return opts;
}

Config loadEffectiveConfig(const Options& opts) {
    if (opts.configPath) return loadConfig(*opts.configPath);

    const auto defaultPath = ds::paths::getConfigPath();
    std::error_code ec;
    if (std::filesystem::exists(defaultPath, ec)) return loadConfig(defaultPath);
    return {};
}

}

int main(const int argc, char** argv) {
    const auto opts = parseArgs(argc, argv);
    if (!opts) {
        usage();
        return 2;
    }

    try {
        ConfigRegistry::init(loadEffectiveConfig(*opts));
        const auto& cfg = ConfigRegistry::get();
        Registry::init(cfg.logging.log_dir);

        if (opts->printConfig) {
            std::cout << toYaml(cfg) << std::endl;
            return EXIT_SUCCESS;
        }

        const auto dir = opts->dir.value_or(cfg.downloads.download_dir);

        boost::asio::io_context ioc;
        const UsageMonitor monitor(ioc, dir, cfg.downloads.progress_debounce, nullptr);
        const auto usage = monitor.sample();
        fmt::print("{}: {}\n", dir.string(), summary(usage));

        if (!opts->need) return EXIT_SUCCESS;

        // "0 MB" is a valid request; only an unparsable string is a usage error
        const auto need = tryParseSizeToBytes(*opts->need);
        if (!need) {
            Registry::downstash()->error("[Check] Invalid size for --need: \"{}\"", *opts->need);
            return 2;
        }
        const auto needBytes = *need;

        const bool fits = hasSufficientSpace(dir, needBytes, cfg.downloads.min_free_space_bytes);
        fmt::print("{} {} (reserve {})\n", formatBytes(needBytes), fits ? "fits" : "does not fit",
                   formatBytes(cfg.downloads.min_free_space_bytes));
        return fits ? EXIT_SUCCESS : EXIT_FAILURE;
    } catch (const std::exception& e) {
        Registry::downstash()->error("[Check] {}", e.what());
        return EXIT_FAILURE;
    }
}
