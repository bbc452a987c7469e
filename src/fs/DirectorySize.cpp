#include "fs/DirectorySize.hpp"
#include "log/Registry.hpp"

#include <vector>

using namespace ds::log;

namespace stdfs = std::filesystem;

uintmax_t ds::fs::getDirectorySize(const std::filesystem::path& dir) {
    uintmax_t totalSize = 0;
    std::vector<stdfs::path> pending{dir};
    bool topLevel = true;

    while (!pending.empty()) {
        const auto current = std::move(pending.back());
        pending.pop_back();

        std::error_code ec;
        stdfs::directory_iterator it(current, ec);
        if (ec) {
            if (topLevel) {
                Registry::fs()->error("[DirectorySize] Error calculating directory size for {}: {}",
                                      dir.string(), ec.message());
                return 0;
            }
            Registry::fs()->warn("[DirectorySize] Skipping unreadable directory {}: {}", current.string(), ec.message());
            continue;
        }
        topLevel = false;

        for (const stdfs::directory_iterator end{}; it != end; it.increment(ec)) {
            const auto& entry = *it;

            // symlink_status so links to directories or files are never followed
            const auto status = entry.symlink_status(ec);
            if (ec) {
                // The listing may still know it is a directory (no syscall); descending lets the
                // failed open report it as an unreadable directory.
                std::error_code typeEc;
                if (entry.is_directory(typeEc)) {
                    pending.push_back(entry.path());
                    ec.clear();
                    continue;
                }
                Registry::fs()->warn("[DirectorySize] Could not stat {}: {}", entry.path().string(), ec.message());
                ec.clear();
                continue;
            }

            if (stdfs::is_directory(status)) {
                pending.push_back(entry.path());
            } else if (stdfs::is_regular_file(status)) {
                const auto size = entry.file_size(ec);
                if (ec) {
                    Registry::fs()->warn("[DirectorySize] Could not get size for {}: {}",
                                         entry.path().string(), ec.message());
                    ec.clear();
                    continue;
                }
                totalSize += size;
            }
        }

        if (ec) Registry::fs()->warn("[DirectorySize] Listing of {} ended early: {}", current.string(), ec.message());
    }

    return totalSize;
}
