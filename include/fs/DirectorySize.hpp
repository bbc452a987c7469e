#pragma once

#include <cstdint>
#include <filesystem>

namespace ds::fs {

// Sum of all regular file sizes at any depth under dir. Symlinks and special files are ignored
// and never followed. Unreadable files and unlistable subdirectories are skipped with a warning;
// an unlistable dir itself yields 0. Never throws.
uintmax_t getDirectorySize(const std::filesystem::path& dir);

}
