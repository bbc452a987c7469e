#include <gtest/gtest.h>
#include "fs/DirectorySize.hpp"

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>
#include <climits>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace stdfs = std::filesystem;
using namespace ds::fs;

class DirectorySizeTest : public ::testing::Test {
protected:
    stdfs::path root;
    std::vector<std::string> deepChain;
    std::string deepFile;

    void SetUp() override {
        root = stdfs::temp_directory_path() / ("downstash_dirsize_" + std::to_string(::getpid()));
        stdfs::remove_all(root);
        stdfs::create_directories(root);
    }

    void TearDown() override {
        removeDeepChain();
        std::error_code ec;
        stdfs::remove_all(root, ec);
    }

    static void writeFile(const stdfs::path& path, const size_t bytes) {
        std::ofstream out(path, std::ios::binary);
        out << std::string(bytes, 'x');
    }

    // Builds root/<d>/<d>/... while the path stays below PATH_MAX with room for one more
    // name; leaves `fd` open on the deepest directory and `len` at its path length.
    void buildDeepChain(int& fd, size_t& len) {
        fd = ::open(root.c_str(), O_RDONLY | O_DIRECTORY);
        ASSERT_GE(fd, 0);

        const std::string component(100, 'd');
        len = root.string().size();
        while (len + 1 + component.size() <= PATH_MAX - 110) {
            ASSERT_EQ(::mkdirat(fd, component.c_str(), 0755), 0);
            const int next = ::openat(fd, component.c_str(), O_RDONLY | O_DIRECTORY);
            ::close(fd);
            ASSERT_GE(next, 0);
            fd = next;
            deepChain.push_back(component);
            len += 1 + component.size();
        }
    }

    static void writeFileAt(const int dirFd, const std::string& name, const size_t bytes) {
        const int file = ::openat(dirFd, name.c_str(), O_CREAT | O_WRONLY, 0644);
        ASSERT_GE(file, 0);
        const std::string data(bytes, 'x');
        ASSERT_EQ(::write(file, data.data(), data.size()), static_cast<ssize_t>(data.size()));
        ::close(file);
    }

    // A file that lists fine but whose full path exceeds PATH_MAX, so any stat of it fails
    // with ENAMETOOLONG.
    void makeFileWithUnstatablePath(const size_t bytes) {
        int fd = -1;
        size_t len = 0;
        ASSERT_NO_FATAL_FAILURE(buildDeepChain(fd, len));

        deepFile = std::string(PATH_MAX - len, 'f');
        ASSERT_LE(deepFile.size(), 255u);
        ASSERT_NO_FATAL_FAILURE(writeFileAt(fd, deepFile, bytes));
        ::close(fd);
    }

    // Same trick for a directory: its parent lists it, but opening it by path fails with
    // ENAMETOOLONG. A file holding `bytes` is placed inside through the open descriptor.
    void makeDirectoryWithUnopenablePath(const size_t bytes) {
        int fd = -1;
        size_t len = 0;
        ASSERT_NO_FATAL_FAILURE(buildDeepChain(fd, len));

        const std::string name(PATH_MAX - len, 'e');
        ASSERT_LE(name.size(), 255u);
        ASSERT_EQ(::mkdirat(fd, name.c_str(), 0755), 0);
        const int inner = ::openat(fd, name.c_str(), O_RDONLY | O_DIRECTORY);
        ::close(fd);
        ASSERT_GE(inner, 0);
        deepChain.push_back(name);

        deepFile = "hidden.bin";
        ASSERT_NO_FATAL_FAILURE(writeFileAt(inner, deepFile, bytes));
        ::close(inner);
    }

    void removeDeepChain() {
        if (deepChain.empty()) return;

        std::vector<int> fds{::open(root.c_str(), O_RDONLY | O_DIRECTORY)};
        for (const auto& c : deepChain) fds.push_back(::openat(fds.back(), c.c_str(), O_RDONLY | O_DIRECTORY));

        if (!deepFile.empty()) ::unlinkat(fds.back(), deepFile.c_str(), 0);
        for (size_t i = deepChain.size(); i > 0; --i) {
            ::close(fds[i]);
            ::unlinkat(fds[i - 1], deepChain[i - 1].c_str(), AT_REMOVEDIR);
        }
        ::close(fds[0]);
        deepChain.clear();
    }
};

TEST_F(DirectorySizeTest, EmptyDirectoryIsZero) {
    EXPECT_EQ(getDirectorySize(root), 0u);
}

TEST_F(DirectorySizeTest, SumsFilesAtEveryDepth) {
    stdfs::create_directories(root / "a" / "b" / "c");
    stdfs::create_directories(root / "empty");
    writeFile(root / "top.bin", 10);
    writeFile(root / "a" / "one.bin", 200);
    writeFile(root / "a" / "b" / "two.bin", 3000);
    writeFile(root / "a" / "b" / "c" / "three.bin", 40000);

    EXPECT_EQ(getDirectorySize(root), 43210u);
    EXPECT_EQ(getDirectorySize(root / "a" / "b"), 43000u);
}

TEST_F(DirectorySizeTest, NonExistentPathIsZero) {
    EXPECT_EQ(getDirectorySize(root / "missing"), 0u);
}

TEST_F(DirectorySizeTest, RegularFileAsRootIsZero) {
    writeFile(root / "file.bin", 64);
    EXPECT_EQ(getDirectorySize(root / "file.bin"), 0u);
}

TEST_F(DirectorySizeTest, SymlinksAreNotFollowed) {
    stdfs::create_directories(root / "data");
    writeFile(root / "data" / "payload.bin", 100);
    stdfs::create_directory_symlink(root / "data", root / "data_link");
    stdfs::create_symlink(root / "data" / "payload.bin", root / "payload_link");
    // a link back to the root would loop forever if links were followed
    stdfs::create_directory_symlink(root, root / "data" / "loop");

    EXPECT_EQ(getDirectorySize(root), 100u);
}

TEST_F(DirectorySizeTest, SpecialFilesAreIgnored) {
    writeFile(root / "real.bin", 100);
    ASSERT_EQ(::mkfifo((root / "pipe").c_str(), 0644), 0);

    EXPECT_EQ(getDirectorySize(root), 100u);
}

TEST_F(DirectorySizeTest, UnstatableFileIsSkipped) {
    writeFile(root / "readable.bin", 100);
    makeFileWithUnstatablePath(50);

    EXPECT_EQ(getDirectorySize(root), 100u);
}

TEST_F(DirectorySizeTest, UnlistableSubdirectoryIsSkipped) {
    writeFile(root / "visible.bin", 100);
    makeDirectoryWithUnopenablePath(500);

    EXPECT_EQ(getDirectorySize(root), 100u);
}
