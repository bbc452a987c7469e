#include <gtest/gtest.h>
#include "fs/UsageMonitor.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <filesystem>
#include <fstream>
#include <functional>
#include <string>
#include <vector>
#include <unistd.h>

namespace stdfs = std::filesystem;
using namespace ds::fs;
using namespace std::chrono_literals;

class UsageMonitorTest : public ::testing::Test {
protected:
    stdfs::path dir;
    boost::asio::io_context ioc;

    void SetUp() override {
        dir = stdfs::temp_directory_path() / ("downstash_monitor_" + std::to_string(::getpid()));
        stdfs::remove_all(dir);
        stdfs::create_directories(dir);
    }

    void TearDown() override { stdfs::remove_all(dir); }

    void appendChunk(const size_t bytes) const {
        std::ofstream out(dir / "download.part", std::ios::binary | std::ios::app);
        out << std::string(bytes, 'x');
    }
};

TEST(UsageSummary, FormatsUsedAndFree) {
    EXPECT_EQ(summary({"/downloads", 1536, 1610612736}), "1.5 KB used, 1.5 GB free");
    EXPECT_EQ(summary({"/downloads", 0, std::nullopt}), "0.0 B used, unknown free");
}

TEST_F(UsageMonitorTest, SampleReflectsDirectoryAndFilesystem) {
    appendChunk(300);
    const UsageMonitor monitor(ioc, dir, 10ms, nullptr);

    const auto usage = monitor.sample();
    EXPECT_EQ(usage.dir, dir);
    EXPECT_EQ(usage.used_bytes, 300u);
    EXPECT_TRUE(usage.available_bytes.has_value());
}

TEST_F(UsageMonitorTest, SampleOfMissingDirectoryDegrades) {
    const UsageMonitor monitor(ioc, dir / "gone", 10ms, nullptr);

    const auto usage = monitor.sample();
    EXPECT_EQ(usage.used_bytes, 0u);
    EXPECT_FALSE(usage.available_bytes.has_value());
}

TEST_F(UsageMonitorTest, BurstOfTouchesYieldsOneUpdateWithFinalSize) {
    std::vector<DiskUsage> updates;
    UsageMonitor monitor(ioc, dir, 30ms, [&](const DiskUsage& u) { updates.push_back(u); });

    boost::asio::steady_timer writer(ioc);
    int chunks = 0;
    std::function<void()> writeChunk = [&] {
        appendChunk(1024);
        monitor.touch();
        if (++chunks < 4) {
            writer.expires_after(5ms);
            writer.async_wait([&](const boost::system::error_code& ec) { if (!ec) writeChunk(); });
        }
    };
    writeChunk();
    ioc.run();

    ASSERT_EQ(updates.size(), 1u);
    EXPECT_EQ(updates.front().used_bytes, 4096u);
}
