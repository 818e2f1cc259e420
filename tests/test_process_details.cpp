#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "../src/collectors/ProcessDetails.h"
#include "../src/core/Errors.h"
#include "../src/core/JsonUtil.h"
#include "../src/core/Logging.h"
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <unistd.h>

namespace fs = std::filesystem;

namespace sockreap {

TEST(FormatDurationTest, Units) {
    EXPECT_EQ(format_duration(0), "0s");
    EXPECT_EQ(format_duration(5), "5s");
    EXPECT_EQ(format_duration(60), "1m 0s");
    EXPECT_EQ(format_duration(125), "2m 5s");
    EXPECT_EQ(format_duration(10925), "3h 2m 5s");
    EXPECT_EQ(format_duration(3600), "1h 0m 0s");
    EXPECT_EQ(format_duration(97325), "1d 3h 2m 5s");
    EXPECT_EQ(format_duration(86400), "1d 0h 0m 0s");
}

class ProcessDetailsTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::instance().set_level(LogLevel::Error);
        char tmpl[] = "/tmp/sockreap_details_XXXXXX";
        ASSERT_NE(mkdtemp(tmpl), nullptr);
        root = tmpl;
        hz = sysconf(_SC_CLK_TCK);
        ASSERT_GT(hz, 0);

        fs::path dir = root / "42";
        fs::create_directories(dir);
        // starttime 1000 ticks, utime 250, stime 50, 3 threads, rss 512 pages
        std::ofstream(dir / "stat") << "42 (python3) S 1 42 42 0 -1 4194560 100 0 0 0 250 50 0 0 20 0 3 0 1000 123456 512 18446744073709551615\n";
        std::ofstream(dir / "comm") << "python3\n";
        std::ofstream(dir / "status") << "Name:\tpython3\nUid:\t0\t0\t0\t0\n";
        std::string cmd("python3\0-m\0http.server\0", 23);
        std::ofstream(dir / "cmdline") << cmd;
        fs::create_symlink("/usr/bin/python3", dir / "exe");

        start_secs = 1000.0 / hz;
        std::ofstream(root / "stat") << "cpu  1 2 3 4\nbtime 1700000000\nprocesses 99\n";
        std::ofstream(root / "uptime") << std::to_string(start_secs + 125.0) << " 10.00\n";
    }

    void TearDown() override {
        fs::remove_all(root);
    }

    fs::path root;
    long hz = 0;
    double start_secs = 0;
};

TEST_F(ProcessDetailsTest, ReadsStatFields) {
    auto d = describe_process(42, root.string());
    EXPECT_EQ(d.pid, 42);
    EXPECT_EQ(d.ppid, 1);
    EXPECT_EQ(d.name, "python3");
    EXPECT_EQ(d.state, 'S');
    EXPECT_EQ(d.threads, 3);
    EXPECT_EQ(d.rss_bytes, 512u * static_cast<std::uint64_t>(sysconf(_SC_PAGESIZE)));
    EXPECT_EQ(d.cmdline, "python3 -m http.server");
    EXPECT_EQ(d.exe, "/usr/bin/python3");
    EXPECT_EQ(d.uid, std::optional<std::uint32_t>(0));
    EXPECT_TRUE(d.exe_sha256.empty());
}

TEST_F(ProcessDetailsTest, TimesFromBootAndUptime) {
    auto d = describe_process(42, root.string());
    EXPECT_EQ(d.run_time_seconds, 125u);
    EXPECT_EQ(format_duration(d.run_time_seconds), "2m 5s");
    ASSERT_TRUE(d.start_time.has_value());
    auto expected = std::chrono::system_clock::time_point(
        std::chrono::seconds(1700000000LL + static_cast<long long>(start_secs)));
    EXPECT_EQ(jsonutil::time_to_iso(*d.start_time), jsonutil::time_to_iso(expected));
    double cpu = 100.0 * 300.0 / hz / 125.0;
    EXPECT_NEAR(d.cpu_percent, cpu, 0.5);
}

TEST_F(ProcessDetailsTest, MissingProcessIsNotFound) {
    try {
        describe_process(99999, root.string());
        FAIL() << "expected Error";
    } catch (const Error& e) {
        EXPECT_EQ(e.kind(), ErrorKind::NotFound);
    }
    EXPECT_THROW(describe_process(0, root.string()), Error);
}

TEST_F(ProcessDetailsTest, HashOfRegularFile) {
    fs::path f = root / "payload";
    std::ofstream(f) << "abc";
    std::string h = sha256_file(f.string());
#ifdef SOCKREAP_HAVE_OPENSSL
    EXPECT_EQ(h, "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
#else
    EXPECT_TRUE(h.empty());
#endif
    EXPECT_TRUE(sha256_file((root / "missing").string()).empty());
}

}
