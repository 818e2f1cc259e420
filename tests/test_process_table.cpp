#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "../src/collectors/ProcProcessTable.h"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <unistd.h>

namespace fs = std::filesystem;

namespace sockreap {

class ProcProcessTableTest : public ::testing::Test {
protected:
    void SetUp() override {
        char tmpl[] = "/tmp/sockreap_proctable_XXXXXX";
        ASSERT_NE(mkdtemp(tmpl), nullptr);
        root = tmpl;
    }

    void TearDown() override {
        fs::remove_all(root);
    }

    void process(int pid, const std::string& comm, char state, std::optional<int> uid = std::nullopt, bool with_comm = true) {
        fs::path dir = root / std::to_string(pid);
        fs::create_directories(dir);
        if (with_comm) std::ofstream(dir / "comm") << comm << "\n";
        std::ofstream(dir / "stat") << pid << " (" << comm << ") " << state << " 1 " << pid << " " << pid << " 0 -1 4194560\n";
        if (uid) std::ofstream(dir / "status") << "Name:\t" << comm << "\nState:\t" << state << "\nUid:\t" << *uid << "\t" << *uid << "\t" << *uid << "\t" << *uid << "\n";
    }

    fs::path root;
};

TEST_F(ProcProcessTableTest, LookupReadsCommAndUid) {
    process(1234, "nginx", 'S', 33);
    ProcProcessTable table(root.string());
    auto ident = table.lookup(1234);
    ASSERT_TRUE(ident.has_value());
    EXPECT_EQ(ident->name, "nginx");
    EXPECT_EQ(ident->uid, std::optional<std::uint32_t>(33));
}

TEST_F(ProcProcessTableTest, LookupFallsBackToStatComm) {
    process(77, "tricky) name", 'R', std::nullopt, false);
    ProcProcessTable table(root.string());
    auto ident = table.lookup(77);
    ASSERT_TRUE(ident.has_value());
    EXPECT_EQ(ident->name, "tricky) name");
    EXPECT_FALSE(ident->uid.has_value());
}

TEST_F(ProcProcessTableTest, LookupMissingProcess) {
    ProcProcessTable table(root.string());
    EXPECT_FALSE(table.lookup(4242).has_value());
    EXPECT_FALSE(table.lookup(0).has_value());
    EXPECT_FALSE(table.lookup(-1).has_value());
}

TEST_F(ProcProcessTableTest, ZombiesDoNotExist) {
    process(10, "alive", 'S');
    process(11, "zombie", 'Z');
    process(12, "dead", 'X');
    ProcProcessTable table(root.string());
    EXPECT_TRUE(table.exists(10));
    EXPECT_FALSE(table.exists(11));
    EXPECT_FALSE(table.exists(12));
    EXPECT_FALSE(table.exists(13));
    EXPECT_EQ(table.state(11), 'Z');
    EXPECT_EQ(table.state(13), '\0');
}

TEST_F(ProcProcessTableTest, LiveProcSeesThisProcess) {
    ProcProcessTable table;
    EXPECT_TRUE(table.exists(static_cast<int>(::getpid())));
    auto ident = table.lookup(static_cast<int>(::getpid()));
    ASSERT_TRUE(ident.has_value());
    EXPECT_FALSE(ident->name.empty());
}

TEST_F(ProcProcessTableTest, LookupReadsExecutableName) {
    process(50, "systemd-resolve", 'S', 101);
    fs::create_symlink("/usr/lib/systemd/systemd-resolved (deleted)", root / "50" / "exe");
    process(51, "worker", 'S', 0);
    {
        std::ofstream cmd(root / "51" / "cmdline", std::ios::binary);
        cmd << "/usr/sbin/haproxy";
        cmd.put('\0');
        cmd << "-f";
        cmd.put('\0');
    }
    process(52, "bare", 'S', 0);
    ProcProcessTable table(root.string());
    EXPECT_EQ(table.lookup(50)->exe_name, "systemd-resolved");
    EXPECT_EQ(table.lookup(51)->exe_name, "haproxy");
    EXPECT_EQ(table.lookup(52)->exe_name, "");
}

TEST(ExeBasenameTest, StripsDirectoryAndDeletedSuffix) {
    EXPECT_EQ(exe_basename("/usr/bin/python3"), "python3");
    EXPECT_EQ(exe_basename("/opt/app (deleted)"), "app");
    EXPECT_EQ(exe_basename("nginx"), "nginx");
}

TEST(SplitStatLineTest, HandlesParenthesesInName) {
    std::string comm, rest;
    ASSERT_TRUE(split_stat_line("42 (a (b) c) S 1 2 3", comm, rest));
    EXPECT_EQ(comm, "a (b) c");
    EXPECT_EQ(rest, "S 1 2 3");
    EXPECT_FALSE(split_stat_line("42 no parens", comm, rest));
    ASSERT_TRUE(split_stat_line("42 (x)", comm, rest));
    EXPECT_EQ(comm, "x");
    EXPECT_EQ(rest, "");
}

}
