#include <gtest/gtest.h>
#include <filesystem>
#include "test_utils.hpp"
#include "sync/SyncContext.hpp"

namespace fs = std::filesystem;

using namespace monosync;
using namespace monosync::test::utils;

class SyncCommandTest : public ::testing::Test {
protected:
    void SetUp() override {
        tempDir = createTempDir();
        originalCwd = getCwd();
        setCwd(tempDir);
        initTestRepo(tempDir);
        createFile(tempDir, "input.txt", "data");
    }

    void TearDown() override {
        setCwd(originalCwd);
        removeDir(tempDir);
    }

    fs::path tempDir;
    fs::path originalCwd;
};

// Test: Large commits are synced to the small repository, skipping out-of-scope ones
TEST_F(SyncCommandTest, LargeToSmall) {
    ASSERT_TRUE(runCommand("commit", {"-r", "large", "--write", "small/a", "input.txt", "-m", "in scope"}));
    ASSERT_TRUE(runCommand("commit", {"-r", "large", "--write", "tools/b", "input.txt", "-m", "outside"}));
    ASSERT_TRUE(runCommand("commit", {"-r", "large", "--write", "small/c", "input.txt", "-m", "in scope too"}));

    std::string output;
    auto result = runCommand("sync", {"--to-small", "master"}, &output);
    ASSERT_TRUE(result) << result.error().describe();
    EXPECT_NE(output.find("2 synced, 1 skipped\n"), std::string::npos) << output;
    EXPECT_NE(output.find("large "), std::string::npos);

    auto pair = SyncContext::openOnDisk(tempDir);
    ASSERT_TRUE(pair);
    auto largeHead = pair.value()->large().bookmark("master").value();
    auto smallCounterpart = pair.value()->mapping().getSmall(1, 0, 1, *largeHead);
    ASSERT_TRUE(smallCounterpart);
    EXPECT_NE(output.find(largeHead->hex() + " -> " + smallCounterpart->hex() + "\n"), std::string::npos);

    std::string again;
    ASSERT_TRUE(runCommand("sync", {"--to-small", "master"}, &again));
    EXPECT_NE(again.find("0 synced, 0 skipped\n"), std::string::npos);
}

// Test: A large commit with nothing in scope has no counterpart
TEST_F(SyncCommandTest, NoCounterpart) {
    ASSERT_TRUE(runCommand("commit", {"-r", "large", "--write", "docs/readme", "input.txt", "-m", "docs"}));
    std::string output;
    ASSERT_TRUE(runCommand("sync", {"--to-small", "1"}, &output));
    EXPECT_NE(output.find("has no counterpart in small\n"), std::string::npos);
}

// Test: Small commits can be synced without publishing them
TEST_F(SyncCommandTest, SmallToLarge) {
    auto pair = SyncContext::openOnDisk(tempDir);
    ASSERT_TRUE(pair);
    ChangesetId local = commitFiles(pair.value()->small(), {}, {{"x", "x"}}, "local");
    pair.value().reset();

    std::string output;
    ASSERT_TRUE(runCommand("sync", {local.hex()}, &output));
    EXPECT_NE(output.find("small " + local.shortHex() + " -> large "), std::string::npos);
    EXPECT_NE(output.find("1 synced, 0 skipped\n"), std::string::npos);

    auto reopened = SyncContext::openOnDisk(tempDir);
    ASSERT_TRUE(reopened);
    EXPECT_TRUE(reopened.value()->mapping().getLarge(1, 0, 1, local));
    EXPECT_FALSE(reopened.value()->large().bookmark("master").value());
}

// Test: Recovery reports how many mappings it re-derived
TEST_F(SyncCommandTest, Recover) {
    ASSERT_TRUE(runCommand("commit", {"--write", "a", "input.txt", "-m", "pushed"}));
    std::string output;
    ASSERT_TRUE(runCommand("sync", {"--recover", "master"}, &output));
    EXPECT_EQ(output, "recovered 0 mapping(s) from large/master\n");

    EXPECT_EQ(runCommand("sync", {"--recover", "master", "extra"}).error().code, ErrorCode::InvalidArgs);
    EXPECT_EQ(runCommand("sync", {"--to-large", "--to-small", "x"}).error().code, ErrorCode::InvalidArgs);
    EXPECT_EQ(runCommand("sync", {}).error().code, ErrorCode::InvalidArgs);
}

// Test: Help lists every command and describes one in detail
TEST_F(SyncCommandTest, Help) {
    std::string overview;
    ASSERT_TRUE(runCommand("help", {}, &overview));
    for (const char* name : {"init", "commit", "sync", "lookup", "diff", "bookmarks", "log", "check"}) {
        EXPECT_NE(overview.find(std::string("\n  ") + name + " "), std::string::npos) << name;
    }

    std::string detail;
    ASSERT_TRUE(runCommand("help", {"sync"}, &detail));
    EXPECT_NE(detail.find("SYNOPSIS:"), std::string::npos);
    EXPECT_NE(detail.find("--to-small"), std::string::npos);

    EXPECT_EQ(runCommand("help", {"frobnicate"}).error().code, ErrorCode::InvalidArgs);
    EXPECT_EQ(runCommand("frobnicate", {}).error().code, ErrorCode::InvalidArgs);
}
