#include <gtest/gtest.h>
#include <filesystem>
#include "test_utils.hpp"

namespace fs = std::filesystem;

using namespace monosync;
using namespace monosync::test::utils;

class BookmarksCommandTest : public ::testing::Test {
protected:
    void SetUp() override {
        tempDir = createTempDir();
        originalCwd = getCwd();
        setCwd(tempDir);
        initTestRepo(tempDir);
        createFile(tempDir, "f.txt", "f");
        auto result = runCommand("commit", {"--write", "f", "f.txt", "-m", "first"});
        ASSERT_TRUE(result) << result.error().describe();
    }

    void TearDown() override {
        setCwd(originalCwd);
        removeDir(tempDir);
    }

    fs::path tempDir;
    fs::path originalCwd;
};

// Test: Create, list and delete a small bookmark and its large mirror
TEST_F(BookmarksCommandTest, CreateListDelete) {
    std::string output;
    ASSERT_TRUE(runCommand("bookmarks", {"--create", "topic", "master"}, &output));
    EXPECT_EQ(output.rfind("created topic at ", 0), 0u);

    ASSERT_TRUE(runCommand("bookmarks", {}, &output));
    EXPECT_NE(output.find("  master\t"), std::string::npos);
    EXPECT_NE(output.find("  topic\t"), std::string::npos);

    ASSERT_TRUE(runCommand("bookmarks", {"-r", "large"}, &output));
    EXPECT_NE(output.find("  master\t"), std::string::npos);
    EXPECT_NE(output.find("  small/topic\t"), std::string::npos);

    ASSERT_TRUE(runCommand("bookmarks", {"to*"}, &output));
    EXPECT_EQ(output.find("master"), std::string::npos);
    EXPECT_NE(output.find("topic"), std::string::npos);

    ASSERT_TRUE(runCommand("bookmarks", {"--delete", "topic"}, &output));
    EXPECT_EQ(output, "deleted topic\n");
    ASSERT_TRUE(runCommand("bookmarks", {"-r", "large"}, &output));
    EXPECT_EQ(output.find("small/topic"), std::string::npos);
}

// Test: Both bookmark lists point at counterpart commits
TEST_F(BookmarksCommandTest, ListShowsIds) {
    std::string small;
    std::string large;
    ASSERT_TRUE(runCommand("bookmarks", {}, &small));
    ASSERT_TRUE(runCommand("bookmarks", {"-r", "large"}, &large));
    ASSERT_EQ(small.size(), large.size());
    EXPECT_NE(small, large);
}

// Test: Refused operations
TEST_F(BookmarksCommandTest, Errors) {
    EXPECT_EQ(runCommand("bookmarks", {"--create", "topic"}).error().code, ErrorCode::InvalidArgs);
    EXPECT_EQ(runCommand("bookmarks", {"-r", "large", "--create", "topic", "master"}).error().code,
              ErrorCode::InvalidArgs);
    EXPECT_EQ(runCommand("bookmarks", {"--create", "topic", "nope"}).error().code, ErrorCode::NotFound);
    EXPECT_EQ(runCommand("bookmarks", {"--delete", "nope"}).error().code, ErrorCode::NotFound);
    EXPECT_EQ(runCommand("bookmarks", {"-r", "large", "--delete", "nope"}).error().code, ErrorCode::NotFound);
    EXPECT_EQ(runCommand("bookmarks", {"a*", "b*"}).error().code, ErrorCode::InvalidArgs);
}

// Test: Large-only bookmarks are deleted directly
TEST_F(BookmarksCommandTest, DeleteLargeBookmark) {
    std::string output;
    ASSERT_TRUE(runCommand("commit", {"-r", "large", "-b", "release", "--write", "VERSION", "f.txt", "-m", "release"}));
    ASSERT_TRUE(runCommand("bookmarks", {"-r", "large", "--delete", "release"}, &output));
    EXPECT_EQ(output, "deleted release\n");
}
