#include <gtest/gtest.h>
#include <filesystem>
#include "test_utils.hpp"
#include "sync/SyncContext.hpp"

namespace fs = std::filesystem;

using namespace monosync;
using namespace monosync::test::utils;

class CommitCommandTest : public ::testing::Test {
protected:
    void SetUp() override {
        tempDir = createTempDir();
        originalCwd = getCwd();
        setCwd(tempDir);
        initTestRepo(tempDir);
    }

    void TearDown() override {
        setCwd(originalCwd);
        removeDir(tempDir);
    }

    std::unique_ptr<SyncContext> open() {
        auto pair = SyncContext::openOnDisk(tempDir);
        if (!pair) throw std::runtime_error(pair.error().describe());
        return std::move(pair.value());
    }

    fs::path tempDir;
    fs::path originalCwd;
};

// Test: Commits to the small repository land in the large one under the prefix
TEST_F(CommitCommandTest, CommitToSmall) {
    createFile(tempDir, "hello.txt", "hello world");
    std::string output;
    auto result = runCommand("commit", {"--write", "docs/hello.txt", "hello.txt", "-m", "Add hello", "-m", "Body"},
                             &output);
    ASSERT_TRUE(result) << result.error().describe();
    EXPECT_EQ(output.rfind("[master ", 0), 0u) << output;
    EXPECT_NE(output.find("] Add hello\n"), std::string::npos);
    EXPECT_NE(output.find("  large master -> "), std::string::npos);
    EXPECT_NE(output.find("(globalrev 1)"), std::string::npos);

    auto pair = open();
    auto smallHead = pair->small().bookmark("master").value();
    auto largeHead = pair->large().bookmark("master").value();
    ASSERT_TRUE(smallHead);
    ASSERT_TRUE(largeHead);
    EXPECT_EQ(pair->mapping().getLarge(1, 0, 1, *smallHead), largeHead);

    auto cs = pair->small().changesets().get(*smallHead);
    ASSERT_TRUE(cs);
    EXPECT_EQ(cs.value().message, "Add hello\n\nBody");

    auto manifest = pair->large().manifests().manifestFor(*largeHead);
    ASSERT_TRUE(manifest);
    ASSERT_EQ(manifest.value().count("small/docs/hello.txt"), 1u);
    auto content = pair->large().changesets().getContent(manifest.value().at("small/docs/hello.txt").contentId);
    EXPECT_EQ(content.value(), "hello world");
}

// Test: Commits straight to the large repository are numbered too
TEST_F(CommitCommandTest, CommitToLarge) {
    createFile(tempDir, "tool.sh", "#!/bin/sh\n");
    std::string output;
    auto result = runCommand("commit", {"-r", "large", "--write", "tools/tool.sh", "tool.sh", "-m", "Add tool",
                                        "--author", "Build Bot <bot@example.com>"},
                             &output);
    ASSERT_TRUE(result) << result.error().describe();
    EXPECT_NE(output.find("] Add tool"), std::string::npos);

    auto pair = open();
    auto head = pair->large().bookmark("master").value();
    ASSERT_TRUE(head);
    EXPECT_EQ(pair->large().globalrevs().get(*head), std::optional<uint64_t>(1));
    EXPECT_EQ(pair->large().changesets().get(*head).value().author, "Build Bot <bot@example.com>");
    EXPECT_FALSE(pair->small().bookmark("master").value());
}

// Test: Moves and copies read the source from the bookmark's current commit
TEST_F(CommitCommandTest, MoveAndCopy) {
    createFile(tempDir, "a.txt", "alpha");
    ASSERT_TRUE(runCommand("commit", {"--write", "a", "a.txt", "-m", "base"}));
    auto moved = runCommand("commit", {"--move", "a", "b", "--copy", "a", "c", "-m", "shuffle"});
    ASSERT_TRUE(moved) << moved.error().describe();

    auto pair = open();
    auto head = pair->small().bookmark("master").value();
    ASSERT_TRUE(head);
    auto manifest = pair->small().manifests().manifestFor(*head);
    ASSERT_TRUE(manifest);
    EXPECT_EQ(manifest.value().count("a"), 0u);
    EXPECT_EQ(manifest.value().count("b"), 1u);
    EXPECT_EQ(manifest.value().count("c"), 1u);
    auto cs = pair->small().changesets().get(*head);
    ASSERT_TRUE(cs.value().fileChanges.at("b").copyFrom);
    EXPECT_EQ(cs.value().fileChanges.at("b").copyFrom->path, "a");

    auto missing = runCommand("commit", {"--copy", "nope", "d", "-m", "bad"});
    ASSERT_FALSE(missing);
    EXPECT_EQ(missing.error().code, ErrorCode::NotFound);
}

// Test: A deletion on a named bookmark creates it under the prefix in the large repository
TEST_F(CommitCommandTest, CommitToOtherBookmark) {
    createFile(tempDir, "f.txt", "f");
    ASSERT_TRUE(runCommand("commit", {"-b", "feature", "--write", "f", "f.txt", "-m", "feature"}));
    ASSERT_TRUE(runCommand("commit", {"-b", "feature", "--delete", "f", "-m", "drop f"}));

    auto pair = open();
    auto largeHead = pair->large().bookmark("small/feature").value();
    ASSERT_TRUE(largeHead);
    EXPECT_FALSE(pair->large().bookmark("master").value());
    auto manifest = pair->large().manifests().manifestFor(*largeHead);
    ASSERT_TRUE(manifest);
    EXPECT_TRUE(manifest.value().empty());
}

// Test: Argument errors
TEST_F(CommitCommandTest, InvalidArguments) {
    createFile(tempDir, "x.txt", "x");
    EXPECT_EQ(runCommand("commit", {"--write", "x", "x.txt"}).error().code, ErrorCode::InvalidArgs);
    EXPECT_EQ(runCommand("commit", {"-m", "nothing"}).error().code, ErrorCode::InvalidArgs);
    EXPECT_EQ(runCommand("commit", {"-m", "x", "--write", "x"}).error().code, ErrorCode::InvalidArgs);
    EXPECT_EQ(runCommand("commit", {"-m", "x", "stray"}).error().code, ErrorCode::InvalidArgs);
    EXPECT_EQ(runCommand("commit", {"-r", "nope", "-m", "x", "--write", "x", "x.txt"}).error().code,
              ErrorCode::InvalidArgs);
    EXPECT_EQ(runCommand("commit", {"-m", "x", "--write", "x", "missing.txt"}).error().code, ErrorCode::IoError);
}

// Test: Commands outside a repository pair fail
TEST(CommitOutsideRepositoryTest, NotARepository) {
    fs::path dir = createTempDir();
    fs::path cwd = getCwd();
    setCwd(dir);
    auto result = runCommand("commit", {"-m", "x", "--delete", "y"});
    setCwd(cwd);
    removeDir(dir);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, ErrorCode::NotARepository);
}
