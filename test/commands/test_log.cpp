#include <gtest/gtest.h>
#include <cstdint>
#include <filesystem>
#include "test_utils.hpp"
#include "cli/commands/LogCommand.hpp"

namespace fs = std::filesystem;

using namespace monosync;
using namespace monosync::test::utils;

class LogCommandTest : public ::testing::Test {
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

    void commit(const std::string& path, const std::string& content, const std::string& message) {
        createFile(tempDir, "input.txt", content);
        auto result = runCommand("commit", {"--write", path, "input.txt", "-m", message});
        ASSERT_TRUE(result) << result.error().describe();
    }

    static size_t count(const std::string& haystack, const std::string& needle) {
        size_t n = 0;
        for (size_t pos = haystack.find(needle); pos != std::string::npos; pos = haystack.find(needle, pos + 1)) ++n;
        return n;
    }

    fs::path tempDir;
    fs::path originalCwd;
};

// Test: Log before any commit
TEST_F(LogCommandTest, EmptyRepository) {
    std::string output;
    auto result = runCommand("log", {}, &output);
    ASSERT_TRUE(result) << result.error().describe();
    EXPECT_EQ(output, "`master does not have any commits yet`\n");
}

// Test: Small history, newest first, without globalrevs
TEST_F(LogCommandTest, SmallHistory) {
    commit("a", "1", "First commit");
    commit("b", "2", "Second commit\n\nWith a body");

    std::string output;
    ASSERT_TRUE(runCommand("log", {}, &output));
    EXPECT_EQ(count(output, "commit "), 2u);
    size_t second = output.find("    Second commit");
    size_t first = output.find("    First commit");
    ASSERT_NE(second, std::string::npos);
    ASSERT_NE(first, std::string::npos);
    EXPECT_LT(second, first);
    EXPECT_NE(output.find("    With a body"), std::string::npos);
    EXPECT_EQ(output.find("globalrev"), std::string::npos);
    EXPECT_NE(output.find("Date:   "), std::string::npos);
}

// Test: Large history shows globalrevs and the small commit each was synced from
TEST_F(LogCommandTest, LargeHistory) {
    commit("a", "1", "First commit");
    commit("b", "2", "Second commit");

    std::string output;
    ASSERT_TRUE(runCommand("log", {"-r", "large"}, &output));
    EXPECT_NE(output.find("(globalrev 2)"), std::string::npos);
    EXPECT_NE(output.find("(globalrev 1)"), std::string::npos);
    EXPECT_EQ(count(output, "Synced: repo 1 "), 2u);

    std::string limited;
    ASSERT_TRUE(runCommand("log", {"-r", "large", "-n", "1"}, &limited));
    EXPECT_EQ(count(limited, "commit "), 1u);
    EXPECT_NE(limited.find("(globalrev 2)"), std::string::npos);

    std::string byGlobalrev;
    ASSERT_TRUE(runCommand("log", {"-r", "large", "globalrev:1"}, &byGlobalrev));
    EXPECT_EQ(count(byGlobalrev, "commit "), 1u);
    EXPECT_NE(byGlobalrev.find("First commit"), std::string::npos);
}

// Test: Bad arguments
TEST_F(LogCommandTest, InvalidArguments) {
    EXPECT_EQ(runCommand("log", {"-n", "many"}).error().code, ErrorCode::InvalidArgs);
    EXPECT_EQ(runCommand("log", {"a", "b"}).error().code, ErrorCode::InvalidArgs);
    EXPECT_EQ(runCommand("log", {"nosuchbookmark"}).error().code, ErrorCode::NotFound);
}

// Test: Timezone offsets render as +HHMM, including offsets past 99 hours
TEST(LogTimezoneTest, FormatTimezone) {
    EXPECT_EQ(formatTimezone(0), "+0000");
    EXPECT_EQ(formatTimezone(19800), "+0530");
    EXPECT_EQ(formatTimezone(-28800), "-0800");
    EXPECT_EQ(formatTimezone(360000), "+10000");
    EXPECT_EQ(formatTimezone(INT32_MIN), "-59652314");
}
