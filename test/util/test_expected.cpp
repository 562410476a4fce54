#include <gtest/gtest.h>
#include <string>
#include "util/Expected.hpp"
#include "util/Logger.hpp"

using namespace monosync;

namespace {

Expected<int> half(int v) {
    if (v % 2) return Error{ErrorCode::InvalidArgs, "odd", {std::to_string(v)}};
    return v / 2;
}

}

// Test: Value and error paths
TEST(ExpectedTest, ValueOrError) {
    auto ok = half(4);
    ASSERT_TRUE(ok);
    EXPECT_EQ(ok.value(), 2);

    auto bad = half(3);
    ASSERT_FALSE(bad);
    EXPECT_EQ(bad.error().code, ErrorCode::InvalidArgs);
}

// Test: describe() names the code and lists details
TEST(ExpectedTest, DescribeIncludesDetails) {
    Error err{ErrorCode::RebaseConflict, "pushed commits conflict with master", {"small/a", "small/b"}};
    EXPECT_EQ(err.describe(), "rebase-conflict: pushed commits conflict with master\n  small/a\n  small/b");
    EXPECT_STREQ(errorCodeName(ErrorCode::MappingConflict), "mapping-conflict");
    EXPECT_STREQ(errorCodeName(ErrorCode::TooManyRetries), "too-many-retries");
    EXPECT_STREQ(errorCodeName(ErrorCode::HookRejected), "hook-rejected");
}

// Test: Log level names and numbers
TEST(LoggerTest, ParseLogLevel) {
    EXPECT_EQ(parseLogLevel("debug"), LogLevel::Debug);
    EXPECT_EQ(parseLogLevel("2"), LogLevel::Info);
    EXPECT_EQ(parseLogLevel("warn"), LogLevel::Warn);
    EXPECT_EQ(parseLogLevel("error"), LogLevel::Error);
    EXPECT_FALSE(parseLogLevel("loud").has_value());
}

// Test: Enabled levels follow the threshold
TEST(LoggerTest, LevelThreshold) {
    Logger& log = Logger::instance();
    LogLevel saved = log.level();
    log.setLevel(LogLevel::Info);
    EXPECT_TRUE(log.enabled(LogLevel::Warn));
    EXPECT_TRUE(log.enabled(LogLevel::Info));
    EXPECT_FALSE(log.enabled(LogLevel::Debug));
    log.setLevel(saved);
}
