#include "utils/logging.hpp"

#include <iostream>
#include <sstream>

#include <gtest/gtest.h>

using sandkeep::utils::LogLevel;

namespace {

// Captures std::cerr and restores the minimum level afterwards.
class LoggingTest : public ::testing::Test {
protected:
    LoggingTest()
        : saved_level_(sandkeep::utils::MinLogLevel())
        , saved_buf_(std::cerr.rdbuf(captured_.rdbuf())) {}

    ~LoggingTest() override {
        std::cerr.rdbuf(saved_buf_);
        sandkeep::utils::SetMinLogLevel(saved_level_);
    }

    std::ostringstream captured_;
    LogLevel saved_level_;
    std::streambuf* saved_buf_;
};

}  // namespace

TEST(logging, parse_level_is_case_insensitive_with_fallback) {
    EXPECT_EQ(sandkeep::utils::ParseLogLevel("DEBUG"), LogLevel::kDebug);
    EXPECT_EQ(sandkeep::utils::ParseLogLevel(" warning "), LogLevel::kWarn);
    EXPECT_EQ(sandkeep::utils::ParseLogLevel("error"), LogLevel::kError);
    EXPECT_EQ(sandkeep::utils::ParseLogLevel("chatty"), LogLevel::kInfo);
    EXPECT_EQ(sandkeep::utils::ParseLogLevel("chatty", LogLevel::kWarn), LogLevel::kWarn);
}

TEST_F(LoggingTest, lines_are_tagged_and_filtered_by_level) {
    sandkeep::utils::SetMinLogLevel(LogLevel::kInfo);
    EXPECT_EQ(sandkeep::utils::MinLogLevel(), LogLevel::kInfo);

    sandkeep::utils::LogDebug("session", "hidden");
    sandkeep::utils::LogInfo("session", "created sandbox for 42");
    sandkeep::utils::LogWarn("sandbox", "rm -f failed");
    EXPECT_EQ(captured_.str(), "[session] created sandbox for 42\n[sandbox] WARN: rm -f failed\n");
}
