/**
 * @file test_log.cpp
 * @brief Tests for leveled logging
 */

#include <gtest/gtest.h>
#include "maxify/Errors.hpp"
#include "maxify/Log.hpp"

#include <regex>
#include <utility>
#include <vector>

using namespace maxify;

namespace {

/**
 * @brief Captures log output for the lifetime of a test
 */
class LogCapture : public ::testing::Test {
protected:
    void SetUp() override {
        previous_ = log_level();
        set_log_sink([this](LogLevel level, const std::string& message) {
            lines_.emplace_back(level, message);
        });
    }

    void TearDown() override {
        reset_log_sink();
        set_log_level(previous_);
    }

    std::vector<std::pair<LogLevel, std::string>> lines_;

private:
    LogLevel previous_ = LogLevel::Off;
};

} // anonymous namespace

TEST_F(LogCapture, FiltersBelowLevel) {
    set_log_level(LogLevel::Warn);
    log_debug("debug {}", 1);
    log_info("info {}", 2);
    log_warn("warn {}", 3);
    log_error("error {}", 4);

    ASSERT_EQ(lines_.size(), 2u);
    EXPECT_EQ(lines_[0].first, LogLevel::Warn);
    EXPECT_EQ(lines_[0].second, "warn 3");
    EXPECT_EQ(lines_[1].first, LogLevel::Error);
    EXPECT_EQ(lines_[1].second, "error 4");
}

TEST_F(LogCapture, DebugShowsEverything) {
    set_log_level(LogLevel::Debug);
    log_debug("a");
    log_info("b");
    EXPECT_EQ(lines_.size(), 2u);
}

TEST_F(LogCapture, OffSilencesEverything) {
    set_log_level(LogLevel::Off);
    log_error("nothing {}", "here");
    log_message(LogLevel::Off, "never");
    EXPECT_TRUE(lines_.empty());
}

TEST_F(LogCapture, FormatsArguments) {
    set_log_level(LogLevel::Info);
    log_info("Added metric '{}' to project '{}'", "Story Points", "org1/proj");
    ASSERT_EQ(lines_.size(), 1u);
    EXPECT_EQ(lines_[0].second, "Added metric 'Story Points' to project 'org1/proj'");
}

TEST(LogLevelParse, Names) {
    EXPECT_EQ(parse_log_level("debug"), LogLevel::Debug);
    EXPECT_EQ(parse_log_level("INFO"), LogLevel::Info);
    EXPECT_EQ(parse_log_level("warning"), LogLevel::Warn);
    EXPECT_EQ(parse_log_level(" error "), LogLevel::Error);
    EXPECT_EQ(parse_log_level("none"), LogLevel::Off);
    EXPECT_THROW(parse_log_level("verbose"), ConfigError);
}

TEST(LogLevelParse, NameRoundTrip) {
    for (LogLevel level : {LogLevel::Debug, LogLevel::Info, LogLevel::Warn,
                           LogLevel::Error, LogLevel::Off}) {
        EXPECT_EQ(parse_log_level(log_level_name(level)), level);
    }
}

TEST(LogLine, TimestampAndLevelPrefix) {
    const std::string line = format_log_line(LogLevel::Warn, "careful");
    std::regex pattern(R"(^\[\d{4}-\d{2}-\d{2} \d{2}:\d{2}:\d{2}\]\[WARN\] careful$)");
    EXPECT_TRUE(std::regex_match(line, pattern)) << line;
}
