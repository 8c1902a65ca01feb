// =============================================================================
// Logging Tests
// =============================================================================

#include <gtest/gtest.h>
#include "lineage/logging.hpp"
#include "lineage/thread_pool.hpp"

#include <algorithm>
#include <sstream>
#include <string>

using namespace lineage;

class LoggingTest : public ::testing::Test {
protected:
    void SetUp() override {
        set_log_output(out_);
        set_log_level(LogLevel::DEBUG);
    }

    void TearDown() override {
        set_log_output(std::cerr);
        set_log_level(LogLevel::INFO);
    }

    size_t line_count() const {
        std::string text = out_.str();
        return static_cast<size_t>(std::count(text.begin(), text.end(), '\n'));
    }

    std::ostringstream out_;
};

TEST_F(LoggingTest, LineCarriesLevelLocationAndMessage) {
    LOG_WARN("Cycle detected at '", "db.a", "', depth ", 3);

    std::string text = out_.str();
    ASSERT_EQ(line_count(), 1u);
    EXPECT_EQ(text.front(), '[');
    EXPECT_NE(text.find("] WARN test_logging.cpp:"), std::string::npos);
    EXPECT_NE(text.find("() - Cycle detected at 'db.a', depth 3\n"), std::string::npos);
}

TEST_F(LoggingTest, BelowThresholdIsDropped) {
    set_log_level(LogLevel::WARN);
    LOG_DEBUG("hidden");
    LOG_INFO("hidden");
    LOG_ERROR("shown");

    EXPECT_EQ(line_count(), 1u);
    EXPECT_EQ(out_.str().find("hidden"), std::string::npos);
}

TEST_F(LoggingTest, OffSilencesEverything) {
    set_log_level(LogLevel::OFF);
    LOG_ERROR("nothing");
    EXPECT_TRUE(out_.str().empty());
    EXPECT_FALSE(Logger::getInstance().enabled(LogLevel::ERROR));
}

TEST_F(LoggingTest, ParseLevelNames) {
    EXPECT_TRUE(parse_log_level("DEBUG") == LogLevel::DEBUG);
    EXPECT_TRUE(parse_log_level("Warning") == LogLevel::WARN);
    EXPECT_TRUE(parse_log_level("warn") == LogLevel::WARN);
    EXPECT_TRUE(parse_log_level("off") == LogLevel::OFF);
    EXPECT_FALSE(parse_log_level("chatty").has_value());
    EXPECT_STREQ(log_level_name(LogLevel::ERROR), "ERROR");
}

TEST_F(LoggingTest, ParallelLinesStayWhole) {
    set_log_level(LogLevel::INFO);
    {
        ThreadPool pool(4);
        pool.parallel_for(0, 200, [](size_t i) { LOG_INFO("worker line ", i); });
    }

    ASSERT_EQ(line_count(), 200u);
    std::istringstream lines(out_.str());
    std::string line;
    while (std::getline(lines, line)) {
        EXPECT_EQ(line.front(), '[') << line;
        EXPECT_NE(line.find("() - worker line "), std::string::npos) << line;
    }
}
