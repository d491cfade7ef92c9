#include <string>
#include <gtest/gtest.h>
#include "core/config/ids.hpp"
#include "core/logging/logger.hpp"

namespace {

using helm::core::logging::Logger;
using helm::core::logging::LogLevel;

// Restores the process-wide logger state the other tests rely on.
class LoggerTest : public ::testing::Test {
protected:
    void TearDown() override {
        Logger::get().set_min_level(LogLevel::WARN);
        Logger::get().set_correlation_id("");
    }
};

TEST_F(LoggerTest, DropsMessagesBelowTheThreshold) {
    Logger::get().set_min_level(LogLevel::WARN);
    ::testing::internal::CaptureStderr();
    HELM_LOG_INFO("quiet");
    HELM_LOG_WARN("loud");
    const std::string output = ::testing::internal::GetCapturedStderr();

    EXPECT_EQ(output.find("quiet"), std::string::npos);
    EXPECT_NE(output.find("loud"), std::string::npos);
}

TEST_F(LoggerTest, PrefixesTheCorrelationId) {
    Logger::get().set_min_level(LogLevel::DEBUG);
    Logger::get().set_correlation_id("turn-abc");
    ::testing::internal::CaptureStderr();
    HELM_LOG_DEBUG("step");
    const std::string output = ::testing::internal::GetCapturedStderr();

    EXPECT_NE(output.find("[turn-abc] step"), std::string::npos);
}

TEST_F(LoggerTest, ParsesLevelNames) {
    LogLevel level = LogLevel::WARN;
    EXPECT_TRUE(Logger::parse_level("debug", level));
    EXPECT_EQ(level, LogLevel::DEBUG);
    EXPECT_TRUE(Logger::parse_level("error", level));
    EXPECT_EQ(level, LogLevel::ERROR);
    EXPECT_FALSE(Logger::parse_level("loud", level));
    EXPECT_EQ(level, LogLevel::ERROR);
}

TEST(IdsTest, GeneratedIdsArePrefixedHex) {
    const std::string id = helm::core::config::generate_turn_id();
    ASSERT_EQ(id.size(), 13u);
    EXPECT_EQ(id.rfind("turn-", 0), 0u);
    EXPECT_EQ(id.find_first_not_of("0123456789abcdef", 5), std::string::npos);
    EXPECT_NE(helm::core::config::generate_id("call"), helm::core::config::generate_id("call"));
}

}  // namespace
