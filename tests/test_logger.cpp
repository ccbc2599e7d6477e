/**
 * @file test_logger.cpp
 * @brief Тесты логгера
 */

#include <gtest/gtest.h>

#include "log/logger.hpp"

#include <string>
#include <vector>

namespace kasfaucet::tests {

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto& logger = log::Logger::instance();
        previous_level_ = logger.level();
        logger.set_sink([this](log::Level level, std::string_view line) {
            lines_.emplace_back(level, std::string(line));
        });
    }

    void TearDown() override {
        auto& logger = log::Logger::instance();
        logger.set_sink({});
        logger.set_level(previous_level_);
    }

    log::Level previous_level_{log::Level::Info};
    std::vector<std::pair<log::Level, std::string>> lines_;
};

/**
 * @brief Тест: формат "[время] [УРОВЕНЬ] [Компонент] сообщение"
 */
TEST_F(LoggerTest, FormatsLine) {
    log::Logger::instance().set_level(log::Level::Info);

    log::info("Orchestrator", "claim accepted");

    ASSERT_EQ(lines_.size(), 1u);
    EXPECT_EQ(lines_[0].first, log::Level::Info);
    const auto& line = lines_[0].second;
    EXPECT_EQ(line.front(), '[');
    EXPECT_NE(line.find("] [INFO] [Orchestrator] claim accepted"), std::string::npos);
}

TEST_F(LoggerTest, FiltersByLevel) {
    auto& logger = log::Logger::instance();
    logger.set_level(log::Level::Warn);

    log::debug("Test", "hidden");
    log::info("Test", "hidden");
    log::warn("Test", "shown");
    log::error("Test", "shown");

    ASSERT_EQ(lines_.size(), 2u);
    EXPECT_EQ(lines_[0].first, log::Level::Warn);
    EXPECT_EQ(lines_[1].first, log::Level::Error);
    EXPECT_FALSE(logger.enabled(log::Level::Info));
    EXPECT_TRUE(logger.enabled(log::Level::Error));
}

TEST_F(LoggerTest, DebugEnablesEverything) {
    log::Logger::instance().set_level(log::Level::Debug);

    log::debug("Test", "details");

    ASSERT_EQ(lines_.size(), 1u);
    EXPECT_NE(lines_[0].second.find("[DEBUG]"), std::string::npos);
}

TEST(LogLevelTest, Parse) {
    EXPECT_EQ(log::parse_level("error"), log::Level::Error);
    EXPECT_EQ(log::parse_level("warn"), log::Level::Warn);
    EXPECT_EQ(log::parse_level("warning"), log::Level::Warn);
    EXPECT_EQ(log::parse_level("info"), log::Level::Info);
    EXPECT_EQ(log::parse_level("debug"), log::Level::Debug);
    EXPECT_FALSE(log::parse_level("trace").has_value());
    EXPECT_FALSE(log::parse_level("INFO").has_value());
}

TEST(LogLevelTest, Names) {
    EXPECT_EQ(log::to_string(log::Level::Error), "ERROR");
    EXPECT_EQ(log::to_string(log::Level::Warn), "WARN");
    EXPECT_EQ(log::to_string(log::Level::Info), "INFO");
    EXPECT_EQ(log::to_string(log::Level::Debug), "DEBUG");
}

} // namespace kasfaucet::tests
