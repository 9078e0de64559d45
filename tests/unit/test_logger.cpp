/**
 * @file test_logger.cpp
 * @brief Unit tests for the logging framework
 */

#include <gtest/gtest.h>
#include <ubnt/utils/logger.hpp>

#include <algorithm>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace ubnt::utils;

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::instance().setLevel(LogLevel::TRACE);
        Logger::instance().setColorEnabled(false);
        Logger::instance().setOutput(&output_);
    }

    void TearDown() override {
        Logger::instance().setOutput(nullptr);
        Logger::instance().setColorEnabled(true);
        Logger::instance().setLevel(LogLevel::INFO);
    }

    std::ostringstream output_;
};

TEST_F(LoggerTest, SingletonInstance) {
    auto& instance1 = Logger::instance();
    auto& instance2 = Logger::instance();
    EXPECT_EQ(&instance1, &instance2);
}

TEST_F(LoggerTest, LogLevelFiltering) {
    Logger::instance().setLevel(LogLevel::WARN);

    LOG_TRACE("Test", "filtered trace");
    LOG_DEBUG("Test", "filtered debug");
    LOG_INFO("Test", "filtered info");
    LOG_WARN("Test", "visible warn");
    LOG_ERROR("Test", "visible error");

    const std::string text = output_.str();
    EXPECT_EQ(text.find("filtered"), std::string::npos);
    EXPECT_NE(text.find("visible warn"), std::string::npos);
    EXPECT_NE(text.find("visible error"), std::string::npos);
}

TEST_F(LoggerTest, OffSilencesEverything) {
    Logger::instance().setLevel(LogLevel::OFF);
    LOG_FATAL("Test", "nothing");
    EXPECT_TRUE(output_.str().empty());
    EXPECT_FALSE(Logger::instance().isEnabled(LogLevel::FATAL));
}

TEST_F(LoggerTest, LogLevelNames) {
    EXPECT_EQ(Logger::levelName(LogLevel::TRACE), "TRACE");
    EXPECT_EQ(Logger::levelName(LogLevel::DEBUG), "DEBUG");
    EXPECT_EQ(Logger::levelName(LogLevel::INFO), "INFO");
    EXPECT_EQ(Logger::levelName(LogLevel::WARN), "WARN");
    EXPECT_EQ(Logger::levelName(LogLevel::ERROR), "ERROR");
    EXPECT_EQ(Logger::levelName(LogLevel::FATAL), "FATAL");
    EXPECT_EQ(Logger::levelName(LogLevel::OFF), "OFF");
}

TEST_F(LoggerTest, ParseLogLevel) {
    EXPECT_EQ(parseLogLevel("TRACE"), LogLevel::TRACE);
    EXPECT_EQ(parseLogLevel("debug"), LogLevel::DEBUG);
    EXPECT_EQ(parseLogLevel("Info"), LogLevel::INFO);
    EXPECT_EQ(parseLogLevel("WARN"), LogLevel::WARN);
    EXPECT_EQ(parseLogLevel("warning"), LogLevel::WARN);
    EXPECT_EQ(parseLogLevel("ERROR"), LogLevel::ERROR);
    EXPECT_EQ(parseLogLevel("FATAL"), LogLevel::FATAL);
    EXPECT_EQ(parseLogLevel("off"), LogLevel::OFF);
    EXPECT_EQ(parseLogLevel("verbose"), LogLevel::INFO);
    EXPECT_EQ(parseLogLevel(""), LogLevel::INFO);
}

TEST_F(LoggerTest, PlaceholderFormatting) {
    LOG_INFO("Fmt", "{} of {} devices at {}", 3, 7, "10.0.0.1");
    EXPECT_NE(output_.str().find("3 of 7 devices at 10.0.0.1"), std::string::npos);
}

TEST_F(LoggerTest, SurplusPlaceholdersKeptVerbatim) {
    LOG_INFO("Fmt", "only {} here {}", 1);
    EXPECT_NE(output_.str().find("only 1 here {}"), std::string::npos);
}

TEST_F(LoggerTest, ComponentTag) {
    LOG_INFO("MyComponent", "Test message");
    const std::string text = output_.str();
    EXPECT_NE(text.find("[MyComponent]"), std::string::npos);
    EXPECT_NE(text.find("[INFO ]"), std::string::npos);
}

TEST_F(LoggerTest, ThreadSafety) {
    std::vector<std::thread> threads;
    const int num_threads = 10;
    const int logs_per_thread = 100;

    for (int i = 0; i < num_threads; ++i) {
        threads.emplace_back([i, logs_per_thread]() {
            for (int j = 0; j < logs_per_thread; ++j) {
                LOG_INFO("Worker", "thread {} message {}", i, j);
            }
        });
    }

    for (auto& t : threads) {
        t.join();
    }

    const std::string text = output_.str();
    size_t lines = static_cast<size_t>(std::count(text.begin(), text.end(), '\n'));
    EXPECT_EQ(lines, static_cast<size_t>(num_threads * logs_per_thread));
}
