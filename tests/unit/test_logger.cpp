/**
 * @file test_logger.cpp
 * @brief Unit tests for the logging framework
 */

#include <gtest/gtest.h>
#include <timeuuid/utils/logger.hpp>

#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace timeuuid::utils;

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::instance().setLevel(LogLevel::TRACE);
        Logger::instance().setColorEnabled(false);
        Logger::instance().setSink(&sink_);
    }

    void TearDown() override {
        Logger::instance().setSink(nullptr);
        Logger::instance().setLevel(LogLevel::INFO);
    }

    std::ostringstream sink_;
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

    std::string out = sink_.str();
    EXPECT_EQ(out.find("filtered"), std::string::npos);
    EXPECT_NE(out.find("visible warn"), std::string::npos);
    EXPECT_NE(out.find("visible error"), std::string::npos);
}

TEST_F(LoggerTest, OffSilencesEverything) {
    Logger::instance().setLevel(LogLevel::OFF);
    LOG_FATAL("Test", "nothing");
    EXPECT_TRUE(sink_.str().empty());
    EXPECT_FALSE(Logger::instance().isEnabled(LogLevel::OFF));
}

TEST_F(LoggerTest, LineCarriesLevelAndComponent) {
    LOG_INFO("Generator", "started");
    std::string out = sink_.str();
    EXPECT_EQ(out.front(), '[');
    EXPECT_NE(out.find("[INFO ] [Generator] started"), std::string::npos);
    EXPECT_EQ(out.back(), '\n');
}

TEST_F(LoggerTest, PlaceholdersAreReplacedInOrder) {
    LOG_DEBUG("Test", "node {} sequence {}", "aa:bb", 42);
    EXPECT_NE(sink_.str().find("node aa:bb sequence 42"), std::string::npos);
}

TEST_F(LoggerTest, ExtraPlaceholdersStayLiteral) {
    LOG_DEBUG("Test", "one {} two {}", 1);
    EXPECT_NE(sink_.str().find("one 1 two {}"), std::string::npos);
}

TEST_F(LoggerTest, ColorWrapsLevelTag) {
    Logger::instance().setColorEnabled(true);
    LOG_ERROR("Test", "colored");
    EXPECT_NE(sink_.str().find("\033[31m[ERROR]\033[0m"), std::string::npos);
}

TEST_F(LoggerTest, LogLevelNames) {
    EXPECT_STREQ(logLevelToString(LogLevel::TRACE), "TRACE");
    EXPECT_STREQ(logLevelToString(LogLevel::DEBUG), "DEBUG");
    EXPECT_STREQ(logLevelToString(LogLevel::INFO), "INFO ");
    EXPECT_STREQ(logLevelToString(LogLevel::WARN), "WARN ");
    EXPECT_STREQ(logLevelToString(LogLevel::ERROR), "ERROR");
    EXPECT_STREQ(logLevelToString(LogLevel::FATAL), "FATAL");
}

TEST_F(LoggerTest, LogLevelParsing) {
    EXPECT_EQ(logLevelFromString("trace"), LogLevel::TRACE);
    EXPECT_EQ(logLevelFromString("Debug"), LogLevel::DEBUG);
    EXPECT_EQ(logLevelFromString("WARNING"), LogLevel::WARN);
    EXPECT_EQ(logLevelFromString("off"), LogLevel::OFF);
    EXPECT_EQ(logLevelFromString("bogus"), LogLevel::INFO);
    EXPECT_EQ(logLevelFromString("bogus", LogLevel::ERROR), LogLevel::ERROR);
}

TEST_F(LoggerTest, ThreadSafety) {
    std::vector<std::thread> threads;
    const int num_threads = 10;
    const int logs_per_thread = 100;

    for (int i = 0; i < num_threads; ++i) {
        threads.emplace_back([i]() {
            for (int j = 0; j < logs_per_thread; ++j) {
                LOG_INFO("Thread" + std::to_string(i), "Message {}", j);
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    std::istringstream lines(sink_.str());
    std::string line;
    int count = 0;
    while (std::getline(lines, line)) {
        ++count;
    }
    EXPECT_EQ(count, num_threads * logs_per_thread);
}
