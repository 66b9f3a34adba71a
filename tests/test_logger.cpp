/**
 * @file test_logger.cpp
 * @brief Thread-safety and file output validation for the logger
 *
 * Tests:
 * 1. File creation: automatic directory and timestamped file creation
 * 2. Thread-safety: concurrent logging from multiple threads
 * 3. Level filtering and component prefixes
 * 4. Level name parsing
 */

#include <gtest/gtest.h>
#include <viewfinder/core/Logger.hpp>
#include <viewfinder/core/exception.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace viewfinder::core;

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        logDir_ = std::filesystem::path(testing::TempDir()) / "viewfinder_test_logs" / "nested";
        std::filesystem::remove_all(logDir_.parent_path());

        auto& logger = Logger::getInstance();
        logger.setConsoleOutput(false);
        ASSERT_TRUE(logger.initializeWithTimestamp(logDir_.string(), LogLevel::DEBUG));
    }

    void TearDown() override {
        auto& logger = Logger::getInstance();
        logger.closeLogFile();
        logger.setConsoleOutput(true);
        logger.setLevel(LogLevel::INFO);
        std::filesystem::remove_all(logDir_.parent_path());
    }

    std::string readLog() {
        Logger::getInstance().flush();
        std::ifstream in(Logger::getInstance().getCurrentLogFile());
        std::stringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }

    std::filesystem::path logDir_;
};

/**
 * Test 1: Basic file logging initialization
 */
TEST_F(LoggerTest, CreatesTimestampedFile) {
    const std::string logFile = Logger::getInstance().getCurrentLogFile();

    ASSERT_FALSE(logFile.empty());
    EXPECT_TRUE(std::filesystem::exists(logFile));
    EXPECT_EQ(std::filesystem::path(logFile).parent_path(), logDir_);
    EXPECT_EQ(std::filesystem::path(logFile).filename().string().rfind("viewfinder_", 0), 0u);
}

/**
 * Test 2: Thread-safety - concurrent logging keeps every line intact
 */
TEST_F(LoggerTest, ConcurrentLoggingKeepsLines) {
    constexpr int kThreads = 8;
    constexpr int kMessagesPerThread = 100;

    std::vector<std::thread> threads;
    for (int i = 0; i < kThreads; ++i) {
        threads.emplace_back([i]() {
            for (int j = 0; j < kMessagesPerThread; ++j) {
                VIEWFINDER_LOG_INFO("Worker" + std::to_string(i)) << "message " << j;
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    std::istringstream log(readLog());
    std::string line;
    int count = 0;
    while (std::getline(log, line)) {
        if (line.find("[INFO] [Worker") != std::string::npos) {
            EXPECT_NE(line.find("message "), std::string::npos) << line;
            ++count;
        }
    }
    EXPECT_EQ(count, kThreads * kMessagesPerThread);
}

/**
 * Test 3: Messages below the level are dropped
 */
TEST_F(LoggerTest, LevelFiltering) {
    auto& logger = Logger::getInstance();
    logger.setLevel(LogLevel::WARNING);

    logger.info("hidden info line");
    VIEWFINDER_LOG_WARNING("DeviceControl") << "visible warning " << 42;
    LOG_ERROR("visible error");

    const std::string content = readLog();
    EXPECT_EQ(content.find("hidden info line"), std::string::npos);
    EXPECT_NE(content.find("[WARNING] [DeviceControl] visible warning 42"), std::string::npos);
    EXPECT_NE(content.find("[ERROR] visible error (test_logger.cpp:"), std::string::npos);
}

/**
 * Test 4: Level names
 */
TEST_F(LoggerTest, ParsesLevelNames) {
    EXPECT_EQ(parseLogLevel("trace"), LogLevel::TRACE);
    EXPECT_EQ(parseLogLevel("WARN"), LogLevel::WARNING);
    EXPECT_EQ(parseLogLevel("Critical"), LogLevel::CRITICAL);
    EXPECT_STREQ(logLevelToString(LogLevel::ERROR), "ERROR");
    EXPECT_THROW(parseLogLevel("verbose"), ConfigurationException);
}
