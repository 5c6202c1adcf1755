/**
 * @file test_logger.cpp
 * @brief Logger and logging configuration tests
 *
 * Validates:
 * - Level name parsing and level filtering
 * - Timestamped log file creation (directory created on demand)
 * - Concurrent logging keeps every line intact
 * - configureLogging() applies the "logging" configuration section
 */

#include <gtest/gtest.h>
#include <facecue/core/Logger.hpp>
#include <facecue/core/LoggingSetup.hpp>
#include <facecue/core/Configuration.hpp>

#include <fstream>
#include <sstream>
#include <thread>
#include <vector>
#include <unistd.h>

using namespace facecue::core;

namespace {

std::string read_file(const std::string& path) {
    std::ifstream file(path);
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

size_t count_occurrences(const std::string& text, const std::string& needle) {
    size_t count = 0;
    for (size_t pos = text.find(needle); pos != std::string::npos;
         pos = text.find(needle, pos + needle.size())) {
        ++count;
    }
    return count;
}

} // namespace

class LoggerTest : public ::testing::Test {
protected:
    std::string log_dir_;

    void SetUp() override {
        log_dir_ = "/tmp/facecue_test_logs_" + std::to_string(::getpid()) + "/" +
                   ::testing::UnitTest::GetInstance()->current_test_info()->name();
        Logger::getInstance().setConsoleOutput(false);
    }

    void TearDown() override {
        Logger& logger = Logger::getInstance();
        logger.closeLogFile();
        logger.setLevel(LogLevel::INFO);
        logger.setConsoleOutput(true);
    }
};

TEST(LogLevelTest, ParsesNamesCaseInsensitively) {
    LogLevel level = LogLevel::INFO;
    EXPECT_TRUE(parseLogLevel("debug", level));
    EXPECT_EQ(level, LogLevel::DEBUG);
    EXPECT_TRUE(parseLogLevel("WARNING", level));
    EXPECT_EQ(level, LogLevel::WARNING);
    EXPECT_TRUE(parseLogLevel("Error", level));
    EXPECT_EQ(level, LogLevel::ERROR);
    EXPECT_FALSE(parseLogLevel("loud", level));
}

TEST_F(LoggerTest, CreatesTimestampedFile) {
    Logger& logger = Logger::getInstance();
    ASSERT_TRUE(logger.initializeWithTimestamp(log_dir_, LogLevel::DEBUG));

    const std::string path = logger.getCurrentLogFile();
    EXPECT_EQ(path.rfind(log_dir_, 0), 0u);
    EXPECT_NE(path.find("facecue_"), std::string::npos);
    EXPECT_TRUE(std::ifstream(path).good());

    LOG_DEBUG("debug line for file test");
    FACECUE_LOG_INFO("EyeDetector") << "blink count " << 3;
    logger.flush();

    const std::string content = read_file(path);
    EXPECT_NE(content.find("debug line for file test"), std::string::npos);
    EXPECT_NE(content.find("[EyeDetector] blink count 3"), std::string::npos);
}

TEST_F(LoggerTest, FiltersBelowMinimumLevel) {
    Logger& logger = Logger::getInstance();
    ASSERT_TRUE(logger.initializeWithTimestamp(log_dir_, LogLevel::WARNING));
    EXPECT_EQ(logger.getLevel(), LogLevel::WARNING);

    LOG_INFO("filtered info line");
    LOG_WARNING("kept warning line");
    logger.flush();

    const std::string content = read_file(logger.getCurrentLogFile());
    EXPECT_EQ(content.find("filtered info line"), std::string::npos);
    EXPECT_NE(content.find("kept warning line"), std::string::npos);
}

TEST_F(LoggerTest, ConcurrentLoggingKeepsLinesWhole) {
    Logger& logger = Logger::getInstance();
    ASSERT_TRUE(logger.initializeWithTimestamp(log_dir_, LogLevel::INFO));

    constexpr int kThreads = 8;
    constexpr int kMessages = 200;
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([t] {
            for (int i = 0; i < kMessages; ++i) {
                FACECUE_LOG_INFO("worker") << "concurrent-message thread=" << t << " i=" << i;
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    logger.flush();

    const std::string content = read_file(logger.getCurrentLogFile());
    EXPECT_EQ(count_occurrences(content, "concurrent-message"),
              static_cast<size_t>(kThreads * kMessages));
    EXPECT_NE(content.find("concurrent-message thread=7 i=199"), std::string::npos);
}

TEST_F(LoggerTest, ConfigureLoggingFromSection) {
    Configuration config;
    config.loadFromString("logging:\n"
                          "  level: DEBUG\n"
                          "  console: false\n"
                          "  directory: " + log_dir_ + "\n");

    const std::string path = configureLogging(config);
    ASSERT_FALSE(path.empty());
    EXPECT_EQ(Logger::getInstance().getLevel(), LogLevel::DEBUG);

    LOG_DEBUG("configured debug line");
    Logger::getInstance().flush();
    EXPECT_NE(read_file(path).find("configured debug line"), std::string::npos);
}

TEST_F(LoggerTest, ConfigureLoggingUnknownLevelFallsBackToInfo) {
    Configuration config;
    config.loadFromString("logging:\n"
                          "  level: verbose\n"
                          "  console: false\n");

    EXPECT_TRUE(configureLogging(config).empty());
    EXPECT_EQ(Logger::getInstance().getLevel(), LogLevel::INFO);
}
