// tests/unit/test_common_logger.cpp
#include <gtest/gtest.h>
#include "../../src/common/logger.hpp"
#include <fstream>
#include <sstream>
#include <filesystem>

using namespace WolRelay::Common;
namespace fs = std::filesystem;

// ==================== Test Fixtures ====================

class LoggerTest : public ::testing::Test
{
protected:
    fs::path log_dir;

    void SetUp() override
    {
        log_dir = fs::temp_directory_path() / "wol_relay_test_logs";
        cleanupTestFiles();
        fs::create_directories(log_dir);
    }

    void TearDown() override
    {
        // Trả lại logger chỉ có console để giải phóng file sink
        setupLogger(LoggerConfig());
        cleanupTestFiles();
    }

    void cleanupTestFiles()
    {
        if (fs::exists(log_dir))
        {
            fs::remove_all(log_dir);
        }
    }

    std::string readFile(const std::string &filename)
    {
        std::ifstream file(filename);
        if (!file.is_open())
        {
            return "";
        }
        std::stringstream buffer;
        buffer << file.rdbuf();
        return buffer.str();
    }

    bool fileContains(const std::string &filename, const std::string &text)
    {
        return readFile(filename).find(text) != std::string::npos;
    }
};

// ==================== Log Level Tests ====================

TEST_F(LoggerTest, ParseLogLevel)
{
    LogLevel level = LogLevel::OFF;

    EXPECT_TRUE(parseLogLevel("trace", level));
    EXPECT_EQ(level, LogLevel::TRACE);
    EXPECT_TRUE(parseLogLevel("DEBUG", level));
    EXPECT_EQ(level, LogLevel::DEBUG);
    EXPECT_TRUE(parseLogLevel(" Info ", level));
    EXPECT_EQ(level, LogLevel::INFO);
    EXPECT_TRUE(parseLogLevel("warning", level));
    EXPECT_EQ(level, LogLevel::WARN);
    EXPECT_TRUE(parseLogLevel("error", level));
    EXPECT_EQ(level, LogLevel::ERROR);
    EXPECT_TRUE(parseLogLevel("critical", level));
    EXPECT_EQ(level, LogLevel::FATAL);
    EXPECT_TRUE(parseLogLevel("off", level));
    EXPECT_EQ(level, LogLevel::OFF);
}

TEST_F(LoggerTest, ParseLogLevelInvalid)
{
    LogLevel level = LogLevel::WARN;

    EXPECT_FALSE(parseLogLevel("verbose", level));
    EXPECT_FALSE(parseLogLevel("", level));
    EXPECT_EQ(level, LogLevel::WARN);
}

TEST_F(LoggerTest, LogLevelToString)
{
    EXPECT_EQ(logLevelToString(LogLevel::TRACE), "TRACE");
    EXPECT_EQ(logLevelToString(LogLevel::INFO), "INFO");
    EXPECT_EQ(logLevelToString(LogLevel::FATAL), "FATAL");
    EXPECT_EQ(logLevelToString(LogLevel::OFF), "OFF");
}

TEST_F(LoggerTest, ToSpdlogLevel)
{
    EXPECT_EQ(toSpdlogLevel(LogLevel::DEBUG), spdlog::level::debug);
    EXPECT_EQ(toSpdlogLevel(LogLevel::WARN), spdlog::level::warn);
    EXPECT_EQ(toSpdlogLevel(LogLevel::ERROR), spdlog::level::err);
    EXPECT_EQ(toSpdlogLevel(LogLevel::FATAL), spdlog::level::critical);
}

// ==================== Setup Tests ====================

TEST_F(LoggerTest, DefaultConfig)
{
    LoggerConfig config;

    EXPECT_EQ(config.level, LogLevel::INFO);
    EXPECT_TRUE(config.log_file.empty());
    EXPECT_EQ(config.max_file_size, 10u * 1024 * 1024);
    EXPECT_EQ(config.max_files, 5u);
}

TEST_F(LoggerTest, SetupConsoleOnly)
{
    LoggerConfig config;
    config.level = LogLevel::WARN;

    ASSERT_TRUE(setupLogger(config));
    EXPECT_EQ(spdlog::default_logger()->name(), "wol_relay");
    EXPECT_EQ(spdlog::default_logger()->level(), spdlog::level::warn);
}

TEST_F(LoggerTest, SetupWithFile)
{
    std::string log_file = (log_dir / "relay.log").string();

    LoggerConfig config;
    config.level = LogLevel::INFO;
    config.log_file = log_file;

    ASSERT_TRUE(setupLogger(config));

    spdlog::info("Forwarding WOL packet for {}", "AA:BB:CC:DD:EE:FF");
    spdlog::debug("Debug detail only in file");
    spdlog::trace("Trace detail dropped");
    spdlog::default_logger()->flush();

    EXPECT_TRUE(fs::exists(log_file));
    EXPECT_TRUE(fileContains(log_file, "Forwarding WOL packet for AA:BB:CC:DD:EE:FF"));
    EXPECT_TRUE(fileContains(log_file, "Debug detail only in file"));
    EXPECT_FALSE(fileContains(log_file, "Trace detail dropped"));
}

TEST_F(LoggerTest, SetupWithFileAtTraceLevel)
{
    std::string log_file = (log_dir / "trace.log").string();

    LoggerConfig config;
    config.level = LogLevel::TRACE;
    config.log_file = log_file;

    ASSERT_TRUE(setupLogger(config));

    spdlog::trace("Trace detail kept");
    spdlog::default_logger()->flush();

    EXPECT_TRUE(fileContains(log_file, "Trace detail kept"));
}

TEST_F(LoggerTest, SetupWithFileAtOffLevel)
{
    std::string log_file = (log_dir / "off.log").string();

    LoggerConfig config;
    config.level = LogLevel::OFF;
    config.log_file = log_file;

    ASSERT_TRUE(setupLogger(config));
    EXPECT_EQ(spdlog::default_logger()->level(), spdlog::level::off);

    spdlog::error("Error while logging is off");
    spdlog::debug("Debug while logging is off");
    spdlog::default_logger()->flush();

    EXPECT_FALSE(fileContains(log_file, "Error while logging is off"));
    EXPECT_FALSE(fileContains(log_file, "Debug while logging is off"));
}

TEST_F(LoggerTest, SetupCreatesMissingDirectory)
{
    std::string log_file = (log_dir / "nested" / "relay.log").string();

    LoggerConfig config;
    config.log_file = log_file;

    ASSERT_TRUE(setupLogger(config));
    spdlog::warn("Created on demand");
    spdlog::default_logger()->flush();

    EXPECT_TRUE(fileContains(log_file, "Created on demand"));
}
