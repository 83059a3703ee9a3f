// Scribble Core Tests
// logger_test.cpp - Logger unit tests

#include <gtest/gtest.h>
#include <scribble/core/file_io.hpp>
#include <scribble/core/logger.hpp>

namespace scribble::core::test {

class LoggerTest : public ::testing::Test {
protected:
    fs::path log_dir_;

    void SetUp() override { log_dir_ = FileSystem::get_temp_directory() / "scribble_logger_test"; }

    void TearDown() override {
        Logger::shutdown();
        FileSystem::remove_all(log_dir_);
    }
};

TEST(LogLevelTest, ParseNames) {
    EXPECT_EQ(parse_log_level("trace"), LogLevel::Trace);
    EXPECT_EQ(parse_log_level("debug"), LogLevel::Debug);
    EXPECT_EQ(parse_log_level("info"), LogLevel::Info);
    EXPECT_EQ(parse_log_level("warn"), LogLevel::Warn);
    EXPECT_EQ(parse_log_level("warning"), LogLevel::Warn);
    EXPECT_EQ(parse_log_level("error"), LogLevel::Error);
    EXPECT_EQ(parse_log_level("critical"), LogLevel::Critical);
    EXPECT_EQ(parse_log_level("off"), LogLevel::Off);
    EXPECT_FALSE(parse_log_level("verbose").has_value());
}

TEST_F(LoggerTest, LogsBeforeInitialize) {
    EXPECT_FALSE(Logger::is_initialized());
    SCRIBBLE_LOG_INFO(log_category::ENGINE, "Message before initialize {}", 1);
}

TEST_F(LoggerTest, InitializeCreatesLogFile) {
    LoggerConfig config;
    config.log_directory = log_dir_;
    config.log_filename = "test.log";
    Logger::initialize(config);

    EXPECT_TRUE(Logger::is_initialized());
    SCRIBBLE_LOG_INFO(log_category::ATLAS, "Atlas message {}", 42);
    Logger::flush();

    EXPECT_TRUE(FileSystem::exists(log_dir_ / "test.log"));
}

TEST_F(LoggerTest, CategoryLevelOverridesGlobal) {
    LoggerConfig config;
    config.file_output = false;
    config.console_level = LogLevel::Warn;
    Logger::initialize(config);

    EXPECT_EQ(Logger::get_global_level(), LogLevel::Warn);
    EXPECT_EQ(Logger::get_category_level(log_category::ATLAS), LogLevel::Warn);

    Logger::set_category_level(log_category::ATLAS, LogLevel::Trace);
    EXPECT_EQ(Logger::get_category_level(log_category::ATLAS), LogLevel::Trace);
    EXPECT_EQ(Logger::get_category_level(log_category::CACHE), LogLevel::Warn);

    Logger::set_global_level(LogLevel::Error);
    EXPECT_EQ(Logger::get_category_level(log_category::CACHE), LogLevel::Error);
}

TEST_F(LoggerTest, ShutdownResetsState) {
    LoggerConfig config;
    config.file_output = false;
    config.console_level = LogLevel::Debug;
    Logger::initialize(config);
    Logger::set_category_level(log_category::GRAPHICS, LogLevel::Off);

    Logger::shutdown();

    EXPECT_FALSE(Logger::is_initialized());
    EXPECT_EQ(Logger::get_global_level(), LogLevel::Info);
    EXPECT_EQ(Logger::get_category_level(log_category::GRAPHICS), LogLevel::Info);
}

}  // namespace scribble::core::test
