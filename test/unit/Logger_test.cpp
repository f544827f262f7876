// GridBind 库 - 电子表格网格到强类型记录的解码库
// 组件：日志系统测试

#include "gridbind/utils/Logger.hpp"
#include <gtest/gtest.h>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace gridbind {

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        ::unsetenv("GRIDBIND_LOG_LEVEL");
        Logger::getInstance().shutdown();
        log_path_ = (std::filesystem::temp_directory_path() / "gridbind_logger_test" / "test.log").string();
        std::error_code ec;
        std::filesystem::remove_all(std::filesystem::path(log_path_).parent_path(), ec);
    }

    void TearDown() override {
        Logger::getInstance().shutdown();
        std::error_code ec;
        std::filesystem::remove_all(std::filesystem::path(log_path_).parent_path(), ec);
    }

    std::string readLog() const {
        std::ifstream in(log_path_);
        std::stringstream buffer;
        buffer << in.rdbuf();
        return buffer.str();
    }

    LoggerConfig fileConfig(Logger::Level level) const {
        LoggerConfig config;
        config.log_file_path = log_path_;
        config.level = level;
        config.enable_console = false;
        return config;
    }

    std::string log_path_;
};

// 测试级别名称解析
TEST_F(LoggerTest, ParseLevel) {
    EXPECT_EQ(Logger::parseLevel("debug", Logger::Level::WARN), Logger::Level::DEBUG);
    EXPECT_EQ(Logger::parseLevel("WARNING", Logger::Level::INFO), Logger::Level::WARN);
    EXPECT_EQ(Logger::parseLevel("Off", Logger::Level::INFO), Logger::Level::OFF);
    EXPECT_EQ(Logger::parseLevel("verbose", Logger::Level::ERROR), Logger::Level::ERROR);
    EXPECT_STREQ(Logger::levelToString(Logger::Level::CRITICAL), "CRIT");
}

// 测试级别过滤与文件输出
TEST_F(LoggerTest, WritesFilteredMessagesToFile) {
    Logger& logger = Logger::getInstance();
    logger.initialize(fileConfig(Logger::Level::DEBUG));

    EXPECT_EQ(logger.getLevel(), Logger::Level::DEBUG);
    EXPECT_FALSE(logger.shouldLog(Logger::Level::TRACE));
    EXPECT_TRUE(logger.shouldLog(Logger::Level::DEBUG));
    EXPECT_FALSE(logger.shouldLog(Logger::Level::OFF));

    GRIDBIND_LOG_TRACE("hidden trace {}", 1);
    GRIDBIND_LOG_DEBUG("decoded {} rows", 3);
    GRIDBIND_LOG_ERROR("sheet '{}' missing", "Orders");
    logger.flush();

    const std::string content = readLog();
    EXPECT_EQ(content.find("hidden trace"), std::string::npos);
    EXPECT_NE(content.find("[DEBUG]"), std::string::npos);
    EXPECT_NE(content.find("decoded 3 rows"), std::string::npos);
    EXPECT_NE(content.find("sheet 'Orders' missing"), std::string::npos);
    EXPECT_NE(content.find("Logger_test.cpp"), std::string::npos);
}

// 测试默认配置：WARN 级别，只输出到控制台
TEST_F(LoggerTest, DefaultConfiguration) {
    Logger& logger = Logger::getInstance();
    logger.initialize();

    EXPECT_EQ(logger.getLevel(), Logger::Level::WARN);
    EXPECT_FALSE(logger.shouldLog(Logger::Level::INFO));
    EXPECT_TRUE(logger.shouldLog(Logger::Level::ERROR));

    LoggerConfig defaults;
    EXPECT_TRUE(defaults.log_file_path.empty());
    EXPECT_TRUE(defaults.enable_console);
    EXPECT_EQ(defaults.write_mode, Logger::WriteMode::TRUNCATE);
}

// 测试运行时调整级别
TEST_F(LoggerTest, SetLevelAtRuntime) {
    Logger& logger = Logger::getInstance();
    logger.initialize(fileConfig(Logger::Level::ERROR));

    GRIDBIND_LOG_WARN("first warning");
    logger.setLevel(Logger::Level::WARN);
    GRIDBIND_LOG_WARN("second warning");
    logger.flush();

    const std::string content = readLog();
    EXPECT_EQ(content.find("first warning"), std::string::npos);
    EXPECT_NE(content.find("second warning"), std::string::npos);
}

// 测试格式串错误不会抛出
TEST_F(LoggerTest, FormatErrorIsReported) {
    Logger& logger = Logger::getInstance();
    logger.initialize(fileConfig(Logger::Level::INFO));

    EXPECT_NO_THROW(logger.logf(Logger::Level::INFO, "broken {} {}", 1));
    logger.flush();
    EXPECT_NE(readLog().find("[format error:"), std::string::npos);
}

// 测试环境变量覆盖配置级别
TEST_F(LoggerTest, EnvironmentOverridesLevel) {
    ::setenv("GRIDBIND_LOG_LEVEL", "trace", 1);
    Logger::getInstance().initialize(fileConfig(Logger::Level::ERROR));
    EXPECT_EQ(Logger::getInstance().getLevel(), Logger::Level::TRACE);
    ::unsetenv("GRIDBIND_LOG_LEVEL");
}

// 测试关闭后不再输出
TEST_F(LoggerTest, ShutdownStopsLogging) {
    Logger& logger = Logger::getInstance();
    logger.initialize(fileConfig(Logger::Level::INFO));
    logger.shutdown();
    EXPECT_FALSE(logger.shouldLog(Logger::Level::CRITICAL));
}

} // namespace gridbind
