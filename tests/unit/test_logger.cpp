#include <gtest/gtest.h>
#include "ginseng/core/logger.hpp"
#include <filesystem>
#include <fstream>

using namespace ginseng::core;

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        log_file = "test_ginseng.log";
    }
    
    void TearDown() override {
        Logger::shutdown();
        if (std::filesystem::exists(log_file)) {
            std::filesystem::remove(log_file);
        }
    }
    
    std::string read_log() {
        Logger::get()->flush();
        std::ifstream file(log_file);
        return std::string((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    }
    
    std::string log_file;
};

TEST_F(LoggerTest, InitializeCreatesFile) {
    Logger::initialize(log_file, LogLevel::Debug);
    
    EXPECT_NE(Logger::get(), nullptr);
    EXPECT_TRUE(std::filesystem::exists(log_file));
}

TEST_F(LoggerTest, MessagesReachFile) {
    Logger::initialize(log_file, LogLevel::Debug);
    
    LOG_DEBUG("transfer {} started", "abc");
    LOG_WARN("file {} failed", 3);
    
    auto content = read_log();
    EXPECT_NE(content.find("transfer abc started"), std::string::npos);
    EXPECT_NE(content.find("file 3 failed"), std::string::npos);
}

TEST_F(LoggerTest, LevelFiltersMessages) {
    Logger::initialize(log_file, LogLevel::Warn);
    
    LOG_INFO("quiet message");
    LOG_ERROR("loud message");
    
    auto content = read_log();
    EXPECT_EQ(content.find("quiet message"), std::string::npos);
    EXPECT_NE(content.find("loud message"), std::string::npos);
}

TEST_F(LoggerTest, UsableAfterShutdown) {
    Logger::initialize(log_file, LogLevel::Info);
    Logger::shutdown();
    
    ASSERT_NE(Logger::get(), nullptr);
    LOG_INFO("still safe to log");
}

TEST(LogLevelTest, ParseNames) {
    EXPECT_EQ(parse_log_level("debug"), LogLevel::Debug);
    EXPECT_EQ(parse_log_level(" WARNING "), LogLevel::Warn);
    EXPECT_EQ(parse_log_level("off"), LogLevel::Off);
    EXPECT_EQ(parse_log_level("chatty", LogLevel::Error), LogLevel::Error);
}
