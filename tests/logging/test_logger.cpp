/**
 * @file test_logger.cpp
 * @brief Unit tests for the spdlog wrapper
 */

#include <gtest/gtest.h>
#include <bras/logging/logger.h>
#include <bras/config/config_manager.h>
#include <bras/doc/cpf.h>
#include <spdlog/sinks/ostream_sink.h>
#include <memory>
#include <sstream>

using bras::common::ConfigManager;
using bras::common::Logger;

class LoggerTest : public ::testing::Test {
protected:
    std::shared_ptr<spdlog::logger> previous_;

    void SetUp() override {
        previous_ = spdlog::default_logger();
    }

    void TearDown() override {
        spdlog::set_default_logger(previous_);
    }
};

TEST_F(LoggerTest, ParseLevel_KnownNames) {
    EXPECT_EQ(Logger::parseLevel("trace"), spdlog::level::trace);
    EXPECT_EQ(Logger::parseLevel("debug"), spdlog::level::debug);
    EXPECT_EQ(Logger::parseLevel("info"), spdlog::level::info);
    EXPECT_EQ(Logger::parseLevel("warn"), spdlog::level::warn);
    EXPECT_EQ(Logger::parseLevel("error"), spdlog::level::err);
    EXPECT_EQ(Logger::parseLevel("critical"), spdlog::level::critical);
    EXPECT_EQ(Logger::parseLevel("off"), spdlog::level::off);
}

TEST_F(LoggerTest, ParseLevel_UnknownFallsBackToInfo) {
    EXPECT_EQ(Logger::parseLevel("verbose"), spdlog::level::info);
    EXPECT_EQ(Logger::parseLevel(""), spdlog::level::info);
}

TEST_F(LoggerTest, Initialize_InstallsDefaultLogger) {
    Logger::initialize("bras-test", "warn");
    EXPECT_EQ(spdlog::default_logger()->name(), "bras-test");
    EXPECT_EQ(spdlog::default_logger()->level(), spdlog::level::warn);
}

TEST_F(LoggerTest, InitializeFromConfig_UsesConfiguredLevel) {
    auto& config = ConfigManager::getInstance();
    config.set(ConfigManager::LOG_LEVEL, "error");
    config.set(ConfigManager::LOG_TO_FILE, "false");

    Logger::initializeFromConfig("bras-config");
    EXPECT_EQ(spdlog::default_logger()->name(), "bras-config");
    EXPECT_EQ(spdlog::default_logger()->level(), spdlog::level::err);

    config.set(ConfigManager::LOG_LEVEL, "info");
}

TEST_F(LoggerTest, SetLevel_ChangesDefaultLogger) {
    Logger::initialize("bras-level", "info");
    Logger::setLevel("debug");
    EXPECT_EQ(spdlog::default_logger()->level(), spdlog::level::debug);
    Logger::flush();
}

TEST_F(LoggerTest, CpfRejectionLogsReasonWithoutInput) {
    std::ostringstream oss;
    auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(oss);
    auto logger = std::make_shared<spdlog::logger>("capture", sink);
    logger->set_level(spdlog::level::debug);
    spdlog::set_default_logger(logger);

    EXPECT_FALSE(bras::doc::Cpf::parse("98484485401").isValid());
    logger->flush();

    std::string output = oss.str();
    EXPECT_NE(output.find("first verifier digit mismatch"), std::string::npos);
    EXPECT_EQ(output.find("98484485401"), std::string::npos);
}
