/**
 * @file test_logger.cpp
 * @brief Unit tests for the spdlog-backed logging facade
 */

#include "logging/logger.h"
#include "test_helpers.h"

#include <gtest/gtest.h>

using namespace podium::logging;

class LoggerTest : public podium_test::TempDirTest {
   protected:
    void TearDown() override {
        shutdown();
        initializeEarly();
        TempDirTest::TearDown();
    }
};

// ============================================================
// Level conversion
// ============================================================

TEST(LoggerLevels, StringToLevelIsCaseInsensitive) {
    EXPECT_EQ(stringToLevel("DEBUG"), LogLevel::Debug);
    EXPECT_EQ(stringToLevel("warning"), LogLevel::Warn);
    EXPECT_EQ(stringToLevel("err"), LogLevel::Error);
    EXPECT_EQ(stringToLevel("none"), LogLevel::Off);
    EXPECT_EQ(stringToLevel("verbose"), LogLevel::Info);
}

TEST(LoggerLevels, LevelToString) {
    EXPECT_EQ(levelToString(LogLevel::Trace), "trace");
    EXPECT_EQ(levelToString(LogLevel::Critical), "critical");
    EXPECT_EQ(levelToString(LogLevel::Off), "off");
}

// ============================================================
// Initialization
// ============================================================

TEST_F(LoggerTest, EarlyInitProvidesLogger) {
    ASSERT_TRUE(initializeEarly());
    EXPECT_NE(getLogger(), nullptr);
}

TEST_F(LoggerTest, SetLevelIsReflected) {
    ASSERT_TRUE(initializeEarly());
    setLevel(LogLevel::Warn);
    EXPECT_EQ(getLevel(), LogLevel::Warn);
    setLevel(LogLevel::Debug);
    EXPECT_EQ(getLevel(), LogLevel::Debug);
}

TEST_F(LoggerTest, ConfigFileSectionIsApplied) {
    const auto logPath = tempDir / "podium.log";
    const auto configPath = tempDir / "podium.json";
    writeFile(configPath, R"({"logging": {"level": "debug", "consoleOutput": false, "filePath": ")" +
                              logPath.string() + R"("}})");

    ASSERT_TRUE(initializeFromConfig(configPath.string()));
    EXPECT_EQ(getLevel(), LogLevel::Debug);

    LOG_INFO("segment {} analysed", 3);
    flush();

    EXPECT_NE(readFile(logPath).find("segment 3 analysed"), std::string::npos);
}

TEST_F(LoggerTest, MissingConfigFallsBackToDefaults) {
    ASSERT_TRUE(initializeFromConfig((tempDir / "absent.json").string()));
    EXPECT_EQ(getLevel(), LogLevel::Info);
}

TEST_F(LoggerTest, ReinitializesLazilyAfterShutdown) {
    shutdown();
    LOG_WARN("message after shutdown {}", 1);
    EXPECT_NE(getLogger(), nullptr);
    EXPECT_EQ(getLevel(), LogLevel::Info);
}

TEST_F(LoggerTest, WrongTypedKeyKeepsRestOfSection) {
    const auto configPath = tempDir / "podium.json";
    writeFile(configPath, R"({"logging": {"level": "warn", "maxBackups": "three"}})");

    ASSERT_TRUE(initializeFromConfig(configPath.string()));
    EXPECT_EQ(getLevel(), LogLevel::Warn);
}

TEST_F(LoggerTest, RunLogCapturesOnlyWhileInScope) {
    const auto runLogPath = tempDir / "run.log";
    {
        ScopedRunLog runLog(runLogPath.string());
        ASSERT_TRUE(runLog.attached());
        LOG_INFO("inside run {}", 7);
    }
    LOG_INFO("after run {}", 8);
    flush();

    const std::string text = readFile(runLogPath);
    EXPECT_NE(text.find("inside run 7"), std::string::npos);
    EXPECT_EQ(text.find("after run 8"), std::string::npos);
}

TEST_F(LoggerTest, RunLogOnDirectoryIsNotAttached) {
    ScopedRunLog runLog(tempDir.string());
    EXPECT_FALSE(runLog.attached());
}
