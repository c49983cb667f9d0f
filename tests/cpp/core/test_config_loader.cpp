/**
 * @file test_config_loader.cpp
 * @brief Unit tests for config loader (JSON configuration)
 */

#include "core/config_loader.h"
#include "test_helpers.h"

#include <gtest/gtest.h>

using namespace podium;

class ConfigLoaderTest : public podium_test::TempDirTest {
   protected:
    std::filesystem::path testConfigPath;

    void SetUp() override {
        TempDirTest::SetUp();
        testConfigPath = tempDir / "test_config.json";
    }

    void writeConfig(const std::string& content) {
        writeFile(testConfigPath, content);
    }
};

// ============================================================
// loadAnalysisConfig tests
// ============================================================

TEST_F(ConfigLoaderTest, LoadNonExistentFileReturnsFalse) {
    AnalysisConfig config;
    bool result = loadAnalysisConfig("/nonexistent/path/config.json", config, false);

    EXPECT_FALSE(result);
}

TEST_F(ConfigLoaderTest, LoadNonExistentFileUsesDefaults) {
    AnalysisConfig config;
    config.sampleRate = 44100;
    loadAnalysisConfig("/nonexistent/path/config.json", config, false);

    EXPECT_EQ(config.sampleRate, 16000);
    EXPECT_EQ(config.trimmer.mode, ThresholdMode::Adaptive);
    EXPECT_FLOAT_EQ(config.trimmer.relativeDropDb, 35.0f);
    EXPECT_FLOAT_EQ(config.trimmer.minPauseSec, 0.20f);
    EXPECT_DOUBLE_EQ(config.segmentation.minTurnSec, 15.0);
    EXPECT_DOUBLE_EQ(config.segmentation.maxMergeGapSec, 0.1);
    EXPECT_DOUBLE_EQ(config.segmentation.minMergedSec, 60.0);
    EXPECT_EQ(config.segmentation.topSpeakers, 4);
    EXPECT_EQ(config.segmentation.segmentsPerSpeaker, 2);
    EXPECT_EQ(config.features.frameLength, 2048);
    EXPECT_EQ(config.features.hopLength, 512);
    EXPECT_DOUBLE_EQ(config.classifier.expressiveCentroidVar, 5e6);
    EXPECT_EQ(config.roles.team1, "Aff");
    EXPECT_EQ(config.roles.team2, "Neg");
    EXPECT_EQ(config.pipeline.timeline, DiarizationTimeline::Trimmed);
}

TEST_F(ConfigLoaderTest, LoadEmptyJsonReturnsTrue) {
    writeConfig("{}");

    AnalysisConfig config;
    bool result = loadAnalysisConfig(testConfigPath, config, false);

    EXPECT_TRUE(result);
    EXPECT_EQ(config.segmentation.topSpeakers, 4);
}

TEST_F(ConfigLoaderTest, LoadFullConfig) {
    writeConfig(R"({
        "audio": {"sampleRate": 22050},
        "trimmer": {"mode": "absolute", "absoluteFloorDb": -40, "minPauseSec": 0.5},
        "segmentation": {"minTurnSec": 5, "maxMergeGapSec": 2.0, "minMergedSec": 30,
                         "topSpeakers": 2, "segmentsPerSpeaker": 3},
        "features": {"pauseTopDb": 30},
        "pitch": {"method": "YIN", "minHz": 60, "maxHz": 400},
        "classifier": {"expressiveCentroidVar": 1e6, "shortPauseSec": 0.3},
        "roles": {"team1": "Pro", "team2": "Con", "firstTeam": "con", "expectedParticipants": 6},
        "pipeline": {"workers": 3, "writeClips": false, "diarizationTimeline": "original"}
    })");

    AnalysisConfig config;
    ASSERT_TRUE(loadAnalysisConfig(testConfigPath, config, false));

    EXPECT_EQ(config.sampleRate, 22050);
    EXPECT_EQ(config.trimmer.mode, ThresholdMode::Absolute);
    EXPECT_FLOAT_EQ(config.trimmer.absoluteFloorDb, -40.0f);
    EXPECT_FLOAT_EQ(config.trimmer.minPauseSec, 0.5f);
    EXPECT_DOUBLE_EQ(config.segmentation.minTurnSec, 5.0);
    EXPECT_DOUBLE_EQ(config.segmentation.maxMergeGapSec, 2.0);
    EXPECT_DOUBLE_EQ(config.segmentation.minMergedSec, 30.0);
    EXPECT_EQ(config.segmentation.topSpeakers, 2);
    EXPECT_EQ(config.segmentation.segmentsPerSpeaker, 3);
    EXPECT_DOUBLE_EQ(config.features.pauseTopDb, 30.0);
    EXPECT_EQ(config.pitch.method, "yin");
    EXPECT_DOUBLE_EQ(config.pitch.minHz, 60.0);
    EXPECT_DOUBLE_EQ(config.classifier.expressiveCentroidVar, 1e6);
    EXPECT_DOUBLE_EQ(config.classifier.shortPauseSec, 0.3);
    EXPECT_EQ(config.roles.team1, "Pro");
    EXPECT_EQ(config.roles.firstTeam, "con");
    EXPECT_EQ(config.roles.expectedParticipants, 6);
    EXPECT_EQ(config.pipeline.workers, 3);
    EXPECT_FALSE(config.pipeline.writeClips);
    EXPECT_EQ(config.pipeline.timeline, DiarizationTimeline::Original);
}

TEST_F(ConfigLoaderTest, InvalidJsonReturnsFalseAndKeepsDefaults) {
    writeConfig("{ invalid json }");

    AnalysisConfig config;
    config.segmentation.topSpeakers = 9;
    EXPECT_FALSE(loadAnalysisConfig(testConfigPath, config, false));
    EXPECT_EQ(config.segmentation.topSpeakers, 4);
}

TEST_F(ConfigLoaderTest, WrongTypeInSectionKeepsDefaults) {
    writeConfig(R"({"segmentation": {"topSpeakers": "many", "minMergedSec": 45}})");

    AnalysisConfig config;
    ASSERT_TRUE(loadAnalysisConfig(testConfigPath, config, false));
    EXPECT_EQ(config.segmentation.topSpeakers, 4);
    EXPECT_DOUBLE_EQ(config.segmentation.minMergedSec, 45.0);
}

TEST_F(ConfigLoaderTest, NonPositiveValuesFallBack) {
    writeConfig(R"({
        "trimmer": {"hopMs": 0},
        "segmentation": {"topSpeakers": 0, "segmentsPerSpeaker": -1},
        "features": {"hopLength": -5},
        "pitch": {"minHz": 500, "maxHz": 100}
    })");

    AnalysisConfig config;
    ASSERT_TRUE(loadAnalysisConfig(testConfigPath, config, false));
    EXPECT_FLOAT_EQ(config.trimmer.hopMs, 10.0f);
    EXPECT_EQ(config.segmentation.topSpeakers, 4);
    EXPECT_EQ(config.segmentation.segmentsPerSpeaker, 2);
    EXPECT_EQ(config.features.hopLength, 512);
    EXPECT_DOUBLE_EQ(config.pitch.minHz, 75.0);
    EXPECT_DOUBLE_EQ(config.pitch.maxHz, 500.0);
}

TEST_F(ConfigLoaderTest, UnknownEnumValuesFallBack) {
    writeConfig(R"({"trimmer": {"mode": "fancy"}, "pipeline": {"diarizationTimeline": "x"}})");

    AnalysisConfig config;
    ASSERT_TRUE(loadAnalysisConfig(testConfigPath, config, false));
    EXPECT_EQ(config.trimmer.mode, ThresholdMode::Adaptive);
    EXPECT_EQ(config.pipeline.timeline, DiarizationTimeline::Trimmed);
}

// ============================================================
// Enum helpers and validation
// ============================================================

TEST(ConfigEnums, ParseAndFormat) {
    EXPECT_EQ(parseThresholdMode("ABSOLUTE"), ThresholdMode::Absolute);
    EXPECT_EQ(parseThresholdMode(""), ThresholdMode::Adaptive);
    EXPECT_STREQ(thresholdModeToString(ThresholdMode::Absolute), "absolute");
    EXPECT_EQ(parseDiarizationTimeline("Original"), DiarizationTimeline::Original);
    EXPECT_STREQ(diarizationTimelineToString(DiarizationTimeline::Trimmed), "trimmed");
}

TEST(ConfigValidation, DefaultsAreValid) {
    AnalysisConfig config;
    std::string error;
    EXPECT_TRUE(validateAnalysisConfig(config, error)) << error;
}

TEST(ConfigValidation, FirstTeamMustMatchATeam) {
    AnalysisConfig config;
    std::string error;

    config.roles.firstTeam = "neg";
    EXPECT_TRUE(validateAnalysisConfig(config, error));

    config.roles.firstTeam = "Gov";
    EXPECT_FALSE(validateAnalysisConfig(config, error));
    EXPECT_NE(error.find("Gov"), std::string::npos);
}

TEST(ConfigValidation, TeamsMustDiffer) {
    AnalysisConfig config;
    config.roles.team2 = "AFF";
    std::string error;
    EXPECT_FALSE(validateAnalysisConfig(config, error));
}

TEST(ConfigValidation, RejectsNonPositiveSelectionCounts) {
    AnalysisConfig config;
    std::string error;
    config.segmentation.topSpeakers = 0;
    EXPECT_FALSE(validateAnalysisConfig(config, error));

    config = AnalysisConfig{};
    config.segmentation.segmentsPerSpeaker = 0;
    EXPECT_FALSE(validateAnalysisConfig(config, error));

    config = AnalysisConfig{};
    config.pipeline.workers = -2;
    EXPECT_FALSE(validateAnalysisConfig(config, error));
}
