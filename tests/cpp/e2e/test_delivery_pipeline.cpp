/**
 * @file test_delivery_pipeline.cpp
 * @brief End-to-end runs of DeliveryPipeline over synthetic recordings
 */

#include "pipeline/delivery_pipeline.h"
#include "test_helpers.h"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

namespace fs = std::filesystem;
using namespace podium;
using namespace podium_test;

namespace {

const char* kDiarization = R"({
  "segments": [
    {"start": 0.0, "end": 3.0, "speaker": "SPEAKER_00"},
    {"start": 3.0, "end": 6.0, "speaker": "SPEAKER_01"},
    {"start": 6.0, "end": 9.0, "speaker": "SPEAKER_02"},
    {"start": 9.0, "end": 12.0, "speaker": "SPEAKER_03"},
    {"start": 12.0, "end": 15.0, "speaker": "SPEAKER_00"},
    {"start": 15.0, "end": 15.4, "speaker": "SPEAKER_01"}
  ]
})";

// Five 3 s turns scaled down so a run takes seconds
AnalysisConfig shortTurnConfig() {
    AnalysisConfig config;
    config.segmentation.minTurnSec = 1.0;
    config.segmentation.minMergedSec = 2.0;
    config.pipeline.workers = 2;
    return config;
}

class DeliveryPipelineTest : public TempDirTest {
   protected:
    fs::path audioPath;
    fs::path diarizationPath;
    fs::path workDir;

    void SetUp() override {
        TempDirTest::SetUp();
        audioPath = tempDir / "debate.wav";
        diarizationPath = tempDir / "diarization.json";
        workDir = tempDir / "work";

        std::vector<float> samples;
        append(samples, sine(150.0, 3.0, 0.5));
        append(samples, sine(220.0, 3.0, 0.3));
        append(samples, sine(180.0, 3.0, 0.6));
        append(samples, sine(260.0, 3.0, 0.4));
        append(samples, sine(150.0, 3.0, 0.5));
        ASSERT_TRUE(audio::writeMono(audioPath.string(), waveform(samples)));
        writeFile(diarizationPath, kDiarization);
    }

    PipelineRequest request() const {
        PipelineRequest req;
        req.audioPath = audioPath.string();
        req.diarizationPath = diarizationPath.string();
        req.workDir = workDir;
        req.arguments = {"--audio", audioPath.string()};
        return req;
    }

    nlohmann::json readJson(const fs::path& path) const {
        return nlohmann::json::parse(readFile(path));
    }
};

}  // namespace

// ============================================================
// Successful runs
// ============================================================

TEST_F(DeliveryPipelineTest, WritesAllArtifacts) {
    DeliveryPipeline pipeline(shortTurnConfig());
    PipelineOutcome outcome = pipeline.run(request());
    ASSERT_TRUE(outcome.ok()) << outcome.message;

    EXPECT_TRUE(fs::exists(workDir / artifacts::kTrimmedAudio));
    EXPECT_TRUE(fs::exists(workDir / artifacts::kSegments));
    EXPECT_TRUE(fs::exists(workDir / artifacts::kMergedSegments));
    EXPECT_TRUE(fs::exists(workDir / artifacts::kSelected));
    EXPECT_TRUE(fs::exists(workDir / artifacts::kDeliveryMetrics));
    EXPECT_TRUE(fs::exists(workDir / artifacts::kReport));
    EXPECT_TRUE(fs::exists(workDir / artifacts::kRunManifest));
    EXPECT_TRUE(fs::exists(workDir / "clips/SPEAKER_00_0_3000.wav"));

    EXPECT_EQ(readFile(workDir / artifacts::kReport), outcome.reportText);

    const std::string runLog = readFile(workDir / artifacts::kRunLog);
    EXPECT_NE(runLog.find("[1/6]"), std::string::npos);
    EXPECT_NE(runLog.find("[6/6]"), std::string::npos);
}

TEST_F(DeliveryPipelineTest, AssignsRolesAndComputesMetrics) {
    DeliveryPipeline pipeline(shortTurnConfig());
    PipelineOutcome outcome = pipeline.run(request());
    ASSERT_TRUE(outcome.ok()) << outcome.message;

    // The trailing 0.4 s turn is dropped before merging
    EXPECT_EQ(outcome.segmentation.sorted.size(), 6u);
    EXPECT_EQ(outcome.segmentation.merged.size(), 5u);
    ASSERT_EQ(outcome.segmentation.selected.size(), 5u);
    ASSERT_EQ(outcome.analyses.size(), 5u);
    for (std::size_t i = 1; i < outcome.analyses.size(); ++i) {
        EXPECT_LE(outcome.analyses[i - 1].interval.start, outcome.analyses[i].interval.start);
    }

    ASSERT_EQ(outcome.summaries.size(), 4u);
    EXPECT_EQ(outcome.summaries[0].role, "Aff 1st Speaker");
    EXPECT_EQ(outcome.summaries[0].speaker, "SPEAKER_00");
    EXPECT_EQ(outcome.summaries[0].intervals.size(), 2u);
    EXPECT_EQ(outcome.summaries[1].role, "Neg 1st Speaker");
    EXPECT_EQ(outcome.summaries[1].speaker, "SPEAKER_01");
    EXPECT_EQ(outcome.summaries[2].role, "Aff 2nd Speaker");
    EXPECT_EQ(outcome.summaries[3].role, "Neg 2nd Speaker");
    EXPECT_EQ(outcome.summaries[3].speaker, "SPEAKER_03");

    nlohmann::json metrics = readJson(workDir / artifacts::kDeliveryMetrics);
    ASSERT_TRUE(metrics.is_array());
    ASSERT_EQ(metrics.size(), 5u);
    EXPECT_EQ(metrics[0]["speaker"], "SPEAKER_00");
    EXPECT_EQ(metrics[0]["role"], "Aff 1st Speaker");
    EXPECT_TRUE(metrics[0]["pitch_var"].is_number());
    EXPECT_GT(metrics[0]["speech_ratio"].get<double>(), 0.9);
    EXPECT_LT(metrics[0]["mean_db"].get<double>(), 0.0);
    EXPECT_TRUE(metrics[0]["tip"].is_string());

    const std::string text = outcome.reportText;
    EXPECT_NE(text.find("Aff 1st Speaker"), std::string::npos);
    EXPECT_NE(text.find("Neg 2nd Speaker"), std::string::npos);
    EXPECT_LT(text.find("Aff 1st Speaker"), text.find("Neg 1st Speaker"));
}

TEST_F(DeliveryPipelineTest, NegativeTeamOpens) {
    AnalysisConfig config = shortTurnConfig();
    config.roles.firstTeam = "neg";
    DeliveryPipeline pipeline(config);
    PipelineOutcome outcome = pipeline.run(request());
    ASSERT_TRUE(outcome.ok()) << outcome.message;

    ASSERT_EQ(outcome.summaries.size(), 4u);
    EXPECT_EQ(outcome.summaries[0].role, "Neg 1st Speaker");
    EXPECT_EQ(outcome.summaries[0].speaker, "SPEAKER_00");
    EXPECT_EQ(outcome.summaries[1].role, "Aff 1st Speaker");
    EXPECT_EQ(outcome.summaries[1].speaker, "SPEAKER_01");
}

TEST_F(DeliveryPipelineTest, RunManifestRecordsOutcome) {
    DeliveryPipeline pipeline(shortTurnConfig());
    PipelineOutcome outcome = pipeline.run(request());
    ASSERT_TRUE(outcome.ok()) << outcome.message;

    nlohmann::json manifest = readJson(workDir / artifacts::kRunManifest);
    EXPECT_EQ(manifest["program"], "podium_analyze");
    EXPECT_EQ(manifest["status"], "ok");
    EXPECT_EQ(manifest["error_code"], "OK");
    EXPECT_EQ(manifest["diarization_timeline"], "trimmed");
    EXPECT_EQ(manifest["intervals_selected"], 5);
    EXPECT_EQ(manifest["roles_reported"], 4);
    EXPECT_EQ(manifest["audio"], audioPath.string());
    ASSERT_TRUE(manifest["arguments"].is_array());
    EXPECT_EQ(manifest["arguments"].size(), 2u);
    EXPECT_TRUE(manifest["started_at"].is_string());
    EXPECT_GE(manifest["elapsed_sec"].get<double>(), 0.0);
}

TEST_F(DeliveryPipelineTest, ClipsCanBeDisabled) {
    AnalysisConfig config = shortTurnConfig();
    config.pipeline.writeClips = false;
    config.pipeline.writeTrimmed = false;
    DeliveryPipeline pipeline(config);
    PipelineOutcome outcome = pipeline.run(request());
    ASSERT_TRUE(outcome.ok()) << outcome.message;

    EXPECT_FALSE(fs::exists(workDir / artifacts::kClipsDir));
    EXPECT_FALSE(fs::exists(workDir / artifacts::kTrimmedAudio));
    EXPECT_TRUE(fs::exists(workDir / artifacts::kDeliveryMetrics));
}

// ============================================================
// Insufficient data and failures
// ============================================================

TEST_F(DeliveryPipelineTest, InsufficientDataWritesExplanation) {
    fs::create_directories(workDir / artifacts::kClipsDir);
    writeFile(workDir / artifacts::kDeliveryMetrics, "[]");
    writeFile(workDir / artifacts::kSelected, "[]");
    writeFile(workDir / artifacts::kClipsDir / "SPEAKER_09_0_1000.wav", "stale");

    DeliveryPipeline pipeline{AnalysisConfig()};
    PipelineOutcome outcome = pipeline.run(request());
    EXPECT_TRUE(outcome.insufficientData());
    EXPECT_EQ(toExitCode(outcome.code), 3);

    EXPECT_FALSE(fs::exists(workDir / artifacts::kDeliveryMetrics));
    EXPECT_FALSE(fs::exists(workDir / artifacts::kSelected));
    EXPECT_FALSE(fs::exists(workDir / artifacts::kClipsDir));
    ASSERT_TRUE(fs::exists(workDir / artifacts::kReport));
    EXPECT_NE(readFile(workDir / artifacts::kReport).find("60"), std::string::npos);

    nlohmann::json manifest = readJson(workDir / artifacts::kRunManifest);
    EXPECT_EQ(manifest["status"], "insufficient_data");
    EXPECT_EQ(manifest["error_code"], "SEGMENT_INSUFFICIENT_DATA");
}

TEST_F(DeliveryPipelineTest, ReusedWorkDirHoldsOnlyLatestRun) {
    ASSERT_TRUE(DeliveryPipeline(shortTurnConfig()).run(request()).ok());
    ASSERT_TRUE(fs::exists(workDir / artifacts::kSelected));
    ASSERT_TRUE(fs::exists(workDir / "clips/SPEAKER_00_0_3000.wav"));

    PipelineOutcome second = DeliveryPipeline{AnalysisConfig()}.run(request());
    EXPECT_TRUE(second.insufficientData());
    EXPECT_FALSE(fs::exists(workDir / artifacts::kSelected));
    EXPECT_FALSE(fs::exists(workDir / artifacts::kClipsDir));
    EXPECT_FALSE(fs::exists(workDir / artifacts::kDeliveryMetrics));
    EXPECT_TRUE(fs::exists(workDir / artifacts::kMergedSegments));
}

TEST_F(DeliveryPipelineTest, MissingAudioFails) {
    PipelineRequest req = request();
    req.audioPath = (tempDir / "missing.wav").string();
    PipelineOutcome outcome = DeliveryPipeline(shortTurnConfig()).run(req);

    EXPECT_EQ(outcome.code, ErrorCode::INPUT_AUDIO_NOT_FOUND);
    EXPECT_EQ(toExitCode(outcome.code), 2);
    nlohmann::json manifest = readJson(workDir / artifacts::kRunManifest);
    EXPECT_EQ(manifest["status"], "error");
    EXPECT_EQ(manifest["error_code"], "INPUT_AUDIO_NOT_FOUND");
}

TEST_F(DeliveryPipelineTest, SampleRateMismatchFails) {
    ASSERT_TRUE(audio::writeMono(audioPath.string(), waveform(sine(200.0, 2.0, 0.5, 22050), 22050)));
    PipelineOutcome outcome = DeliveryPipeline(shortTurnConfig()).run(request());
    EXPECT_EQ(outcome.code, ErrorCode::INPUT_SAMPLE_RATE_MISMATCH);
}

TEST_F(DeliveryPipelineTest, MalformedDiarizationFails) {
    writeFile(diarizationPath, "{\"segments\": [ {\"start\": 0, ");
    PipelineOutcome outcome = DeliveryPipeline(shortTurnConfig()).run(request());
    EXPECT_EQ(outcome.code, ErrorCode::INPUT_DIARIZATION_MALFORMED);
    EXPECT_FALSE(fs::exists(workDir / artifacts::kReport));
}

TEST_F(DeliveryPipelineTest, IntervalOutsideAudioFails) {
    writeFile(diarizationPath, R"({"segments": [
        {"start": 0.0, "end": 3.0, "speaker": "SPEAKER_00"},
        {"start": 20.0, "end": 30.0, "speaker": "SPEAKER_01"}
    ]})");
    PipelineOutcome outcome = DeliveryPipeline(shortTurnConfig()).run(request());
    EXPECT_EQ(outcome.code, ErrorCode::ANALYSIS_CLIP_OUT_OF_RANGE);
    EXPECT_EQ(toExitCode(outcome.code), 4);
    EXPECT_FALSE(fs::exists(workDir / artifacts::kDeliveryMetrics));
}

TEST_F(DeliveryPipelineTest, InvalidConfigFails) {
    AnalysisConfig config = shortTurnConfig();
    config.roles.firstTeam = "Gov";
    PipelineOutcome outcome = DeliveryPipeline(config).run(request());
    EXPECT_TRUE(isValidationError(outcome.code));
    EXPECT_FALSE(fs::exists(workDir / artifacts::kTrimmedAudio));
}

// ============================================================
// Clip naming
// ============================================================

TEST(DeliveryPipelineClipName, UsesMillisecondBounds) {
    EXPECT_EQ(DeliveryPipeline::clipFileName(Interval("SPEAKER_01", 61.2346, 130.0)),
              "clips/SPEAKER_01_61235_130000.wav");
}

TEST(DeliveryPipelineClipName, SanitizesSpeaker) {
    EXPECT_EQ(DeliveryPipeline::clipFileName(Interval("Dr. A/B", 0.0, 1.0)),
              "clips/Dr__A_B_0_1000.wav");
}
