/**
 * @file test_feature_extractor.cpp
 * @brief Unit tests for per-interval acoustic features
 */

#include "analysis/feature_extractor.h"
#include "test_helpers.h"

#include <gtest/gtest.h>

using namespace podium;
using namespace podium::analysis;
using podium_test::append;
using podium_test::kSampleRate;
using podium_test::silence;
using podium_test::sine;

class FeatureExtractorTest : public ::testing::Test {
   protected:
    AnalysisConfig config;
    FeatureExtractor extractor{config.features, config.pitch};
};

// ============================================================
// Whole clips
// ============================================================

TEST_F(FeatureExtractorTest, SteadyTone) {
    auto tone = sine(200.0, 2.0, 0.5);
    FeatureVector fv = extractor.extract(tone.data(), tone.size(), kSampleRate);

    // 0.5 amplitude sine: RMS 0.354, about -9 dBFS
    EXPECT_NEAR(fv.meanLoudnessDb, -9.0, 0.5);
    EXPECT_LT(fv.dynamicRangeDb, 1.0);
    ASSERT_TRUE(fv.pitchVariance.has_value());
    EXPECT_LT(*fv.pitchVariance, 50.0);
    ASSERT_TRUE(fv.centroidVariance.has_value());
    EXPECT_GT(fv.speechRatio, 0.9);
    EXPECT_LE(fv.speechRatio, 1.0);
    EXPECT_LT(fv.avgPauseSec, 0.2);
}

TEST_F(FeatureExtractorTest, PausesBetweenBursts) {
    std::vector<float> samples = sine(200.0, 1.0);
    append(samples, silence(1.0));
    append(samples, sine(200.0, 1.0));

    FeatureVector fv = extractor.extract(samples.data(), samples.size(), kSampleRate);
    EXPECT_NEAR(fv.speechRatio, 2.0 / 3.0, 0.1);
    EXPECT_NEAR(fv.avgPauseSec, 1.0, 0.2);
    EXPECT_GT(fv.dynamicRangeDb, 40.0);
}

TEST_F(FeatureExtractorTest, SilentClipHasNullSpectralAndPitchStats) {
    auto quiet = silence(1.0);
    FeatureVector fv = extractor.extract(quiet.data(), quiet.size(), kSampleRate);

    EXPECT_FALSE(fv.pitchVariance.has_value());
    EXPECT_FALSE(fv.centroidVariance.has_value());
    // 20 * log10(1e-6)
    EXPECT_DOUBLE_EQ(fv.meanLoudnessDb, -120.0);
    EXPECT_DOUBLE_EQ(fv.dynamicRangeDb, 0.0);
}

TEST_F(FeatureExtractorTest, ValuesAreRounded) {
    std::vector<float> samples = sine(180.0, 1.0, 0.3);
    append(samples, sine(260.0, 1.0, 0.6));
    FeatureVector fv = extractor.extract(samples.data(), samples.size(), kSampleRate);

    EXPECT_DOUBLE_EQ(fv.meanLoudnessDb, audio::roundTo(fv.meanLoudnessDb, 1));
    EXPECT_DOUBLE_EQ(fv.dynamicRangeDb, audio::roundTo(fv.dynamicRangeDb, 1));
    EXPECT_DOUBLE_EQ(fv.avgPauseSec, audio::roundTo(fv.avgPauseSec, 2));
    EXPECT_DOUBLE_EQ(fv.speechRatio, audio::roundTo(fv.speechRatio, 3));
    ASSERT_TRUE(fv.pitchVariance.has_value());
    EXPECT_DOUBLE_EQ(*fv.pitchVariance, audio::roundTo(*fv.pitchVariance, 1));
    // Two distinct pitches give a large variance (about 40^2 Hz^2)
    EXPECT_GT(*fv.pitchVariance, 1000.0);
}

TEST(FeatureExtractor, DisabledPitchLeavesVarianceNull) {
    AnalysisConfig config;
    config.pitch.method = "none";
    FeatureExtractor extractor(config.features, config.pitch);
    auto tone = sine(200.0, 1.0);
    FeatureVector fv = extractor.extract(tone.data(), tone.size(), kSampleRate);
    EXPECT_FALSE(fv.pitchVariance.has_value());
    EXPECT_TRUE(fv.centroidVariance.has_value());
}

// ============================================================
// Intervals
// ============================================================

TEST(FeatureExtractorClip, RangeInsideWaveform) {
    audio::Waveform source = podium_test::waveform(sine(200.0, 10.0));
    auto range = FeatureExtractor::clipRange(source, Interval("A", 2.0, 4.5), 0.5);
    EXPECT_EQ(range.first, 32000u);
    EXPECT_EQ(range.second, 72000u);
}

TEST(FeatureExtractorClip, EndPastAudioIsClamped) {
    audio::Waveform source = podium_test::waveform(sine(200.0, 10.0));
    auto range = FeatureExtractor::clipRange(source, Interval("A", 5.0, 12.0), 0.5);
    EXPECT_EQ(range.first, 80000u);
    EXPECT_EQ(range.second, source.size());
}

TEST(FeatureExtractorClip, StartPastAudioThrows) {
    audio::Waveform source = podium_test::waveform(sine(200.0, 10.0));
    try {
        FeatureExtractor::clipRange(source, Interval("A", 11.0, 12.0), 0.5);
        FAIL() << "expected AnalysisError";
    } catch (const AnalysisError& e) {
        EXPECT_EQ(e.code(), ErrorCode::ANALYSIS_CLIP_OUT_OF_RANGE);
    }
}

TEST(FeatureExtractorClip, TooShortAfterClampThrows) {
    audio::Waveform source = podium_test::waveform(sine(200.0, 10.0));
    try {
        FeatureExtractor::clipRange(source, Interval("A", 9.8, 12.0), 0.5);
        FAIL() << "expected AnalysisError";
    } catch (const AnalysisError& e) {
        EXPECT_EQ(e.code(), ErrorCode::ANALYSIS_CLIP_TOO_SHORT);
    }
    EXPECT_THROW(FeatureExtractor::clipRange(source, Interval("A", 1.0, 1.2), 0.5), AnalysisError);
}

TEST(FeatureExtractorClip, ExtractIntervalMatchesSlice) {
    std::vector<float> samples = silence(2.0);
    append(samples, sine(250.0, 3.0));
    audio::Waveform source = podium_test::waveform(samples);

    AnalysisConfig config;
    FeatureExtractor extractor(config.features, config.pitch);
    FeatureVector fromInterval = extractor.extract(source, Interval("A", 2.0, 5.0));
    FeatureVector fromSlice =
        extractor.extract(samples.data() + 32000, samples.size() - 32000, kSampleRate);

    EXPECT_DOUBLE_EQ(fromInterval.meanLoudnessDb, fromSlice.meanLoudnessDb);
    EXPECT_DOUBLE_EQ(fromInterval.speechRatio, fromSlice.speechRatio);
    EXPECT_EQ(fromInterval.pitchVariance, fromSlice.pitchVariance);
}
