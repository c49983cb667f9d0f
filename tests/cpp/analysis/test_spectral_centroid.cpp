/**
 * @file test_spectral_centroid.cpp
 * @brief Unit tests for the FFTW-based spectral centroid
 */

#include "analysis/spectral_centroid.h"
#include "test_helpers.h"

#include <gtest/gtest.h>
#include <memory>
#include <thread>

using podium::analysis::SpectralCentroid;
using podium_test::kSampleRate;

TEST(SpectralCentroid, PlanIsValid) {
    SpectralCentroid centroid(2048, 512);
    EXPECT_TRUE(centroid.valid());
    EXPECT_EQ(centroid.fftSize(), 2048u);
}

TEST(SpectralCentroid, SineCentroidIsItsFrequency) {
    auto tone = podium_test::sine(1000.0, 1.0);
    SpectralCentroid centroid(2048, 512);

    std::size_t silent = 99;
    auto values = centroid.compute(tone.data(), tone.size(), kSampleRate, &silent);
    ASSERT_GT(values.size(), 4u);
    EXPECT_EQ(silent, 0u);
    // Full frames only; the zero padded tail widens the spectrum
    for (std::size_t i = 0; i + 4 < values.size(); ++i) {
        EXPECT_NEAR(values[i], 1000.0, 25.0) << "frame " << i;
    }
}

TEST(SpectralCentroid, HigherToneHasHigherCentroid) {
    auto low = podium_test::sine(300.0, 0.5);
    auto high = podium_test::sine(3000.0, 0.5);
    SpectralCentroid centroid(2048, 512);
    auto lowValues = centroid.compute(low.data(), low.size(), kSampleRate);
    auto highValues = centroid.compute(high.data(), high.size(), kSampleRate);
    ASSERT_FALSE(lowValues.empty());
    ASSERT_FALSE(highValues.empty());
    EXPECT_LT(lowValues[1], highValues[1]);
}

TEST(SpectralCentroid, SilentFramesReportZero) {
    auto quiet = podium_test::silence(1.0);
    SpectralCentroid centroid(2048, 512);

    std::size_t silent = 0;
    auto values = centroid.compute(quiet.data(), quiet.size(), kSampleRate, &silent);
    ASSERT_FALSE(values.empty());
    EXPECT_EQ(silent, values.size());
    for (double v : values) {
        EXPECT_DOUBLE_EQ(v, 0.0);
    }
}

TEST(SpectralCentroid, EmptyInput) {
    SpectralCentroid centroid(2048, 512);
    std::size_t silent = 5;
    EXPECT_TRUE(centroid.compute(nullptr, 0, kSampleRate, &silent).empty());
    EXPECT_EQ(silent, 0u);
}

TEST(SpectralCentroid, InstancesOnSeveralThreads) {
    auto tone = podium_test::sine(800.0, 0.5);
    std::vector<double> results(4, 0.0);
    std::vector<std::thread> threads;
    for (std::size_t t = 0; t < results.size(); ++t) {
        threads.emplace_back([&tone, &results, t] {
            SpectralCentroid centroid(2048, 512);
            auto values = centroid.compute(tone.data(), tone.size(), kSampleRate);
            results[t] = values.empty() ? 0.0 : values[0];
        });
    }
    for (auto& th : threads) {
        th.join();
    }
    for (double r : results) {
        EXPECT_DOUBLE_EQ(r, results[0]);
        EXPECT_NEAR(r, 800.0, 25.0);
    }
}
