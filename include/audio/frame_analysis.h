#ifndef PODIUM_FRAME_ANALYSIS_H
#define PODIUM_FRAME_ANALYSIS_H

#include <cstddef>
#include <utility>
#include <vector>

namespace podium {
namespace audio {

/**
 * @brief Number of non-centred frames covering @p sampleCount samples.
 *
 * Frame i spans [i * hop, i * hop + frameLength); the last frame is zero padded.
 * Returns 0 for an empty signal and at least 1 otherwise.
 */
std::size_t frameCount(std::size_t sampleCount, std::size_t frameLength, std::size_t hop);

// Per-frame RMS; samples past the end count as zeros
std::vector<double> frameRms(const float* samples, std::size_t count, std::size_t frameLength,
                             std::size_t hop);

// 20 * log10(value + epsilon) per element
std::vector<double> toDecibels(const std::vector<double>& values, double epsilon);

// Linear interpolation between closest ranks; q in [0, 100]. 0.0 for empty input.
double percentile(std::vector<double> values, double q);

double mean(const std::vector<double>& values);

// Population variance
double variance(const std::vector<double>& values);

// Half-up rounding to a fixed number of decimals
double roundTo(double value, int decimals);

/**
 * @brief Non-silent sample ranges, frame-wise against a threshold relative to the peak.
 *
 * A frame is non-silent when its dB value exceeds max(dB) - topDb. Each contiguous run
 * of non-silent frames maps to [first * hop, min(count, (last + 1) * hop)).
 */
std::vector<std::pair<std::size_t, std::size_t>> splitNonSilent(const float* samples,
                                                                std::size_t count, double topDb,
                                                                std::size_t frameLength,
                                                                std::size_t hop);

}  // namespace audio
}  // namespace podium

#endif  // PODIUM_FRAME_ANALYSIS_H
