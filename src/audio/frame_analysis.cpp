#include "audio/frame_analysis.h"

#include <algorithm>
#include <cmath>
#include <numeric>

namespace podium {
namespace audio {

std::size_t frameCount(std::size_t sampleCount, std::size_t frameLength, std::size_t hop) {
    if (sampleCount == 0 || hop == 0) {
        return 0;
    }
    if (sampleCount <= frameLength) {
        return 1;
    }
    return 1 + (sampleCount - frameLength + hop - 1) / hop;
}

std::vector<double> frameRms(const float* samples, std::size_t count, std::size_t frameLength,
                             std::size_t hop) {
    const std::size_t frames = frameCount(count, frameLength, hop);
    std::vector<double> rms(frames, 0.0);
    if (frameLength == 0) {
        return rms;
    }
    for (std::size_t f = 0; f < frames; ++f) {
        const std::size_t begin = f * hop;
        const std::size_t end = std::min(count, begin + frameLength);
        double energy = 0.0;
        for (std::size_t i = begin; i < end; ++i) {
            const double s = samples[i];
            energy += s * s;
        }
        rms[f] = std::sqrt(energy / static_cast<double>(frameLength));
    }
    return rms;
}

std::vector<double> toDecibels(const std::vector<double>& values, double epsilon) {
    std::vector<double> db(values.size());
    std::transform(values.begin(), values.end(), db.begin(),
                   [epsilon](double v) { return 20.0 * std::log10(v + epsilon); });
    return db;
}

double percentile(std::vector<double> values, double q) {
    if (values.empty()) {
        return 0.0;
    }
    std::sort(values.begin(), values.end());
    q = std::clamp(q, 0.0, 100.0);
    const double rank = q / 100.0 * static_cast<double>(values.size() - 1);
    const std::size_t lo = static_cast<std::size_t>(std::floor(rank));
    const std::size_t hi = std::min(lo + 1, values.size() - 1);
    const double frac = rank - static_cast<double>(lo);
    return values[lo] + (values[hi] - values[lo]) * frac;
}

double mean(const std::vector<double>& values) {
    if (values.empty()) {
        return 0.0;
    }
    return std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());
}

double variance(const std::vector<double>& values) {
    if (values.empty()) {
        return 0.0;
    }
    const double m = mean(values);
    double acc = 0.0;
    for (double v : values) {
        acc += (v - m) * (v - m);
    }
    return acc / static_cast<double>(values.size());
}

double roundTo(double value, int decimals) {
    const double scale = std::pow(10.0, decimals);
    return std::round(value * scale) / scale;
}

std::vector<std::pair<std::size_t, std::size_t>> splitNonSilent(const float* samples,
                                                                std::size_t count, double topDb,
                                                                std::size_t frameLength,
                                                                std::size_t hop) {
    std::vector<std::pair<std::size_t, std::size_t>> intervals;
    std::vector<double> db = toDecibels(frameRms(samples, count, frameLength, hop), 1e-10);
    if (db.empty()) {
        return intervals;
    }
    const double threshold = *std::max_element(db.begin(), db.end()) - topDb;

    std::size_t f = 0;
    while (f < db.size()) {
        if (db[f] <= threshold) {
            ++f;
            continue;
        }
        std::size_t first = f;
        while (f < db.size() && db[f] > threshold) {
            ++f;
        }
        std::size_t begin = first * hop;
        std::size_t end = std::min(count, f * hop);
        if (end > begin) {
            intervals.emplace_back(begin, end);
        }
    }
    return intervals;
}

}  // namespace audio
}  // namespace podium
