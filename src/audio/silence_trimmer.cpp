#include "audio/silence_trimmer.h"

#include "audio/frame_analysis.h"
#include "logging/logger.h"

#include <algorithm>
#include <cmath>

namespace podium {
namespace audio {

namespace {

// Frame runs as inclusive [first, last] frame indices
using FrameRun = std::pair<std::size_t, std::size_t>;

std::vector<FrameRun> collectRuns(const std::vector<bool>& mask) {
    std::vector<FrameRun> runs;
    std::size_t i = 0;
    while (i < mask.size()) {
        if (!mask[i]) {
            ++i;
            continue;
        }
        std::size_t first = i;
        while (i < mask.size() && mask[i]) {
            ++i;
        }
        runs.emplace_back(first, i - 1);
    }
    return runs;
}

}  // namespace

SilenceTrimmer::SilenceTrimmer(const AnalysisConfig::TrimmerConfig& config) : config_(config) {}

double SilenceTrimmer::computeThreshold(const std::vector<double>& frameDb) const {
    if (config_.mode == ThresholdMode::Absolute) {
        return config_.absoluteFloorDb;
    }
    return percentile(frameDb, config_.referencePercentile) - config_.relativeDropDb;
}

TrimResult SilenceTrimmer::trim(const Waveform& input) const {
    TrimResult result;
    result.audio = input;
    result.unchanged = true;
    if (input.empty() || input.sampleRate <= 0) {
        return result;
    }

    const int sr = input.sampleRate;
    const std::size_t hop =
        std::max<std::size_t>(1, static_cast<std::size_t>(sr * config_.hopMs / 1000.0f));
    const std::size_t win =
        std::max<std::size_t>(1, static_cast<std::size_t>(sr * config_.frameMs / 1000.0f));
    const std::size_t n = input.size();

    std::vector<double> db = toDecibels(frameRms(input.samples.data(), n, win, hop), 1e-10);
    const double threshold = computeThreshold(db);
    result.thresholdDb = threshold;

    std::vector<bool> mask(db.size());
    for (std::size_t i = 0; i < db.size(); ++i) {
        mask[i] = db[i] > threshold && db[i] > config_.silenceFloorDb;
    }

    std::vector<FrameRun> runs = collectRuns(mask);
    if (runs.empty()) {
        LOG_INFO("Trimmer: no speech above {:.1f} dB, keeping original audio", threshold);
        return result;
    }

    // Map frame runs to sample ranges, bridging pauses shorter than minPauseSec.
    // A pause is the span covered by the silent frames between two runs.
    const std::size_t pauseSamples = static_cast<std::size_t>(config_.minPauseSec * sr);
    std::vector<std::pair<std::size_t, std::size_t>> ranges;
    for (std::size_t r = 0; r < runs.size(); ++r) {
        const FrameRun& run = runs[r];
        std::size_t s = run.first * hop;
        std::size_t e = std::min(n, run.second * hop + win);
        if (r > 0) {
            const std::size_t silentFrames = run.first - runs[r - 1].second - 1;
            const std::size_t pause = (silentFrames - 1) * hop + win;
            if (pause < pauseSamples) {
                ranges.back().second = std::max(ranges.back().second, e);
                continue;
            }
        }
        ranges.emplace_back(s, e);
    }

    const std::size_t minSpeechSamples = static_cast<std::size_t>(config_.minSpeechSec * sr);
    ranges.erase(std::remove_if(ranges.begin(), ranges.end(),
                                [minSpeechSamples](const std::pair<std::size_t, std::size_t>& r) {
                                    return r.second - r.first < minSpeechSamples;
                                }),
                 ranges.end());

    if (ranges.empty()) {
        LOG_INFO("Trimmer: all speech runs shorter than {:.2f} s, keeping original audio",
                 config_.minSpeechSec);
        return result;
    }

    std::size_t kept = 0;
    for (const auto& r : ranges) {
        kept += r.second - r.first;
    }
    if (kept == n) {
        LOG_DEBUG("Trimmer: nothing to trim");
        result.keptRanges = std::move(ranges);
        return result;
    }

    std::vector<float> out;
    out.reserve(kept);
    for (const auto& r : ranges) {
        out.insert(out.end(), input.samples.begin() + static_cast<std::ptrdiff_t>(r.first),
                   input.samples.begin() + static_cast<std::ptrdiff_t>(r.second));
    }

    LOG_INFO("Trimmer: {} mode, threshold {:.1f} dB, {} runs kept, {:.2f} s -> {:.2f} s",
             thresholdModeToString(config_.mode), threshold, ranges.size(), input.durationSec(),
             static_cast<double>(kept) / sr);

    result.audio = Waveform(std::move(out), sr);
    result.keptRanges = std::move(ranges);
    result.unchanged = false;
    return result;
}

}  // namespace audio
}  // namespace podium
