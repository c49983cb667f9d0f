#include "analysis/feature_extractor.h"

#include "audio/frame_analysis.h"
#include "core/error_codes.h"
#include "logging/logger.h"

#include <algorithm>
#include <cmath>
#include <iterator>
#include <sstream>

namespace podium {
namespace analysis {

namespace {

std::string describe(const Interval& interval) {
    std::ostringstream oss;
    oss << interval.speaker << " [" << interval.start << "s, " << interval.end << "s]";
    return oss.str();
}

}  // namespace

FeatureExtractor::FeatureExtractor(const AnalysisConfig::FeatureConfig& features,
                                   const AnalysisConfig::PitchConfig& pitch)
    : config_(features),
      pitch_(createPitchEstimator(pitch)),
      centroid_(static_cast<std::size_t>(features.frameLength),
                static_cast<std::size_t>(features.hopLength)) {}

FeatureVector FeatureExtractor::extract(const float* samples, std::size_t count, int sampleRate) {
    if (!centroid_.valid()) {
        throw AnalysisError(ErrorCode::ANALYSIS_FFT_PLAN_FAILED,
                            "FFT plan unavailable for spectral centroid");
    }

    const std::size_t frameLength = static_cast<std::size_t>(config_.frameLength);
    const std::size_t hop = static_cast<std::size_t>(config_.hopLength);
    const double totalSec = static_cast<double>(count) / sampleRate;
    FeatureVector fv;

    // Loudness
    std::vector<double> db =
        audio::toDecibels(audio::frameRms(samples, count, frameLength, hop), config_.loudnessEpsilon);
    const double meanDb = audio::mean(db);
    const double range = db.empty() ? 0.0
                                    : audio::percentile(db, config_.rangeHighPercentile) -
                                          audio::percentile(db, config_.rangeLowPercentile);

    // Pitch: voiced frames only
    std::vector<double> f0 = pitch_->estimate(samples, count, sampleRate);
    std::vector<double> voiced;
    voiced.reserve(f0.size());
    std::copy_if(f0.begin(), f0.end(), std::back_inserter(voiced),
                 [](double hz) { return hz > 0.0 && std::isfinite(hz); });
    if (!voiced.empty()) {
        fv.pitchVariance = audio::roundTo(audio::variance(voiced), 1);
    }

    // Spectral centroid
    std::size_t silent = 0;
    std::vector<double> centroids = centroid_.compute(samples, count, sampleRate, &silent);
    if (!centroids.empty() && silent < centroids.size()) {
        fv.centroidVariance = audio::roundTo(audio::variance(centroids), 1);
    }

    // Pause structure
    auto intervals =
        audio::splitNonSilent(samples, count, config_.pauseTopDb, frameLength, hop);
    std::size_t speechSamples = 0;
    for (const auto& iv : intervals) {
        speechSamples += iv.second - iv.first;
    }
    const double speechSec = static_cast<double>(speechSamples) / sampleRate;
    const std::size_t gaps = intervals.size() > 1 ? intervals.size() - 1 : 1;
    const double avgPause = std::max(totalSec - speechSec, 0.0) / static_cast<double>(gaps);
    const double ratio = totalSec > 0.0 ? speechSec / totalSec : 0.0;

    fv.meanLoudnessDb = audio::roundTo(meanDb, 1);
    fv.dynamicRangeDb = audio::roundTo(range, 1);
    fv.avgPauseSec = audio::roundTo(avgPause, 2);
    fv.speechRatio = audio::roundTo(ratio, 3);

    LOG_TRACE("Features: {} voiced of {} pitch frames, {} silent of {} centroid frames, {} runs",
              voiced.size(), f0.size(), silent, centroids.size(), intervals.size());
    return fv;
}

std::pair<std::size_t, std::size_t> FeatureExtractor::clipRange(const audio::Waveform& source,
                                                                const Interval& interval,
                                                                double minClipSec) {
    const std::size_t n = source.size();
    if (interval.start < 0.0 || interval.end <= interval.start ||
        interval.start >= source.durationSec()) {
        throw AnalysisError(ErrorCode::ANALYSIS_CLIP_OUT_OF_RANGE,
                            "interval " + describe(interval) + " lies outside the " +
                                std::to_string(source.durationSec()) + "s waveform");
    }

    const std::size_t begin = audio::Utils::secondsToSample(interval.start, source.sampleRate, n);
    const std::size_t end = audio::Utils::secondsToSample(interval.end, source.sampleRate, n);
    if (interval.end > source.durationSec()) {
        LOG_WARN("Features: interval {} ends past the audio, clamped to {:.2f}s",
                 describe(interval), source.durationSec());
    }

    const double clipSec = static_cast<double>(end - begin) / source.sampleRate;
    if (end <= begin || clipSec < minClipSec) {
        throw AnalysisError(ErrorCode::ANALYSIS_CLIP_TOO_SHORT,
                            "interval " + describe(interval) + " leaves only " +
                                std::to_string(clipSec) + "s of audio");
    }
    return {begin, end};
}

FeatureVector FeatureExtractor::extract(const audio::Waveform& source, const Interval& interval) {
    auto range = clipRange(source, interval, config_.minClipSec);
    LOG_DEBUG("Features: analysing {} ({} samples)", describe(interval),
              range.second - range.first);
    return extract(source.samples.data() + range.first, range.second - range.first,
                   source.sampleRate);
}

}  // namespace analysis
}  // namespace podium
