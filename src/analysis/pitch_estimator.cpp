#include "analysis/pitch_estimator.h"

#include "audio/frame_analysis.h"
#include "logging/logger.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <string>

namespace podium {
namespace analysis {

namespace {

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

}  // namespace

YinPitchEstimator::YinPitchEstimator(const AnalysisConfig::PitchConfig& config)
    : config_(config) {}

std::vector<double> YinPitchEstimator::estimate(const float* samples, std::size_t count,
                                                int sampleRate) {
    std::vector<double> f0;
    if (count == 0 || sampleRate <= 0) {
        return f0;
    }

    const std::size_t frameLength = static_cast<std::size_t>(config_.frameLength);
    const std::size_t hop =
        std::max<std::size_t>(1, static_cast<std::size_t>(std::lround(config_.hopSec * sampleRate)));
    const std::size_t tauMin =
        std::max<std::size_t>(2, static_cast<std::size_t>(std::floor(sampleRate / config_.maxHz)));
    std::size_t tauMax = static_cast<std::size_t>(std::ceil(sampleRate / config_.minHz));
    // The integration window must keep at least tauMax samples
    tauMax = std::min(tauMax, frameLength / 2);
    if (tauMax <= tauMin) {
        LOG_ONCE(WARN, "Pitch: frame of {} samples too short for {}-{} Hz at {} Hz",
                 frameLength, config_.minHz, config_.maxHz, sampleRate);
        return f0;
    }
    const std::size_t windowSize = frameLength - tauMax;

    const std::size_t frames = audio::frameCount(count, frameLength, hop);
    f0.assign(frames, 0.0);
    frame_.assign(frameLength, 0.0f);
    diff_.assign(tauMax + 1, 0.0);

    for (std::size_t f = 0; f < frames; ++f) {
        const std::size_t begin = f * hop;
        const std::size_t available = std::min(frameLength, count - begin);
        std::fill(frame_.begin(), frame_.end(), 0.0f);
        std::copy(samples + begin, samples + begin + available, frame_.begin());

        double energy = 0.0;
        for (float s : frame_) {
            energy += static_cast<double>(s) * s;
        }
        const double rmsDb = 20.0 * std::log10(std::sqrt(energy / frameLength) + 1e-10);
        if (rmsDb < config_.voicingFloorDb) {
            continue;
        }
        f0[f] = estimateFrame(frame_.data(), windowSize, tauMin, tauMax, sampleRate);
    }
    return f0;
}

double YinPitchEstimator::estimateFrame(const float* frame, std::size_t windowSize,
                                        std::size_t tauMin, std::size_t tauMax, int sampleRate) {
    // Difference function
    diff_[0] = 0.0;
    for (std::size_t tau = 1; tau <= tauMax; ++tau) {
        double sum = 0.0;
        for (std::size_t j = 0; j < windowSize; ++j) {
            const double d = static_cast<double>(frame[j]) - frame[j + tau];
            sum += d * d;
        }
        diff_[tau] = sum;
    }

    // Cumulative mean normalized difference, in place
    double running = 0.0;
    diff_[0] = 1.0;
    for (std::size_t tau = 1; tau <= tauMax; ++tau) {
        running += diff_[tau];
        diff_[tau] = running > 0.0 ? diff_[tau] * static_cast<double>(tau) / running : 1.0;
    }

    std::size_t best = 0;
    for (std::size_t tau = tauMin; tau <= tauMax; ++tau) {
        if (diff_[tau] < config_.yinThreshold) {
            while (tau + 1 <= tauMax && diff_[tau + 1] < diff_[tau]) {
                ++tau;
            }
            best = tau;
            break;
        }
    }
    if (best == 0) {
        return 0.0;
    }

    // Parabolic interpolation around the dip
    double refined = static_cast<double>(best);
    if (best > 1 && best < tauMax) {
        const double a = diff_[best - 1];
        const double b = diff_[best];
        const double c = diff_[best + 1];
        const double denom = a - 2.0 * b + c;
        if (std::fabs(denom) > 1e-12) {
            refined += 0.5 * (a - c) / denom;
        }
    }
    if (refined <= 0.0) {
        return 0.0;
    }
    const double hz = sampleRate / refined;
    if (hz < config_.minHz || hz > config_.maxHz || !std::isfinite(hz)) {
        return 0.0;
    }
    return hz;
}

std::unique_ptr<PitchEstimator> createPitchEstimator(const AnalysisConfig::PitchConfig& config) {
    std::string method = toLower(config.method);

    if (method == "yin") {
        return std::make_unique<YinPitchEstimator>(config);
    }

    if (method == "none" || method == "disabled") {
        return std::make_unique<DisabledPitchEstimator>();
    }

    LOG_WARN("Pitch: Unknown method '{}' (falling back to yin)", config.method);
    return std::make_unique<YinPitchEstimator>(config);
}

}  // namespace analysis
}  // namespace podium
