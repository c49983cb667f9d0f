#include "analysis/spectral_centroid.h"

#include "audio/frame_analysis.h"
#include "logging/logger.h"

#include <algorithm>
#include <cmath>
#include <mutex>

namespace podium {
namespace analysis {

namespace {

constexpr double kPi = 3.14159265358979323846;

// Guards fftwf_plan_* and fftwf_destroy_plan, which share global planner state
std::mutex& plannerMutex() {
    static std::mutex mutex;
    return mutex;
}

}  // namespace

SpectralCentroid::SpectralCentroid(std::size_t fftSize, std::size_t hop)
    : fftSize_(fftSize), hop_(std::max<std::size_t>(1, hop)), window_(fftSize) {
    // Periodic Hann
    for (std::size_t i = 0; i < fftSize_; ++i) {
        window_[i] = static_cast<float>(
            0.5 - 0.5 * std::cos(2.0 * kPi * static_cast<double>(i) / static_cast<double>(fftSize_)));
    }

    std::lock_guard<std::mutex> lock(plannerMutex());
    input_ = fftwf_alloc_real(fftSize_);
    output_ = fftwf_alloc_complex(fftSize_ / 2 + 1);
    if (!input_ || !output_) {
        LOG_ERROR("SpectralCentroid: FFTW buffer allocation failed (size {})", fftSize_);
        return;
    }
    plan_ = fftwf_plan_dft_r2c_1d(static_cast<int>(fftSize_), input_, output_, FFTW_ESTIMATE);
    if (!plan_) {
        LOG_ERROR("SpectralCentroid: FFTW plan creation failed (size {})", fftSize_);
    }
}

SpectralCentroid::~SpectralCentroid() {
    std::lock_guard<std::mutex> lock(plannerMutex());
    if (plan_) {
        fftwf_destroy_plan(plan_);
    }
    if (input_) {
        fftwf_free(input_);
    }
    if (output_) {
        fftwf_free(output_);
    }
}

std::vector<double> SpectralCentroid::compute(const float* samples, std::size_t count,
                                              int sampleRate, std::size_t* silentFrames) {
    std::vector<double> centroids;
    if (silentFrames) {
        *silentFrames = 0;
    }
    if (!plan_ || count == 0 || sampleRate <= 0) {
        return centroids;
    }

    const std::size_t frames = audio::frameCount(count, fftSize_, hop_);
    const std::size_t bins = fftSize_ / 2 + 1;
    const double binHz = static_cast<double>(sampleRate) / static_cast<double>(fftSize_);
    centroids.assign(frames, 0.0);

    for (std::size_t f = 0; f < frames; ++f) {
        const std::size_t begin = f * hop_;
        const std::size_t available = std::min(fftSize_, count - begin);
        for (std::size_t i = 0; i < fftSize_; ++i) {
            input_[i] = i < available ? samples[begin + i] * window_[i] : 0.0f;
        }
        fftwf_execute(plan_);

        double weighted = 0.0;
        double total = 0.0;
        for (std::size_t k = 0; k < bins; ++k) {
            const double mag = std::hypot(output_[k][0], output_[k][1]);
            weighted += mag * static_cast<double>(k) * binHz;
            total += mag;
        }
        if (total > 0.0) {
            centroids[f] = weighted / total;
        } else if (silentFrames) {
            ++*silentFrames;
        }
    }
    return centroids;
}

}  // namespace analysis
}  // namespace podium
