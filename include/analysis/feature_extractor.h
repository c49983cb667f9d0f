#ifndef PODIUM_FEATURE_EXTRACTOR_H
#define PODIUM_FEATURE_EXTRACTOR_H

#include "analysis/pitch_estimator.h"
#include "analysis/spectral_centroid.h"
#include "audio/audio_io.h"
#include "core/config_loader.h"
#include "segment/interval.h"

#include <memory>
#include <optional>
#include <utility>

namespace podium {
namespace analysis {

// Acoustic statistics for one interval, already rounded for reporting
struct FeatureVector {
    double meanLoudnessDb = 0.0;
    double dynamicRangeDb = 0.0;
    std::optional<double> pitchVariance;     // Hz^2; empty when no frame is voiced
    std::optional<double> centroidVariance;  // Hz^2; empty when every frame is silent
    double avgPauseSec = 0.0;
    double speechRatio = 0.0;
};

/**
 * @brief Computes a FeatureVector per interval.
 *
 * Holds FFT plans and scratch buffers, so one instance serves one thread.
 */
class FeatureExtractor {
   public:
    FeatureExtractor(const AnalysisConfig::FeatureConfig& features,
                     const AnalysisConfig::PitchConfig& pitch);

    // Features of a whole clip
    FeatureVector extract(const float* samples, std::size_t count, int sampleRate);

    /**
     * @brief Features of an interval cut from @p source.
     *
     * An end past the waveform is clamped. Throws AnalysisError when the interval starts
     * outside the waveform, the remaining clip is shorter than minClipSec, or FFTW failed.
     */
    FeatureVector extract(const audio::Waveform& source, const Interval& interval);

    // Sample range of @p interval inside @p source, after the same checks as extract()
    static std::pair<std::size_t, std::size_t> clipRange(const audio::Waveform& source,
                                                         const Interval& interval,
                                                         double minClipSec);

   private:
    AnalysisConfig::FeatureConfig config_;
    std::unique_ptr<PitchEstimator> pitch_;
    SpectralCentroid centroid_;
};

}  // namespace analysis
}  // namespace podium

#endif  // PODIUM_FEATURE_EXTRACTOR_H
