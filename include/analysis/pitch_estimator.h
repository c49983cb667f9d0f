#pragma once

#include "core/config_loader.h"

#include <cstddef>
#include <memory>
#include <vector>

namespace podium {
namespace analysis {

// Fundamental frequency tracker. Implementations must be usable from one thread at a time;
// the feature workers each create their own instance.
class PitchEstimator {
   public:
    virtual ~PitchEstimator() = default;

    virtual const char* name() const = 0;

    // Per-frame f0 in Hz. Unvoiced or unreliable frames are 0.
    virtual std::vector<double> estimate(const float* samples, std::size_t count,
                                         int sampleRate) = 0;
};

/**
 * @brief YIN (de Cheveigne & Kawahara 2002) with an energy gate.
 *
 * Frames quieter than voicingFloorDb, or whose cumulative mean normalized difference never
 * drops below yinThreshold inside [minHz, maxHz], are reported as unvoiced.
 */
class YinPitchEstimator : public PitchEstimator {
   public:
    explicit YinPitchEstimator(const AnalysisConfig::PitchConfig& config);

    const char* name() const override {
        return "yin";
    }

    std::vector<double> estimate(const float* samples, std::size_t count,
                                 int sampleRate) override;

   private:
    double estimateFrame(const float* frame, std::size_t windowSize, std::size_t tauMin,
                         std::size_t tauMax, int sampleRate);

    AnalysisConfig::PitchConfig config_;
    std::vector<double> diff_;
    std::vector<float> frame_;
};

// Reports no voiced frames; pitch variance becomes null
class DisabledPitchEstimator : public PitchEstimator {
   public:
    const char* name() const override {
        return "none";
    }

    std::vector<double> estimate(const float*, std::size_t, int) override {
        return {};
    }
};

std::unique_ptr<PitchEstimator> createPitchEstimator(const AnalysisConfig::PitchConfig& config);

}  // namespace analysis
}  // namespace podium
