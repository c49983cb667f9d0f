#ifndef PODIUM_SILENCE_TRIMMER_H
#define PODIUM_SILENCE_TRIMMER_H

#include "audio/audio_io.h"
#include "core/config_loader.h"

#include <cstddef>
#include <utility>
#include <vector>

namespace podium {
namespace audio {

struct TrimResult {
    Waveform audio;
    std::vector<std::pair<std::size_t, std::size_t>> keptRanges;  // Sample ranges of the input
    double thresholdDb = 0.0;
    bool unchanged = false;  // Nothing detected as speech, or nothing removed
};

/**
 * @brief Removes near-silent spans from a mono waveform.
 *
 * Frame energy (dB) is compared against a fixed floor or against a reference percentile
 * minus relativeDropDb. Speech runs separated by less than minPauseSec are bridged, runs
 * shorter than minSpeechSec are dropped, and the survivors are concatenated in order.
 * If no frame is speech the input is returned unchanged.
 */
class SilenceTrimmer {
   public:
    explicit SilenceTrimmer(const AnalysisConfig::TrimmerConfig& config);

    TrimResult trim(const Waveform& input) const;

    // Speech/silence threshold for a set of frame dB values
    double computeThreshold(const std::vector<double>& frameDb) const;

    const AnalysisConfig::TrimmerConfig& config() const {
        return config_;
    }

   private:
    AnalysisConfig::TrimmerConfig config_;
};

}  // namespace audio
}  // namespace podium

#endif  // PODIUM_SILENCE_TRIMMER_H
