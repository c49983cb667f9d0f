#ifndef PODIUM_SEGMENT_PROCESSOR_H
#define PODIUM_SEGMENT_PROCESSOR_H

#include "core/config_loader.h"
#include "segment/interval.h"

#include <vector>

namespace podium {

struct SpeakerTotal {
    SpeakerId speaker;
    double totalSec = 0.0;
    double firstStart = 0.0;
};

// Every intermediate stage, kept for the JSON audit artifacts
struct SegmentationResult {
    IntervalList sorted;    // Raw input sorted by start
    IntervalList filtered;  // After the minTurnSec filter
    IntervalList merged;    // After merging and the minMergedSec filter
    std::vector<SpeakerTotal> ranking;  // Top speakers, total time non-increasing
    IntervalList selected;  // Representative intervals, sorted by start

    bool insufficient() const {
        return selected.empty();
    }
};

/**
 * @brief Turns the raw diarization timeline into a small per-speaker sample.
 *
 * Each step is a pure function of its input so it can be tested on its own.
 */
class SegmentProcessor {
   public:
    explicit SegmentProcessor(const AnalysisConfig::SegmentationConfig& config);

    SegmentationResult process(const IntervalList& raw) const;

    static IntervalList sortByStart(IntervalList intervals);

    // Remove intervals shorter than minSec
    static IntervalList dropShort(const IntervalList& intervals, double minSec);

    // Merge consecutive same-speaker intervals separated by at most maxGapSec.
    // Input must be sorted by start.
    static IntervalList mergeAdjacent(const IntervalList& intervals, double maxGapSec);

    // Total time per speaker, descending; ties go to the earliest first start
    static std::vector<SpeakerTotal> rankSpeakers(const IntervalList& intervals,
                                                  std::size_t topK);

    // Up to perSpeaker longest intervals per ranked speaker, re-sorted by start
    static IntervalList selectLongest(const IntervalList& intervals,
                                      const std::vector<SpeakerTotal>& ranking,
                                      std::size_t perSpeaker);

   private:
    AnalysisConfig::SegmentationConfig config_;
};

}  // namespace podium

#endif  // PODIUM_SEGMENT_PROCESSOR_H
