#include "segment/segment_processor.h"

#include "logging/logger.h"

#include <algorithm>
#include <iterator>
#include <unordered_map>

namespace podium {

SegmentProcessor::SegmentProcessor(const AnalysisConfig::SegmentationConfig& config)
    : config_(config) {}

IntervalList SegmentProcessor::sortByStart(IntervalList intervals) {
    std::stable_sort(intervals.begin(), intervals.end(),
                     [](const Interval& a, const Interval& b) { return a.start < b.start; });
    return intervals;
}

IntervalList SegmentProcessor::dropShort(const IntervalList& intervals, double minSec) {
    IntervalList kept;
    kept.reserve(intervals.size());
    std::copy_if(intervals.begin(), intervals.end(), std::back_inserter(kept),
                 [minSec](const Interval& iv) { return iv.duration() >= minSec; });
    return kept;
}

IntervalList SegmentProcessor::mergeAdjacent(const IntervalList& intervals, double maxGapSec) {
    IntervalList merged;
    merged.reserve(intervals.size());
    for (const auto& iv : intervals) {
        if (!merged.empty() && merged.back().speaker == iv.speaker &&
            iv.start - merged.back().end <= maxGapSec) {
            merged.back().end = std::max(merged.back().end, iv.end);
        } else {
            merged.push_back(iv);
        }
    }
    return merged;
}

std::vector<SpeakerTotal> SegmentProcessor::rankSpeakers(const IntervalList& intervals,
                                                         std::size_t topK) {
    std::vector<SpeakerTotal> totals;
    std::unordered_map<SpeakerId, std::size_t> index;
    for (const auto& iv : intervals) {
        auto it = index.find(iv.speaker);
        if (it == index.end()) {
            index.emplace(iv.speaker, totals.size());
            totals.push_back({iv.speaker, iv.duration(), iv.start});
        } else {
            SpeakerTotal& t = totals[it->second];
            t.totalSec += iv.duration();
            t.firstStart = std::min(t.firstStart, iv.start);
        }
    }

    std::sort(totals.begin(), totals.end(), [](const SpeakerTotal& a, const SpeakerTotal& b) {
        if (a.totalSec != b.totalSec) {
            return a.totalSec > b.totalSec;
        }
        if (a.firstStart != b.firstStart) {
            return a.firstStart < b.firstStart;
        }
        return a.speaker < b.speaker;
    });
    if (totals.size() > topK) {
        totals.resize(topK);
    }
    return totals;
}

IntervalList SegmentProcessor::selectLongest(const IntervalList& intervals,
                                             const std::vector<SpeakerTotal>& ranking,
                                             std::size_t perSpeaker) {
    IntervalList selected;
    for (const auto& entry : ranking) {
        IntervalList own;
        for (const auto& iv : intervals) {
            if (iv.speaker == entry.speaker) {
                own.push_back(iv);
            }
        }
        std::stable_sort(own.begin(), own.end(), [](const Interval& a, const Interval& b) {
            if (a.duration() != b.duration()) {
                return a.duration() > b.duration();
            }
            return a.start < b.start;
        });
        if (own.size() > perSpeaker) {
            own.resize(perSpeaker);
        }
        selected.insert(selected.end(), own.begin(), own.end());
    }
    return sortByStart(std::move(selected));
}

SegmentationResult SegmentProcessor::process(const IntervalList& raw) const {
    SegmentationResult result;
    result.sorted = sortByStart(raw);
    result.filtered = dropShort(result.sorted, config_.minTurnSec);
    result.merged =
        dropShort(mergeAdjacent(result.filtered, config_.maxMergeGapSec), config_.minMergedSec);

    LOG_INFO("Segments: {} raw, {} >= {:.1f}s, {} merged >= {:.1f}s", result.sorted.size(),
             result.filtered.size(), config_.minTurnSec, result.merged.size(),
             config_.minMergedSec);

    if (result.merged.empty()) {
        LOG_WARN("Segments: no merged segments survived filtering");
        return result;
    }

    result.ranking =
        rankSpeakers(result.merged, static_cast<std::size_t>(config_.topSpeakers));
    for (const auto& entry : result.ranking) {
        LOG_DEBUG("Segments: {} total {:.1f}s (first at {:.1f}s)", entry.speaker, entry.totalSec,
                  entry.firstStart);
    }

    result.selected = selectLongest(result.merged, result.ranking,
                                    static_cast<std::size_t>(config_.segmentsPerSpeaker));
    LOG_INFO("Segments: selected {} intervals from {} speakers", result.selected.size(),
             result.ranking.size());
    return result;
}

}  // namespace podium
