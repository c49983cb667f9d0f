#ifndef PODIUM_INTERVAL_H
#define PODIUM_INTERVAL_H

#include <string>
#include <vector>

namespace podium {

using SpeakerId = std::string;

// One contiguous speaking turn, times in seconds. end > start >= 0.
struct Interval {
    SpeakerId speaker;
    double start = 0.0;
    double end = 0.0;

    Interval() = default;
    Interval(SpeakerId spk, double s, double e) : speaker(std::move(spk)), start(s), end(e) {}

    double duration() const {
        return end > start ? end - start : 0.0;
    }

    bool operator==(const Interval& other) const {
        return speaker == other.speaker && start == other.start && end == other.end;
    }
    bool operator!=(const Interval& other) const {
        return !(*this == other);
    }
};

using IntervalList = std::vector<Interval>;

}  // namespace podium

#endif  // PODIUM_INTERVAL_H
