#ifndef PODIUM_REPORT_ASSEMBLER_H
#define PODIUM_REPORT_ASSEMBLER_H

#include "analysis/delivery_classifier.h"
#include "analysis/feature_extractor.h"
#include "core/error_codes.h"
#include "segment/interval.h"
#include "segment/role_assigner.h"

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace podium {
namespace report {

// Result for one selected interval; one record in delivery_metrics.json
struct IntervalAnalysis {
    Interval interval;
    std::optional<std::string> role;
    analysis::FeatureVector features;
    analysis::DeliveryLabel labels;
};

// Aggregate for one role across its selected intervals
struct RoleSummary {
    std::string role;
    std::size_t order = 0;
    SpeakerId speaker;
    IntervalList intervals;  // Sorted by start
    double meanLoudnessDb = 0.0;
    double dynamicRangeDb = 0.0;
    std::optional<double> pitchVariance;     // Mean over intervals that have a value
    std::optional<double> centroidVariance;  // Mean over intervals that have a value
    double avgPauseSec = 0.0;
    double speechRatio = 0.0;
    analysis::DeliveryLabel labels;  // Taken from the longest interval
};

class ReportAssembler {
   public:
    // Groups by role in template order. Intervals of unassigned speakers are skipped.
    std::vector<RoleSummary> summarize(const std::vector<IntervalAnalysis>& analyses,
                                       const RoleAssignment& roles) const;

    std::string renderText(const std::vector<RoleSummary>& summaries) const;

    static std::string insufficientDataText(double minMergedSec);

    static nlohmann::json toJson(const std::vector<IntervalAnalysis>& analyses);
};

// h:mm:ss, rounded to the nearest second
std::string formatClock(double seconds);

ErrorCode parseDeliveryMetrics(const nlohmann::json& document,
                               std::vector<IntervalAnalysis>& out, std::string& error);

ErrorCode readDeliveryMetrics(const std::string& path, std::vector<IntervalAnalysis>& out,
                              std::string& error);

}  // namespace report
}  // namespace podium

#endif  // PODIUM_REPORT_ASSEMBLER_H
