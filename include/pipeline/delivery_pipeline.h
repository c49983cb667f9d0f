#ifndef PODIUM_DELIVERY_PIPELINE_H
#define PODIUM_DELIVERY_PIPELINE_H

#include "core/config_loader.h"
#include "core/error_codes.h"
#include "report/report_assembler.h"
#include "segment/segment_processor.h"

#include <filesystem>
#include <string>
#include <vector>

namespace podium {

// Artifact names inside the work directory
namespace artifacts {
constexpr const char* kTrimmedAudio = "trimmed.wav";
constexpr const char* kSegments = "segments.json";
constexpr const char* kMergedSegments = "merged_segments.json";
constexpr const char* kSelected = "selected.json";
constexpr const char* kDeliveryMetrics = "delivery_metrics.json";
constexpr const char* kReport = "analyze_speech.txt";
constexpr const char* kRunManifest = "run.json";
constexpr const char* kRunLog = "podium.log";
constexpr const char* kClipsDir = "clips";
}  // namespace artifacts

struct PipelineRequest {
    std::string audioPath;
    std::string diarizationPath;
    std::filesystem::path workDir = ".";
    std::string program = "podium_analyze";
    std::vector<std::string> arguments;  // Recorded in run.json
};

struct PipelineOutcome {
    ErrorCode code = ErrorCode::OK;
    std::string message;
    SegmentationResult segmentation;
    std::vector<report::IntervalAnalysis> analyses;  // Sorted by interval start
    std::vector<report::RoleSummary> summaries;
    std::string reportText;
    double elapsedSec = 0.0;

    bool ok() const {
        return code == ErrorCode::OK;
    }
    bool insufficientData() const {
        return code == ErrorCode::SEGMENT_INSUFFICIENT_DATA;
    }
};

/**
 * @brief Batch run over one recording.
 *
 * load -> trim -> segment -> assign roles -> parallel feature extraction -> classify ->
 * report. Every run writes run.json, including failed ones. Insufficient data produces an
 * explanatory report instead of metrics.
 */
class DeliveryPipeline {
   public:
    explicit DeliveryPipeline(AnalysisConfig config);

    PipelineOutcome run(const PipelineRequest& request) const;

    // Relative clip path for an interval: clips/<speaker>_<startMs>_<endMs>.wav
    static std::string clipFileName(const Interval& interval);

   private:
    PipelineOutcome execute(const PipelineRequest& request) const;

    AnalysisConfig config_;
};

}  // namespace podium

#endif  // PODIUM_DELIVERY_PIPELINE_H
