#include "pipeline/delivery_pipeline.h"

#include "analysis/delivery_classifier.h"
#include "analysis/feature_extractor.h"
#include "audio/audio_io.h"
#include "audio/silence_trimmer.h"
#include "core/worker_pool.h"
#include "io/artifact_file.h"
#include "logging/logger.h"
#include "segment/diarization_reader.h"
#include "segment/role_assigner.h"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cmath>
#include <ctime>
#include <iomanip>
#include <memory>
#include <sstream>
#include <system_error>

namespace podium {

namespace fs = std::filesystem;

namespace {

std::string isoTimestamp(std::chrono::system_clock::time_point tp) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

PipelineOutcome& fail(PipelineOutcome& outcome, ErrorCode code, const std::string& message) {
    outcome.code = code;
    outcome.message = message;
    LOG_ERROR("{} ({}): {}", errorCodeToString(code), errorCodeToHex(code), message);
    return outcome;
}

const char* statusFor(const PipelineOutcome& outcome) {
    if (outcome.ok()) {
        return "ok";
    }
    if (outcome.insufficientData()) {
        return "insufficient_data";
    }
    return "error";
}

}  // namespace

DeliveryPipeline::DeliveryPipeline(AnalysisConfig config) : config_(std::move(config)) {}

std::string DeliveryPipeline::clipFileName(const Interval& interval) {
    const long long startMs = std::llround(interval.start * 1000.0);
    const long long endMs = std::llround(interval.end * 1000.0);
    std::string speaker = interval.speaker;
    for (char& c : speaker) {
        if (!(std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-')) {
            c = '_';
        }
    }
    return std::string(artifacts::kClipsDir) + "/" + speaker + "_" +
           std::to_string(startMs) + "_" + std::to_string(endMs) + ".wav";
}

PipelineOutcome DeliveryPipeline::run(const PipelineRequest& request) const {
    const auto startedAt = std::chrono::system_clock::now();
    const auto steadyStart = std::chrono::steady_clock::now();

    PipelineOutcome outcome = execute(request);

    outcome.elapsedSec =
        std::chrono::duration<double>(std::chrono::steady_clock::now() - steadyStart).count();

    std::error_code ec;
    if (fs::is_directory(request.workDir, ec)) {
        nlohmann::json manifest;
        manifest["program"] = request.program;
        manifest["status"] = statusFor(outcome);
        manifest["error_code"] = errorCodeToString(outcome.code);
        manifest["error_hex"] = errorCodeToHex(outcome.code);
        manifest["error_category"] = getErrorCategory(outcome.code);
        manifest["message"] = outcome.message;
        manifest["arguments"] = request.arguments;
        manifest["audio"] = request.audioPath;
        manifest["diarization"] = request.diarizationPath;
        manifest["diarization_timeline"] = diarizationTimelineToString(config_.pipeline.timeline);
        manifest["started_at"] = isoTimestamp(startedAt);
        manifest["finished_at"] = isoTimestamp(std::chrono::system_clock::now());
        manifest["elapsed_sec"] = std::round(outcome.elapsedSec * 1000.0) / 1000.0;
        manifest["intervals_selected"] = outcome.segmentation.selected.size();
        manifest["roles_reported"] = outcome.summaries.size();

        io::ArtifactFile runFile((request.workDir / artifacts::kRunManifest).string());
        if (!runFile.writeJsonAtomically(manifest) && outcome.ok()) {
            fail(outcome, ErrorCode::OUTPUT_WRITE_FAILED, "failed to write " + runFile.path());
        }
    }

    LOG_INFO("Finished in {:.1f} seconds ({})", outcome.elapsedSec, statusFor(outcome));
    return outcome;
}

PipelineOutcome DeliveryPipeline::execute(const PipelineRequest& request) const {
    PipelineOutcome outcome;

    std::string error;
    if (!validateAnalysisConfig(config_, error)) {
        return fail(outcome, ErrorCode::VALIDATION_INVALID_CONFIG, error);
    }

    // Work directory and stale outputs
    std::error_code ec;
    fs::create_directories(request.workDir, ec);
    if (ec || !fs::is_directory(request.workDir)) {
        return fail(outcome, ErrorCode::OUTPUT_WORK_DIR_FAILED,
                    "cannot create work directory " + request.workDir.string());
    }
    const fs::path& dir = request.workDir;
    logging::ScopedRunLog runLog((dir / artifacts::kRunLog).string());
    io::ArtifactFile reportFile((dir / artifacts::kReport).string());
    io::ArtifactFile metricsFile((dir / artifacts::kDeliveryMetrics).string());
    reportFile.removeIfExists();
    metricsFile.removeIfExists();
    io::ArtifactFile((dir / artifacts::kRunManifest).string()).removeIfExists();
    io::ArtifactFile((dir / artifacts::kSelected).string()).removeIfExists();
    fs::remove_all(dir / artifacts::kClipsDir, ec);
    if (ec) {
        return fail(outcome, ErrorCode::OUTPUT_WORK_DIR_FAILED,
                    "cannot clear " + (dir / artifacts::kClipsDir).string());
    }

    // [1/6] Load
    LOG_INFO("[1/6] Loading {}", request.audioPath);
    audio::Waveform original;
    ErrorCode code = audio::loadMono(request.audioPath, config_.sampleRate, original, error);
    if (code != ErrorCode::OK) {
        return fail(outcome, code, error);
    }
    LOG_INFO("     {:.2f} s at {} Hz", original.durationSec(), original.sampleRate);

    // [2/6] Trim
    LOG_INFO("[2/6] Trimming silence");
    audio::SilenceTrimmer trimmer(config_.trimmer);
    audio::TrimResult trimmed = trimmer.trim(original);
    if (config_.pipeline.writeTrimmed) {
        const std::string trimmedPath = (dir / artifacts::kTrimmedAudio).string();
        if (!audio::writeMono(trimmedPath, trimmed.audio)) {
            return fail(outcome, ErrorCode::OUTPUT_WRITE_FAILED, "failed to write " + trimmedPath);
        }
        LOG_INFO("Wrote {}", trimmedPath);
    }

    // [3/6] Segment
    LOG_INFO("[3/6] Reading diarization {}", request.diarizationPath);
    IntervalList raw;
    code = readDiarizationFile(request.diarizationPath, raw, error);
    if (code != ErrorCode::OK) {
        return fail(outcome, code, error);
    }

    SegmentProcessor processor(config_.segmentation);
    outcome.segmentation = processor.process(raw);
    const SegmentationResult& seg = outcome.segmentation;

    if (!io::ArtifactFile((dir / artifacts::kSegments).string())
             .writeJsonAtomically(intervalsToJson(seg.sorted)) ||
        !io::ArtifactFile((dir / artifacts::kMergedSegments).string())
             .writeJsonAtomically(intervalsToJson(seg.merged))) {
        return fail(outcome, ErrorCode::OUTPUT_WRITE_FAILED, "failed to write segment artifacts");
    }

    if (seg.insufficient()) {
        outcome.reportText = report::ReportAssembler::insufficientDataText(
            config_.segmentation.minMergedSec);
        if (!reportFile.writeTextAtomically(outcome.reportText)) {
            return fail(outcome, ErrorCode::OUTPUT_WRITE_FAILED, "failed to write " + reportFile.path());
        }
        outcome.code = ErrorCode::SEGMENT_INSUFFICIENT_DATA;
        outcome.message = "no merged segments long enough to analyse";
        LOG_WARN("No merged segments of sufficient length found");
        return outcome;
    }

    if (!io::ArtifactFile((dir / artifacts::kSelected).string())
             .writeJsonAtomically(intervalsToJson(seg.selected))) {
        return fail(outcome, ErrorCode::OUTPUT_WRITE_FAILED, "failed to write selected segments");
    }

    // [4/6] Roles
    LOG_INFO("[4/6] Assigning roles ({} first)", config_.roles.firstTeam);
    RoleAssigner assigner(config_.roles);
    RoleAssignment roles = assigner.assign(seg.selected);

    // [5/6] Features, one task per selected interval
    const audio::Waveform& source =
        config_.pipeline.timeline == DiarizationTimeline::Trimmed ? trimmed.audio : original;
    const bool writeClips = config_.pipeline.writeClips;
    if (writeClips) {
        fs::create_directories(dir / artifacts::kClipsDir, ec);
        if (ec) {
            return fail(outcome, ErrorCode::OUTPUT_WORK_DIR_FAILED,
                        "cannot create " + (dir / artifacts::kClipsDir).string());
        }
    }

    WorkerPool pool(config_.pipeline.workers);
    LOG_INFO("[5/6] Analysing {} segments on {} workers ({} timeline)", seg.selected.size(),
             std::min(pool.threadCount(), seg.selected.size()),
             diarizationTimelineToString(config_.pipeline.timeline));

    const AnalysisConfig& cfg = config_;
    try {
        outcome.analyses = pool.map<report::IntervalAnalysis>(
            seg.selected,
            [&cfg]() {
                return std::make_unique<analysis::FeatureExtractor>(cfg.features, cfg.pitch);
            },
            [&](std::unique_ptr<analysis::FeatureExtractor>& extractor, const Interval& interval,
                std::size_t) {
                report::IntervalAnalysis result;
                result.interval = interval;
                if (writeClips) {
                    auto range = analysis::FeatureExtractor::clipRange(source, interval,
                                                                       cfg.features.minClipSec);
                    const std::string clipPath = (dir / clipFileName(interval)).string();
                    if (!audio::writeMono(clipPath, source.samples.data() + range.first,
                                          range.second - range.first, source.sampleRate)) {
                        throw AnalysisError(ErrorCode::OUTPUT_WRITE_FAILED,
                                            "failed to write clip " + clipPath);
                    }
                }
                result.features = extractor->extract(source, interval);
                return result;
            });
    } catch (const AnalysisError& e) {
        return fail(outcome, e.code(), e.what());
    } catch (const std::exception& e) {
        return fail(outcome, ErrorCode::ANALYSIS_WORKER_FAILED, e.what());
    }

    std::stable_sort(outcome.analyses.begin(), outcome.analyses.end(),
                     [](const report::IntervalAnalysis& a, const report::IntervalAnalysis& b) {
                         return a.interval.start < b.interval.start;
                     });

    // [6/6] Classify and report
    LOG_INFO("[6/6] Classifying and writing report");
    analysis::DeliveryClassifier classifier(config_.classifier);
    for (auto& a : outcome.analyses) {
        a.labels = classifier.classify(a.features);
        if (auto binding = roles.find(a.interval.speaker)) {
            a.role = binding->role;
        }
        LOG_DEBUG("{} [{:.1f}-{:.1f}] {}, {}, {}", a.interval.speaker, a.interval.start,
                  a.interval.end, a.labels.expressiveness.value_or("n/a"), a.labels.passion,
                  a.labels.speed);
    }

    report::ReportAssembler assembler;
    outcome.summaries = assembler.summarize(outcome.analyses, roles);
    outcome.reportText = assembler.renderText(outcome.summaries);

    if (!metricsFile.writeJsonAtomically(report::ReportAssembler::toJson(outcome.analyses))) {
        return fail(outcome, ErrorCode::OUTPUT_WRITE_FAILED, "failed to write " + metricsFile.path());
    }
    if (!reportFile.writeTextAtomically(outcome.reportText)) {
        return fail(outcome, ErrorCode::OUTPUT_WRITE_FAILED, "failed to write " + reportFile.path());
    }

    LOG_INFO("Report written to {}", reportFile.path());
    return outcome;
}

}  // namespace podium
