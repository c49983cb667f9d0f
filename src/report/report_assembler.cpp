#include "report/report_assembler.h"

#include "logging/logger.h"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <map>
#include <spdlog/fmt/fmt.h>

namespace podium {
namespace report {

namespace {

std::string formatOptional(const std::optional<double>& value, int decimals) {
    if (!value) {
        return "n/a";
    }
    return fmt::format("{:.{}f}", *value, decimals);
}

nlohmann::json optionalToJson(const std::optional<double>& value) {
    if (!value) {
        return nullptr;
    }
    return *value;
}

std::optional<double> optionalFromJson(const nlohmann::json& record, const char* key) {
    if (!record.contains(key) || record[key].is_null()) {
        return std::nullopt;
    }
    return record[key].get<double>();
}

std::optional<double> meanOf(const std::vector<std::optional<double>>& values) {
    double sum = 0.0;
    std::size_t n = 0;
    for (const auto& v : values) {
        if (v) {
            sum += *v;
            ++n;
        }
    }
    if (n == 0) {
        return std::nullopt;
    }
    return sum / static_cast<double>(n);
}

}  // namespace

std::string formatClock(double seconds) {
    long long total = std::llround(std::max(seconds, 0.0));
    long long h = total / 3600;
    long long m = (total % 3600) / 60;
    long long s = total % 60;
    return fmt::format("{}:{:02d}:{:02d}", h, m, s);
}

std::vector<RoleSummary> ReportAssembler::summarize(const std::vector<IntervalAnalysis>& analyses,
                                                    const RoleAssignment& roles) const {
    std::map<std::size_t, std::vector<const IntervalAnalysis*>> grouped;
    for (const auto& a : analyses) {
        auto binding = roles.find(a.interval.speaker);
        if (!binding) {
            LOG_DEBUG("Report: {} has no role, left out of the text report", a.interval.speaker);
            continue;
        }
        grouped[binding->order].push_back(&a);
    }

    std::vector<RoleSummary> summaries;
    for (auto& entry : grouped) {
        auto& items = entry.second;
        std::stable_sort(items.begin(), items.end(),
                         [](const IntervalAnalysis* x, const IntervalAnalysis* y) {
                             return x->interval.start < y->interval.start;
                         });

        const auto binding = roles.find(items.front()->interval.speaker);
        RoleSummary summary;
        summary.role = binding->role;
        summary.order = entry.first;
        summary.speaker = binding->speaker;

        std::vector<std::optional<double>> pitch;
        std::vector<std::optional<double>> centroid;
        const IntervalAnalysis* longest = items.front();
        for (const auto* item : items) {
            summary.intervals.push_back(item->interval);
            summary.meanLoudnessDb += item->features.meanLoudnessDb;
            summary.dynamicRangeDb += item->features.dynamicRangeDb;
            summary.avgPauseSec += item->features.avgPauseSec;
            summary.speechRatio += item->features.speechRatio;
            pitch.push_back(item->features.pitchVariance);
            centroid.push_back(item->features.centroidVariance);
            // Items are in start order, so a strict comparison keeps the earliest on ties
            if (item->interval.duration() > longest->interval.duration()) {
                longest = item;
            }
        }
        const double n = static_cast<double>(items.size());
        summary.meanLoudnessDb /= n;
        summary.dynamicRangeDb /= n;
        summary.avgPauseSec /= n;
        summary.speechRatio /= n;
        summary.pitchVariance = meanOf(pitch);
        summary.centroidVariance = meanOf(centroid);
        summary.labels = longest->labels;
        summaries.push_back(std::move(summary));
    }
    return summaries;
}

std::string ReportAssembler::renderText(const std::vector<RoleSummary>& summaries) const {
    std::string out;
    for (const auto& s : summaries) {
        std::string times;
        for (const auto& iv : s.intervals) {
            if (!times.empty()) {
                times += ", ";
            }
            times += formatClock(iv.start) + "–" + formatClock(iv.end);
        }
        out += fmt::format("== {} Speeches: ({}) ==\n", s.role, times);
        out += fmt::format(" • Delivery: {}, {}, {}\n",
                           s.labels.expressiveness.value_or("n/a"), s.labels.passion,
                           s.labels.speed);
        out += fmt::format(" • Loudness: {:.1f} dBFS (range {:.1f} dB)\n", s.meanLoudnessDb,
                           s.dynamicRangeDb);
        out += fmt::format(" • Pitch var: {} | Centroid var: {}\n",
                           formatOptional(s.pitchVariance, 1),
                           formatOptional(s.centroidVariance, 1));
        out += fmt::format(" • Average pause: {:.2f} s\n", s.avgPauseSec);
        out += fmt::format(" • Tip: {}\n\n", s.labels.tip);
    }
    return out;
}

std::string ReportAssembler::insufficientDataText(double minMergedSec) {
    return fmt::format(
        "No merged segments ≥{:g}s found after diarization and trimming.\n"
        "Try a longer recording or reduce minMergedSec.",
        minMergedSec);
}

nlohmann::json ReportAssembler::toJson(const std::vector<IntervalAnalysis>& analyses) {
    nlohmann::json list = nlohmann::json::array();
    for (const auto& a : analyses) {
        nlohmann::json record;
        record["speaker"] = a.interval.speaker;
        record["role"] = a.role ? nlohmann::json(*a.role) : nlohmann::json(nullptr);
        record["start"] = a.interval.start;
        record["end"] = a.interval.end;
        record["mean_db"] = a.features.meanLoudnessDb;
        record["dynamic_range"] = a.features.dynamicRangeDb;
        record["pitch_var"] = optionalToJson(a.features.pitchVariance);
        record["centroid_var"] = optionalToJson(a.features.centroidVariance);
        record["avg_pause"] = a.features.avgPauseSec;
        record["speech_ratio"] = a.features.speechRatio;
        record["expressiveness"] = a.labels.expressiveness
                                       ? nlohmann::json(*a.labels.expressiveness)
                                       : nlohmann::json(nullptr);
        record["passion"] = a.labels.passion;
        record["speed"] = a.labels.speed;
        record["tip"] = a.labels.tip;
        list.push_back(std::move(record));
    }
    return list;
}

ErrorCode parseDeliveryMetrics(const nlohmann::json& document,
                               std::vector<IntervalAnalysis>& out, std::string& error) {
    out.clear();
    if (!document.is_array()) {
        error = "delivery metrics must be a JSON array";
        return ErrorCode::INPUT_METRICS_MALFORMED;
    }
    try {
        for (const auto& record : document) {
            IntervalAnalysis a;
            a.interval.speaker = record.at("speaker").get<std::string>();
            a.interval.start = record.at("start").get<double>();
            a.interval.end = record.at("end").get<double>();
            if (record.contains("role") && record["role"].is_string()) {
                a.role = record["role"].get<std::string>();
            }
            a.features.meanLoudnessDb = record.at("mean_db").get<double>();
            a.features.dynamicRangeDb = record.at("dynamic_range").get<double>();
            a.features.pitchVariance = optionalFromJson(record, "pitch_var");
            a.features.centroidVariance = optionalFromJson(record, "centroid_var");
            a.features.avgPauseSec = record.at("avg_pause").get<double>();
            a.features.speechRatio = record.value("speech_ratio", 0.0);
            if (record.contains("expressiveness") && record["expressiveness"].is_string()) {
                a.labels.expressiveness = record["expressiveness"].get<std::string>();
            }
            a.labels.passion = record.value("passion", std::string());
            a.labels.speed = record.value("speed", std::string());
            a.labels.tip = record.value("tip", std::string());
            out.push_back(std::move(a));
        }
    } catch (const nlohmann::json::exception& e) {
        error = std::string("invalid delivery metrics record: ") + e.what();
        out.clear();
        return ErrorCode::INPUT_METRICS_MALFORMED;
    }
    return ErrorCode::OK;
}

ErrorCode readDeliveryMetrics(const std::string& path, std::vector<IntervalAnalysis>& out,
                              std::string& error) {
    std::ifstream file(path);
    if (!file.is_open()) {
        error = "cannot open " + path;
        return ErrorCode::INPUT_METRICS_NOT_FOUND;
    }
    nlohmann::json document;
    try {
        file >> document;
    } catch (const nlohmann::json::exception& e) {
        error = "failed to parse " + path + ": " + e.what();
        return ErrorCode::INPUT_METRICS_MALFORMED;
    }
    return parseDeliveryMetrics(document, out, error);
}

}  // namespace report
}  // namespace podium
