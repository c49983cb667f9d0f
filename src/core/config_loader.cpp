#include "core/config_loader.h"

#include "logging/logger.h"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <nlohmann/json.hpp>

namespace podium {

namespace {

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

// Reads key into target when present and numeric; leaves the default otherwise.
template <typename T>
void readNumber(const nlohmann::json& section, const char* key, T& target) {
    if (section.contains(key) && section[key].is_number()) {
        target = section[key].get<T>();
    }
}

void readBool(const nlohmann::json& section, const char* key, bool& target) {
    if (section.contains(key) && section[key].is_boolean()) {
        target = section[key].get<bool>();
    }
}

void readString(const nlohmann::json& section, const char* key, std::string& target) {
    if (section.contains(key) && section[key].is_string()) {
        target = section[key].get<std::string>();
    }
}

template <typename T>
T positiveOr(T value, T fallback, const char* name, bool verbose) {
    if (value > T{0}) {
        return value;
    }
    if (verbose) {
        LOG_WARN("Config: {} must be positive (got {}), using {}", name, value, fallback);
    }
    return fallback;
}

template <typename T>
T nonNegativeOr(T value, T fallback, const char* name, bool verbose) {
    if (value >= T{0}) {
        return value;
    }
    if (verbose) {
        LOG_WARN("Config: {} must not be negative (got {}), using {}", name, value, fallback);
    }
    return fallback;
}

void parseTrimmer(const nlohmann::json& t, AnalysisConfig::TrimmerConfig& out, bool verbose) {
    const AnalysisConfig::TrimmerConfig defaults;
    if (t.contains("mode") && t["mode"].is_string()) {
        std::string mode = t["mode"].get<std::string>();
        out.mode = parseThresholdMode(mode);
        std::string lower = toLower(mode);
        if (lower != "absolute" && lower != "adaptive" && verbose) {
            LOG_WARN("Config: Unsupported trimmer.mode '{}', falling back to 'adaptive'", mode);
        }
    }
    readNumber(t, "frameMs", out.frameMs);
    readNumber(t, "hopMs", out.hopMs);
    readNumber(t, "absoluteFloorDb", out.absoluteFloorDb);
    readNumber(t, "relativeDropDb", out.relativeDropDb);
    readNumber(t, "referencePercentile", out.referencePercentile);
    readNumber(t, "silenceFloorDb", out.silenceFloorDb);
    readNumber(t, "minPauseSec", out.minPauseSec);
    readNumber(t, "minSpeechSec", out.minSpeechSec);

    out.frameMs = positiveOr(out.frameMs, defaults.frameMs, "trimmer.frameMs", verbose);
    out.hopMs = positiveOr(out.hopMs, defaults.hopMs, "trimmer.hopMs", verbose);
    out.minPauseSec =
        nonNegativeOr(out.minPauseSec, defaults.minPauseSec, "trimmer.minPauseSec", verbose);
    out.minSpeechSec =
        nonNegativeOr(out.minSpeechSec, defaults.minSpeechSec, "trimmer.minSpeechSec", verbose);
    out.referencePercentile = std::clamp(out.referencePercentile, 0.0f, 100.0f);
}

void parseSegmentation(const nlohmann::json& s, AnalysisConfig::SegmentationConfig& out,
                       bool verbose) {
    const AnalysisConfig::SegmentationConfig defaults;
    readNumber(s, "minTurnSec", out.minTurnSec);
    readNumber(s, "maxMergeGapSec", out.maxMergeGapSec);
    readNumber(s, "minMergedSec", out.minMergedSec);
    readNumber(s, "topSpeakers", out.topSpeakers);
    readNumber(s, "segmentsPerSpeaker", out.segmentsPerSpeaker);

    out.minTurnSec =
        nonNegativeOr(out.minTurnSec, defaults.minTurnSec, "segmentation.minTurnSec", verbose);
    out.maxMergeGapSec = nonNegativeOr(out.maxMergeGapSec, defaults.maxMergeGapSec,
                                       "segmentation.maxMergeGapSec", verbose);
    out.minMergedSec = nonNegativeOr(out.minMergedSec, defaults.minMergedSec,
                                     "segmentation.minMergedSec", verbose);
    out.topSpeakers =
        positiveOr(out.topSpeakers, defaults.topSpeakers, "segmentation.topSpeakers", verbose);
    out.segmentsPerSpeaker = positiveOr(out.segmentsPerSpeaker, defaults.segmentsPerSpeaker,
                                        "segmentation.segmentsPerSpeaker", verbose);
}

void parseFeatures(const nlohmann::json& f, AnalysisConfig::FeatureConfig& out, bool verbose) {
    const AnalysisConfig::FeatureConfig defaults;
    readNumber(f, "frameLength", out.frameLength);
    readNumber(f, "hopLength", out.hopLength);
    readNumber(f, "loudnessEpsilon", out.loudnessEpsilon);
    readNumber(f, "rangeLowPercentile", out.rangeLowPercentile);
    readNumber(f, "rangeHighPercentile", out.rangeHighPercentile);
    readNumber(f, "pauseTopDb", out.pauseTopDb);
    readNumber(f, "minClipSec", out.minClipSec);

    out.frameLength =
        positiveOr(out.frameLength, defaults.frameLength, "features.frameLength", verbose);
    out.hopLength = positiveOr(out.hopLength, defaults.hopLength, "features.hopLength", verbose);
    out.loudnessEpsilon = positiveOr(out.loudnessEpsilon, defaults.loudnessEpsilon,
                                     "features.loudnessEpsilon", verbose);
    out.pauseTopDb = positiveOr(out.pauseTopDb, defaults.pauseTopDb, "features.pauseTopDb", verbose);
    out.rangeLowPercentile = std::clamp(out.rangeLowPercentile, 0.0, 100.0);
    out.rangeHighPercentile = std::clamp(out.rangeHighPercentile, 0.0, 100.0);
    if (out.rangeLowPercentile > out.rangeHighPercentile) {
        if (verbose) {
            LOG_WARN("Config: features.rangeLowPercentile > rangeHighPercentile, using defaults");
        }
        out.rangeLowPercentile = defaults.rangeLowPercentile;
        out.rangeHighPercentile = defaults.rangeHighPercentile;
    }
}

void parsePitch(const nlohmann::json& p, AnalysisConfig::PitchConfig& out, bool verbose) {
    const AnalysisConfig::PitchConfig defaults;
    readString(p, "method", out.method);
    readNumber(p, "minHz", out.minHz);
    readNumber(p, "maxHz", out.maxHz);
    readNumber(p, "hopSec", out.hopSec);
    readNumber(p, "frameLength", out.frameLength);
    readNumber(p, "yinThreshold", out.yinThreshold);
    readNumber(p, "voicingFloorDb", out.voicingFloorDb);

    out.method = toLower(out.method);
    out.hopSec = positiveOr(out.hopSec, defaults.hopSec, "pitch.hopSec", verbose);
    out.frameLength = positiveOr(out.frameLength, defaults.frameLength, "pitch.frameLength", verbose);
    if (out.minHz <= 0.0 || out.maxHz <= out.minHz) {
        if (verbose) {
            LOG_WARN("Config: pitch range [{}, {}] Hz is invalid, using [{}, {}]", out.minHz,
                     out.maxHz, defaults.minHz, defaults.maxHz);
        }
        out.minHz = defaults.minHz;
        out.maxHz = defaults.maxHz;
    }
}

void parseClassifier(const nlohmann::json& c, AnalysisConfig::ClassifierConfig& out) {
    readNumber(c, "expressiveCentroidVar", out.expressiveCentroidVar);
    readNumber(c, "neutralCentroidVar", out.neutralCentroidVar);
    readNumber(c, "passionateRangeDb", out.passionateRangeDb);
    readNumber(c, "balancedRangeDb", out.balancedRangeDb);
    readNumber(c, "veryFastSpeechRatio", out.veryFastSpeechRatio);
    readNumber(c, "fastSpeechRatio", out.fastSpeechRatio);
    readNumber(c, "moderateSpeechRatio", out.moderateSpeechRatio);
    readNumber(c, "shortPauseSec", out.shortPauseSec);
}

void parseRoles(const nlohmann::json& r, AnalysisConfig::RoleConfig& out, bool verbose) {
    const AnalysisConfig::RoleConfig defaults;
    readString(r, "team1", out.team1);
    readString(r, "team2", out.team2);
    readString(r, "firstTeam", out.firstTeam);
    readNumber(r, "expectedParticipants", out.expectedParticipants);
    out.expectedParticipants = positiveOr(out.expectedParticipants, defaults.expectedParticipants,
                                          "roles.expectedParticipants", verbose);
}

void parsePipeline(const nlohmann::json& p, AnalysisConfig::PipelineConfig& out, bool verbose) {
    readNumber(p, "workers", out.workers);
    readBool(p, "writeClips", out.writeClips);
    readBool(p, "writeTrimmed", out.writeTrimmed);
    if (p.contains("diarizationTimeline") && p["diarizationTimeline"].is_string()) {
        std::string value = p["diarizationTimeline"].get<std::string>();
        out.timeline = parseDiarizationTimeline(value);
        std::string lower = toLower(value);
        if (lower != "trimmed" && lower != "original" && verbose) {
            LOG_WARN("Config: Unsupported pipeline.diarizationTimeline '{}', using 'trimmed'",
                     value);
        }
    }
    out.workers = nonNegativeOr(out.workers, 0, "pipeline.workers", verbose);
}

}  // namespace

ThresholdMode parseThresholdMode(const std::string& str) {
    if (toLower(str) == "absolute") {
        return ThresholdMode::Absolute;
    }
    return ThresholdMode::Adaptive;
}

const char* thresholdModeToString(ThresholdMode mode) {
    switch (mode) {
    case ThresholdMode::Absolute:
        return "absolute";
    case ThresholdMode::Adaptive:
    default:
        return "adaptive";
    }
}

DiarizationTimeline parseDiarizationTimeline(const std::string& str) {
    if (toLower(str) == "original") {
        return DiarizationTimeline::Original;
    }
    return DiarizationTimeline::Trimmed;
}

const char* diarizationTimelineToString(DiarizationTimeline timeline) {
    switch (timeline) {
    case DiarizationTimeline::Original:
        return "original";
    case DiarizationTimeline::Trimmed:
    default:
        return "trimmed";
    }
}

bool validateAnalysisConfig(const AnalysisConfig& config, std::string& error) {
    if (config.sampleRate <= 0) {
        error = "audio.sampleRate must be positive";
        return false;
    }
    if (config.segmentation.topSpeakers <= 0) {
        error = "segmentation.topSpeakers must be positive";
        return false;
    }
    if (config.segmentation.segmentsPerSpeaker <= 0) {
        error = "segmentation.segmentsPerSpeaker must be positive";
        return false;
    }
    if (config.segmentation.minMergedSec < 0.0 || config.segmentation.minTurnSec < 0.0 ||
        config.segmentation.maxMergeGapSec < 0.0) {
        error = "segmentation durations must not be negative";
        return false;
    }
    if (config.roles.team1.empty() || config.roles.team2.empty()) {
        error = "team labels must not be empty";
        return false;
    }
    if (toLower(config.roles.team1) == toLower(config.roles.team2)) {
        error = "team labels must differ";
        return false;
    }
    const std::string first = toLower(config.roles.firstTeam);
    if (first != toLower(config.roles.team1) && first != toLower(config.roles.team2)) {
        error = "first team '" + config.roles.firstTeam + "' must be '" + config.roles.team1 +
                "' or '" + config.roles.team2 + "'";
        return false;
    }
    if (config.pipeline.workers < 0) {
        error = "pipeline.workers must not be negative";
        return false;
    }
    return true;
}

bool loadAnalysisConfig(const std::filesystem::path& configPath, AnalysisConfig& outConfig,
                        bool verbose) {
    outConfig = AnalysisConfig{};

    std::ifstream file(configPath);
    if (!file.is_open()) {
        if (verbose) {
            LOG_INFO("Config: {} not found, using defaults", configPath.string());
        }
        return false;
    }

    try {
        nlohmann::json j;
        file >> j;

        if (j.contains("audio") && j["audio"].is_object()) {
            readNumber(j["audio"], "sampleRate", outConfig.sampleRate);
            outConfig.sampleRate =
                positiveOr(outConfig.sampleRate, 16000, "audio.sampleRate", verbose);
        }

        // Each section keeps its defaults on a type error
        struct Section {
            const char* name;
            void (*apply)(const nlohmann::json&, AnalysisConfig&, bool);
        };
        static const Section kSections[] = {
            {"trimmer",
             [](const nlohmann::json& s, AnalysisConfig& c, bool v) {
                 parseTrimmer(s, c.trimmer, v);
             }},
            {"segmentation",
             [](const nlohmann::json& s, AnalysisConfig& c, bool v) {
                 parseSegmentation(s, c.segmentation, v);
             }},
            {"features",
             [](const nlohmann::json& s, AnalysisConfig& c, bool v) {
                 parseFeatures(s, c.features, v);
             }},
            {"pitch",
             [](const nlohmann::json& s, AnalysisConfig& c, bool v) { parsePitch(s, c.pitch, v); }},
            {"classifier",
             [](const nlohmann::json& s, AnalysisConfig& c, bool) {
                 parseClassifier(s, c.classifier);
             }},
            {"roles",
             [](const nlohmann::json& s, AnalysisConfig& c, bool v) { parseRoles(s, c.roles, v); }},
            {"pipeline",
             [](const nlohmann::json& s, AnalysisConfig& c, bool v) {
                 parsePipeline(s, c.pipeline, v);
             }},
        };

        for (const auto& section : kSections) {
            if (!j.contains(section.name) || !j[section.name].is_object()) {
                continue;
            }
            AnalysisConfig candidate = outConfig;
            try {
                section.apply(j[section.name], candidate, verbose);
                outConfig = candidate;
            } catch (const std::exception& e) {
                if (verbose) {
                    LOG_WARN("Config: Invalid {} settings, using defaults: {}", section.name,
                             e.what());
                }
            }
        }

        if (verbose) {
            LOG_INFO("Config: Loaded from {}", std::filesystem::absolute(configPath).string());
        }
        return true;
    } catch (const std::exception& e) {
        if (verbose) {
            LOG_ERROR("Config: Failed to parse {}: {}", configPath.string(), e.what());
        }
        outConfig = AnalysisConfig{};
        return false;
    }
}

}  // namespace podium
