#ifndef PODIUM_CONFIG_LOADER_H
#define PODIUM_CONFIG_LOADER_H

#include <filesystem>
#include <string>

namespace podium {

constexpr const char* DEFAULT_CONFIG_FILE = "podium.json";

// How SilenceTrimmer derives its speech/silence threshold
enum class ThresholdMode {
    Absolute,  // Fixed dBFS floor
    Adaptive   // Reference percentile of frame dB minus relativeDropDb
};

// Which waveform the diarization timestamps refer to
enum class DiarizationTimeline {
    Trimmed,  // Diarization was run on the silence-trimmed audio (default)
    Original  // Diarization was run on the untrimmed input
};

struct AnalysisConfig {
    int sampleRate = 16000;  // Codec utility guarantees mono at this rate

    struct TrimmerConfig {
        ThresholdMode mode = ThresholdMode::Adaptive;
        float frameMs = 25.0f;
        float hopMs = 10.0f;
        float absoluteFloorDb = -35.0f;     // Absolute mode threshold (dBFS)
        float relativeDropDb = 35.0f;       // Adaptive mode: dB below the reference percentile
        float referencePercentile = 95.0f;  // Adaptive mode reference
        float silenceFloorDb = -90.0f;      // Frames at or below this are never speech
        float minPauseSec = 0.20f;          // Bridge silences shorter than this
        float minSpeechSec = 0.05f;         // Drop speech runs shorter than this
    } trimmer;

    struct SegmentationConfig {
        double minTurnSec = 15.0;
        double maxMergeGapSec = 0.1;
        double minMergedSec = 60.0;
        int topSpeakers = 4;
        int segmentsPerSpeaker = 2;
    } segmentation;

    struct FeatureConfig {
        int frameLength = 2048;
        int hopLength = 512;
        double loudnessEpsilon = 1e-6;
        double rangeLowPercentile = 10.0;
        double rangeHighPercentile = 90.0;
        double pauseTopDb = 25.0;  // Looser than the trimmer, relative to the clip maximum
        double minClipSec = 0.5;
    } features;

    struct PitchConfig {
        std::string method = "yin";
        double minHz = 75.0;
        double maxHz = 500.0;
        double hopSec = 0.01;
        int frameLength = 1024;
        double yinThreshold = 0.15;
        double voicingFloorDb = -50.0;  // Frames quieter than this are unvoiced
    } pitch;

    // Lower bounds are exclusive: a value equal to a threshold falls in the lower class.
    struct ClassifierConfig {
        double expressiveCentroidVar = 5e6;
        double neutralCentroidVar = 2e6;
        double passionateRangeDb = 10.0;
        double balancedRangeDb = 4.0;
        double veryFastSpeechRatio = 0.85;
        double fastSpeechRatio = 0.6;
        double moderateSpeechRatio = 0.4;
        double shortPauseSec = 0.2;
    } classifier;

    struct RoleConfig {
        std::string team1 = "Aff";
        std::string team2 = "Neg";
        std::string firstTeam = "Aff";  // Must match team1 or team2 (case-insensitive)
        int expectedParticipants = 4;
    } roles;

    struct PipelineConfig {
        int workers = 0;  // 0 = hardware concurrency
        bool writeClips = true;
        bool writeTrimmed = true;
        DiarizationTimeline timeline = DiarizationTimeline::Trimmed;
    } pipeline;
};

// Convert string to ThresholdMode (returns Adaptive for invalid input)
ThresholdMode parseThresholdMode(const std::string& str);
const char* thresholdModeToString(ThresholdMode mode);

// Convert string to DiarizationTimeline (returns Trimmed for invalid input)
DiarizationTimeline parseDiarizationTimeline(const std::string& str);
const char* diarizationTimelineToString(DiarizationTimeline timeline);

// Checks cross-field constraints after CLI overrides. Returns false and sets error on failure.
bool validateAnalysisConfig(const AnalysisConfig& config, std::string& error);

bool loadAnalysisConfig(const std::filesystem::path& configPath, AnalysisConfig& outConfig,
                        bool verbose = true);

}  // namespace podium

#endif  // PODIUM_CONFIG_LOADER_H
