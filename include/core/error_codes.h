#ifndef PODIUM_ERROR_CODES_H
#define PODIUM_ERROR_CODES_H

#include <cstdint>
#include <stdexcept>
#include <string>

namespace podium {

/**
 * @brief Error codes for the delivery analysis pipeline.
 *
 * Categories use upper 4 bits of the low 16 (0xF000 mask):
 * - 0x1xxx: Input (audio, diarization)
 * - 0x2xxx: Segmentation
 * - 0x3xxx: Analysis (feature extraction workers)
 * - 0x4xxx: Output (artifacts, report)
 * - 0x5xxx: Validation (config, CLI arguments)
 * - 0xFxxx: Internal (reserved)
 */
enum class ErrorCode : uint32_t {
    OK = 0,

    // Input (0x1000)
    INPUT_AUDIO_NOT_FOUND = 0x1001,
    INPUT_AUDIO_UNREADABLE = 0x1002,
    INPUT_UNSUPPORTED_FORMAT = 0x1003,
    INPUT_SAMPLE_RATE_MISMATCH = 0x1004,
    INPUT_AUDIO_EMPTY = 0x1005,
    INPUT_DIARIZATION_NOT_FOUND = 0x1006,
    INPUT_DIARIZATION_MALFORMED = 0x1007,
    INPUT_METRICS_NOT_FOUND = 0x1008,
    INPUT_METRICS_MALFORMED = 0x1009,

    // Segmentation (0x2000)
    SEGMENT_INSUFFICIENT_DATA = 0x2001,
    SEGMENT_NO_INTERVALS = 0x2002,

    // Analysis (0x3000)
    ANALYSIS_CLIP_OUT_OF_RANGE = 0x3001,
    ANALYSIS_CLIP_TOO_SHORT = 0x3002,
    ANALYSIS_FFT_PLAN_FAILED = 0x3003,
    ANALYSIS_WORKER_FAILED = 0x3004,

    // Output (0x4000)
    OUTPUT_WORK_DIR_FAILED = 0x4001,
    OUTPUT_WRITE_FAILED = 0x4002,

    // Validation (0x5000)
    VALIDATION_INVALID_CONFIG = 0x5001,
    VALIDATION_INVALID_ARGUMENT = 0x5002,
    VALIDATION_INVALID_TEAM = 0x5003,

    // Internal (0xF000) - Reserved for fallback
    INTERNAL_UNKNOWN = 0xF001,
};

/**
 * @brief Convert ErrorCode to string representation.
 * @return String name (e.g., "SEGMENT_INSUFFICIENT_DATA"), or "UNKNOWN_ERROR" for unknown codes
 */
const char* errorCodeToString(ErrorCode code);

/**
 * @brief Get the category name for an error code.
 * @return Category name (e.g., "input"), or "internal" for unknown codes
 */
const char* getErrorCategory(ErrorCode code);

/**
 * @brief Convert ErrorCode to a process exit status for the command line tools.
 */
int toExitCode(ErrorCode code);

/**
 * @brief Convert ErrorCode to hex string (e.g., "0x2001").
 */
std::string errorCodeToHex(ErrorCode code);

/**
 * @brief Convert string to ErrorCode enum.
 * @return Corresponding ErrorCode, or INTERNAL_UNKNOWN if not found
 */
ErrorCode stringToErrorCode(const std::string& str);

// Category check helpers
constexpr bool isInputError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0x1000;
}
constexpr bool isSegmentationError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0x2000;
}
constexpr bool isAnalysisError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0x3000;
}
constexpr bool isOutputError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0x4000;
}
constexpr bool isValidationError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0x5000;
}
constexpr bool isInternalError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0xF000;
}

/**
 * @brief Thrown to abort a run from inside a feature-extraction worker.
 *
 * Caught at the pipeline boundary and converted into a PipelineOutcome.
 */
class AnalysisError : public std::runtime_error {
   public:
    AnalysisError(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    ErrorCode code() const {
        return code_;
    }

   private:
    ErrorCode code_;
};

}  // namespace podium

#endif  // PODIUM_ERROR_CODES_H
