#include "core/error_codes.h"

#include <iomanip>
#include <sstream>
#include <unordered_map>

namespace podium {

// Error code to string mapping
static const std::unordered_map<ErrorCode, const char*> kErrorCodeStrings = {
    {ErrorCode::OK, "OK"},

    // Input
    {ErrorCode::INPUT_AUDIO_NOT_FOUND, "INPUT_AUDIO_NOT_FOUND"},
    {ErrorCode::INPUT_AUDIO_UNREADABLE, "INPUT_AUDIO_UNREADABLE"},
    {ErrorCode::INPUT_UNSUPPORTED_FORMAT, "INPUT_UNSUPPORTED_FORMAT"},
    {ErrorCode::INPUT_SAMPLE_RATE_MISMATCH, "INPUT_SAMPLE_RATE_MISMATCH"},
    {ErrorCode::INPUT_AUDIO_EMPTY, "INPUT_AUDIO_EMPTY"},
    {ErrorCode::INPUT_DIARIZATION_NOT_FOUND, "INPUT_DIARIZATION_NOT_FOUND"},
    {ErrorCode::INPUT_DIARIZATION_MALFORMED, "INPUT_DIARIZATION_MALFORMED"},
    {ErrorCode::INPUT_METRICS_NOT_FOUND, "INPUT_METRICS_NOT_FOUND"},
    {ErrorCode::INPUT_METRICS_MALFORMED, "INPUT_METRICS_MALFORMED"},

    // Segmentation
    {ErrorCode::SEGMENT_INSUFFICIENT_DATA, "SEGMENT_INSUFFICIENT_DATA"},
    {ErrorCode::SEGMENT_NO_INTERVALS, "SEGMENT_NO_INTERVALS"},

    // Analysis
    {ErrorCode::ANALYSIS_CLIP_OUT_OF_RANGE, "ANALYSIS_CLIP_OUT_OF_RANGE"},
    {ErrorCode::ANALYSIS_CLIP_TOO_SHORT, "ANALYSIS_CLIP_TOO_SHORT"},
    {ErrorCode::ANALYSIS_FFT_PLAN_FAILED, "ANALYSIS_FFT_PLAN_FAILED"},
    {ErrorCode::ANALYSIS_WORKER_FAILED, "ANALYSIS_WORKER_FAILED"},

    // Output
    {ErrorCode::OUTPUT_WORK_DIR_FAILED, "OUTPUT_WORK_DIR_FAILED"},
    {ErrorCode::OUTPUT_WRITE_FAILED, "OUTPUT_WRITE_FAILED"},

    // Validation
    {ErrorCode::VALIDATION_INVALID_CONFIG, "VALIDATION_INVALID_CONFIG"},
    {ErrorCode::VALIDATION_INVALID_ARGUMENT, "VALIDATION_INVALID_ARGUMENT"},
    {ErrorCode::VALIDATION_INVALID_TEAM, "VALIDATION_INVALID_TEAM"},

    // Internal
    {ErrorCode::INTERNAL_UNKNOWN, "INTERNAL_UNKNOWN"},
};

// String to error code mapping (reverse lookup), built from the table above
static const std::unordered_map<std::string, ErrorCode> kStringToErrorCode = [] {
    std::unordered_map<std::string, ErrorCode> reverse;
    for (const auto& entry : kErrorCodeStrings) {
        reverse.emplace(entry.second, entry.first);
    }
    return reverse;
}();

const char* errorCodeToString(ErrorCode code) {
    auto it = kErrorCodeStrings.find(code);
    if (it != kErrorCodeStrings.end()) {
        return it->second;
    }
    return "UNKNOWN_ERROR";
}

const char* getErrorCategory(ErrorCode code) {
    if (code == ErrorCode::OK) {
        return "ok";
    }
    if (isInputError(code)) {
        return "input";
    }
    if (isSegmentationError(code)) {
        return "segmentation";
    }
    if (isAnalysisError(code)) {
        return "analysis";
    }
    if (isOutputError(code)) {
        return "output";
    }
    if (isValidationError(code)) {
        return "validation";
    }
    return "internal";
}

int toExitCode(ErrorCode code) {
    if (code == ErrorCode::OK) {
        return 0;
    }
    if (isInputError(code)) {
        return 2;
    }
    if (isSegmentationError(code)) {
        return 3;
    }
    if (isAnalysisError(code)) {
        return 4;
    }
    if (isOutputError(code)) {
        return 5;
    }
    if (isValidationError(code)) {
        return 6;
    }
    return 70;  // EX_SOFTWARE
}

std::string errorCodeToHex(ErrorCode code) {
    std::ostringstream oss;
    oss << "0x" << std::hex << std::setfill('0') << std::setw(4) << static_cast<uint32_t>(code);
    return oss.str();
}

ErrorCode stringToErrorCode(const std::string& str) {
    auto it = kStringToErrorCode.find(str);
    if (it != kStringToErrorCode.end()) {
        return it->second;
    }
    return ErrorCode::INTERNAL_UNKNOWN;
}

}  // namespace podium
