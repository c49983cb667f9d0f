#include "segment/diarization_reader.h"

#include "logging/logger.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <filesystem>
#include <fstream>

namespace podium {

namespace {

// Digits of a non-negative number, zero padded to two places without numeric conversion
std::string formatSpeakerDigits(const std::string& digits) {
    std::size_t firstNonZero = digits.find_first_not_of('0');
    std::string trimmed = firstNonZero == std::string::npos ? "" : digits.substr(firstNonZero);
    while (trimmed.size() < 2) {
        trimmed.insert(trimmed.begin(), '0');
    }
    return "SPEAKER_" + trimmed;
}

// Integral doubles below this are exact and fit in long long
constexpr double kMaxIntegralTag = 1e15;

bool isAllDigits(const std::string& s) {
    return !s.empty() &&
           std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c) != 0; });
}

std::string toUpper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

// Time value as double; strings holding numbers are accepted too
bool readTime(const nlohmann::json& record, const char* key, double& out) {
    if (!record.contains(key)) {
        out = 0.0;
        return true;
    }
    const auto& v = record[key];
    if (v.is_number()) {
        out = v.get<double>();
        return true;
    }
    if (v.is_string()) {
        try {
            out = std::stod(v.get<std::string>());
            return true;
        } catch (const std::exception&) {
            return false;
        }
    }
    return false;
}

struct RawRecord {
    nlohmann::json tag;
    double start;
    double end;
};

ErrorCode collectRecords(const nlohmann::json& list, const char* altSpeakerKey,
                         std::vector<RawRecord>& records, std::string& error) {
    for (std::size_t i = 0; i < list.size(); ++i) {
        const auto& record = list[i];
        if (!record.is_object()) {
            error = "record " + std::to_string(i) + " is not an object";
            return ErrorCode::INPUT_DIARIZATION_MALFORMED;
        }
        RawRecord r{nullptr, 0.0, 0.0};
        if (!readTime(record, "start", r.start) || !readTime(record, "end", r.end)) {
            error = "record " + std::to_string(i) + " has a non-numeric start or end";
            return ErrorCode::INPUT_DIARIZATION_MALFORMED;
        }
        if (record.contains("speaker") && !record["speaker"].is_null()) {
            r.tag = record["speaker"];
        } else if (altSpeakerKey && record.contains(altSpeakerKey)) {
            r.tag = record[altSpeakerKey];
        }
        records.push_back(std::move(r));
    }
    return ErrorCode::OK;
}

}  // namespace

SpeakerId normalizeSpeaker(const nlohmann::json& tag) {
    if (tag.is_null()) {
        return "SPEAKER_00";
    }
    if (tag.is_number_unsigned()) {
        return formatSpeakerDigits(std::to_string(tag.get<unsigned long long>()));
    }
    if (tag.is_number_integer()) {
        const long long n = tag.get<long long>();
        return n >= 0 ? formatSpeakerDigits(std::to_string(n)) : "SPEAKER_" + std::to_string(n);
    }
    if (tag.is_number()) {
        const double v = tag.get<double>();
        if (std::isfinite(v) && v >= 0.0 && v < kMaxIntegralTag && std::floor(v) == v) {
            return formatSpeakerDigits(std::to_string(static_cast<long long>(v)));
        }
        return tag.dump();
    }
    if (tag.is_string()) {
        std::string s = tag.get<std::string>();
        if (s.empty()) {
            return "SPEAKER_00";
        }
        if (isAllDigits(s)) {
            return formatSpeakerDigits(s);
        }
        std::string upper = toUpper(s);
        if (upper.rfind("SPEAKER_", 0) == 0) {
            return upper;
        }
        return s;
    }
    return tag.dump();
}

ErrorCode parseDiarization(const nlohmann::json& document, IntervalList& out,
                           std::string& error) {
    out.clear();
    std::vector<RawRecord> records;
    bool detectMilliseconds = false;
    ErrorCode code = ErrorCode::OK;

    if (document.is_object() && document.contains("utterances") &&
        document["utterances"].is_array()) {
        code = collectRecords(document["utterances"], nullptr, records, error);
        detectMilliseconds = true;
    } else if (document.is_object() && document.contains("segments") &&
               document["segments"].is_array()) {
        code = collectRecords(document["segments"], "speaker_label", records, error);
    } else if (document.is_array()) {
        code = collectRecords(document, "speaker_label", records, error);
    } else {
        error = "unrecognized diarization JSON structure";
        return ErrorCode::INPUT_DIARIZATION_MALFORMED;
    }
    if (code != ErrorCode::OK) {
        return code;
    }

    double divisor = 1.0;
    if (detectMilliseconds) {
        bool anyLarge = std::any_of(records.begin(), records.end(),
                                    [](const RawRecord& r) { return r.end > 1000.0; });
        if (anyLarge) {
            divisor = 1000.0;
            LOG_DEBUG("Diarization: timestamps look like milliseconds");
        }
    }

    std::size_t skipped = 0;
    for (const auto& r : records) {
        double start = r.start / divisor;
        double end = r.end / divisor;
        if (!(end > start) || start < 0.0) {
            ++skipped;
            LOG_DEBUG("Diarization: skipping record [{}, {}]", start, end);
            continue;
        }
        out.emplace_back(normalizeSpeaker(r.tag), start, end);
    }

    LOG_INFO("Diarization: {} intervals read ({} skipped)", out.size(), skipped);
    return ErrorCode::OK;
}

ErrorCode readDiarizationFile(const std::string& path, IntervalList& out, std::string& error) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        error = "diarization file not found: " + path;
        return ErrorCode::INPUT_DIARIZATION_NOT_FOUND;
    }
    std::ifstream file(path);
    if (!file.is_open()) {
        error = "cannot open diarization file: " + path;
        return ErrorCode::INPUT_DIARIZATION_NOT_FOUND;
    }

    nlohmann::json document;
    try {
        file >> document;
    } catch (const nlohmann::json::exception& e) {
        error = "failed to parse " + path + ": " + e.what();
        return ErrorCode::INPUT_DIARIZATION_MALFORMED;
    }
    return parseDiarization(document, out, error);
}

nlohmann::json intervalsToJson(const IntervalList& intervals) {
    nlohmann::json list = nlohmann::json::array();
    for (const auto& iv : intervals) {
        list.push_back({{"speaker", iv.speaker}, {"start", iv.start}, {"end", iv.end}});
    }
    return list;
}

}  // namespace podium
