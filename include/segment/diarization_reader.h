#ifndef PODIUM_DIARIZATION_READER_H
#define PODIUM_DIARIZATION_READER_H

#include "core/error_codes.h"
#include "segment/interval.h"

#include <nlohmann/json.hpp>
#include <string>

namespace podium {

/**
 * @brief Canonical speaker label for a diarization speaker tag.
 *
 * Integers become SPEAKER_nn, digit strings are zero padded the same way, tags starting
 * with "speaker_" (any case) are upper-cased, null or missing becomes SPEAKER_00 and any
 * other string is kept as is.
 */
SpeakerId normalizeSpeaker(const nlohmann::json& tag);

/**
 * @brief Parse a diarization document.
 *
 * Accepted shapes:
 * - {"utterances": [{speaker, start, end}, ...]}; times are milliseconds when any end
 *   exceeds 1000, seconds otherwise
 * - {"segments": [{speaker | speaker_label, start, end}, ...]} in seconds
 * - [{speaker, start, end}, ...] in seconds (segments.json written by this tool)
 *
 * Records with end <= start are skipped. Output keeps document order.
 */
ErrorCode parseDiarization(const nlohmann::json& document, IntervalList& out, std::string& error);

ErrorCode readDiarizationFile(const std::string& path, IntervalList& out, std::string& error);

nlohmann::json intervalsToJson(const IntervalList& intervals);

}  // namespace podium

#endif  // PODIUM_DIARIZATION_READER_H
