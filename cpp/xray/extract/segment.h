#pragma once

#include "xray/core/types.h"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace xray {

// Match annotation attached by the host after comparing against a translation memory.
enum class MatchState : std::uint8_t {
    Unknown = 0,
    Matched = 1,
    Unmatched = 2,
};

struct Segment {
    std::string text;
    Rect geometry{kZeroRect};  // absolute page rect, or kZeroRect when not visible
    nlohmann::json metadata = nlohmann::json::object();
    std::optional<std::string> decodingError;
    MatchState matched{MatchState::Unknown};
};

struct ExtractionResult {
    std::vector<Segment> textElements;
    std::string error;  // non-empty means no scan happened

    bool ok() const { return error.empty(); }
};

// Keys the extractor owns on the flat wire object; metadata never provides them.
bool isReservedSegmentKey(const std::string& key);

// Flat wire object: { text, x, y, width, height, ...metadata, decodingError?, matched? }
nlohmann::json segmentToJson(const Segment& segment);
// Throws std::invalid_argument when `j` is not an object or `text` is not a string.
Segment segmentFromJson(const nlohmann::json& j);

std::vector<Segment> segmentsFromJson(const nlohmann::json& j);
nlohmann::json segmentsToJson(const std::vector<Segment>& segments);

// Decoded metadata only, minus reserved keys and nulls.
nlohmann::json metadataOnly(const Segment& segment);

// { textElements: [...] } or { error: "..." }
nlohmann::json extractionResultToJson(const ExtractionResult& result);

// Compact JSON text for the host. Page text is not guaranteed to be valid
// UTF-8; ill-formed bytes are written as U+FFFD.
std::string toWireString(const nlohmann::json& j);

} // namespace xray
