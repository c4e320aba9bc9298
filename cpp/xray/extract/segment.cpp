#include "xray/extract/segment.h"

#include <array>
#include <stdexcept>
#include <string_view>

namespace xray {

namespace {

constexpr std::array<std::string_view, 7> kReservedKeys = {
    "text", "x", "y", "width", "height", "decodingError", "matched",
};

float numberOr(const nlohmann::json& j, const char* key, float fallback) {
    const auto it = j.find(key);
    if (it == j.end() || !it->is_number()) return fallback;
    return it->get<float>();
}

} // namespace

bool isReservedSegmentKey(const std::string& key) {
    for (const std::string_view reserved : kReservedKeys) {
        if (key == reserved) return true;
    }
    return false;
}

nlohmann::json segmentToJson(const Segment& segment) {
    nlohmann::json j = nlohmann::json::object();
    j["text"] = segment.text;
    j["x"] = segment.geometry.x;
    j["y"] = segment.geometry.y;
    j["width"] = segment.geometry.width;
    j["height"] = segment.geometry.height;

    if (segment.metadata.is_object()) {
        for (auto it = segment.metadata.begin(); it != segment.metadata.end(); ++it) {
            if (isReservedSegmentKey(it.key())) continue;
            j[it.key()] = it.value();
        }
    }

    if (segment.decodingError) {
        j["decodingError"] = *segment.decodingError;
    }
    if (segment.matched != MatchState::Unknown) {
        j["matched"] = segment.matched == MatchState::Matched;
    }
    return j;
}

Segment segmentFromJson(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw std::invalid_argument("segment must be a JSON object");
    }
    const auto text = j.find("text");
    if (text == j.end() || !text->is_string()) {
        throw std::invalid_argument("segment.text must be a string");
    }

    Segment segment;
    segment.text = text->get<std::string>();
    segment.geometry = Rect{
        numberOr(j, "x", 0.0f),
        numberOr(j, "y", 0.0f),
        numberOr(j, "width", 0.0f),
        numberOr(j, "height", 0.0f),
    };

    const auto error = j.find("decodingError");
    if (error != j.end() && error->is_string()) {
        segment.decodingError = error->get<std::string>();
    }

    const auto matched = j.find("matched");
    if (matched != j.end() && matched->is_boolean()) {
        segment.matched = matched->get<bool>() ? MatchState::Matched : MatchState::Unmatched;
    }

    for (auto it = j.begin(); it != j.end(); ++it) {
        if (isReservedSegmentKey(it.key())) continue;
        segment.metadata[it.key()] = it.value();
    }
    return segment;
}

std::vector<Segment> segmentsFromJson(const nlohmann::json& j) {
    if (!j.is_array()) {
        throw std::invalid_argument("segments must be a JSON array");
    }
    std::vector<Segment> segments;
    segments.reserve(j.size());
    for (const auto& item : j) {
        segments.push_back(segmentFromJson(item));
    }
    return segments;
}

nlohmann::json segmentsToJson(const std::vector<Segment>& segments) {
    nlohmann::json out = nlohmann::json::array();
    for (const Segment& segment : segments) {
        out.push_back(segmentToJson(segment));
    }
    return out;
}

nlohmann::json metadataOnly(const Segment& segment) {
    nlohmann::json out = nlohmann::json::object();
    if (!segment.metadata.is_object()) return out;
    for (auto it = segment.metadata.begin(); it != segment.metadata.end(); ++it) {
        if (isReservedSegmentKey(it.key()) || it.value().is_null()) continue;
        out[it.key()] = it.value();
    }
    return out;
}

nlohmann::json extractionResultToJson(const ExtractionResult& result) {
    if (!result.ok()) {
        return nlohmann::json{{"error", result.error}};
    }
    return nlohmann::json{{"textElements", segmentsToJson(result.textElements)}};
}

std::string toWireString(const nlohmann::json& j) {
    return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // namespace xray
