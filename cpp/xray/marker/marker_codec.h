#ifndef LQA_XRAY_MARKER_CODEC_H
#define LQA_XRAY_MARKER_CODEC_H

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace xray::marker {

// Malformed nibble payload: odd code point count or a code point outside U+FE00..U+FE0F.
class DecodeError : public std::runtime_error {
public:
    explicit DecodeError(const std::string& what) : std::runtime_error(what) {}
};

struct DecodedMetadata {
    nlohmann::json metadata = nlohmann::json::object();
    std::optional<std::string> decodingError;
};

// payload is UTF-8; every code point carries one nibble (cp - 0xFE00).
// Pairs are (high, low). Throws DecodeError.
std::vector<std::uint8_t> decodeMarkerPayload(std::string_view payload);

// Inverse of decodeMarkerPayload: two nibble code points per byte.
std::string encodeMarkerPayload(const std::uint8_t* bytes, std::size_t byteCount);
std::string encodeMarkerPayload(std::string_view bytes);

// Full "start marker + payload + text + end marker" run for a metadata object.
std::string encodeMarker(const nlohmann::json& metadata, std::string_view text);

// Best effort: never throws. Empty or blank payload text yields {}.
DecodedMetadata decodeMetadata(std::string_view payload);

} // namespace xray::marker

#endif // LQA_XRAY_MARKER_CODEC_H
