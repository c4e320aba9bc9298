#include "xray/marker/marker_codec.h"

#include "xray/core/logging.h"
#include "xray/core/string_utils.h"

namespace xray::marker {

namespace {

std::uint32_t nibbleAt(std::string_view payload, std::size_t& pos) {
    std::uint32_t byteLen = 0;
    const std::uint32_t cp = decodeUtf8Codepoint(payload, pos, byteLen);
    pos += byteLen;
    if (cp < kNibbleBase || cp > kNibbleLast) {
        throw DecodeError("Invalid char code in fe00 encoded input");
    }
    return cp - kNibbleBase;
}

} // namespace

std::vector<std::uint8_t> decodeMarkerPayload(std::string_view payload) {
    const std::size_t length = codepointCount(payload);
    if (length % 2 != 0) {
        throw DecodeError("Invalid fe00 encoded input length");
    }

    std::vector<std::uint8_t> bytes;
    bytes.reserve(length / 2);

    std::size_t pos = 0;
    for (std::size_t i = 0; i < length; i += 2) {
        const std::uint32_t high = nibbleAt(payload, pos);
        const std::uint32_t low = nibbleAt(payload, pos);
        bytes.push_back(static_cast<std::uint8_t>((high << 4) | low));
    }
    return bytes;
}

std::string encodeMarkerPayload(const std::uint8_t* bytes, std::size_t byteCount) {
    std::string out;
    out.reserve(byteCount * 6);
    for (std::size_t i = 0; i < byteCount; ++i) {
        appendUtf8(out, kNibbleBase + (bytes[i] >> 4));
        appendUtf8(out, kNibbleBase + (bytes[i] & 0x0F));
    }
    return out;
}

std::string encodeMarkerPayload(std::string_view bytes) {
    return encodeMarkerPayload(reinterpret_cast<const std::uint8_t*>(bytes.data()), bytes.size());
}

std::string encodeMarker(const nlohmann::json& metadata, std::string_view text) {
    std::string out;
    appendUtf8(out, kZeroWidthSpace);
    out += encodeMarkerPayload(metadata.dump());
    out.append(text.data(), text.size());
    appendUtf8(out, kZeroWidthNonJoiner);
    return out;
}

DecodedMetadata decodeMetadata(std::string_view payload) {
    DecodedMetadata result;
    try {
        const std::vector<std::uint8_t> bytes = decodeMarkerPayload(payload);
        // Lossy like a browser TextDecoder: bad bytes become U+FFFD.
        const std::string decoded = sanitizeUtf8(std::string_view(
            reinterpret_cast<const char*>(bytes.data()), bytes.size()));
        const std::string_view trimmed = trimAscii(decoded);
        if (trimmed.empty()) {
            return result;
        }
        nlohmann::json parsed = nlohmann::json::parse(std::string(trimmed));
        if (!parsed.is_object()) {
            result.decodingError = "Decoded metadata is not a JSON object";
            XRAY_LOG_WARN("marker metadata is %s, expected object", parsed.type_name());
            return result;
        }
        result.metadata = std::move(parsed);
    } catch (const DecodeError& e) {
        result.decodingError = e.what();
        XRAY_LOG_WARN("marker payload rejected: %s", e.what());
    } catch (const nlohmann::json::parse_error& e) {
        result.decodingError = e.what();
        XRAY_LOG_WARN("marker metadata is not valid JSON: %s", e.what());
    }
    return result;
}

} // namespace xray::marker
