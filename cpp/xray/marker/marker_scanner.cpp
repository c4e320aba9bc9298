#include "xray/marker/marker_scanner.h"

#include "xray/core/string_utils.h"

namespace xray::marker {

namespace {

// UTF-8 of U+200B and U+200C.
constexpr std::string_view kStartBytes{"\xE2\x80\x8B", 3};
constexpr std::string_view kEndBytes{"\xE2\x80\x8C", 3};

bool isGuardCodepoint(std::uint32_t cp) {
    return cp == '\'' || cp == '"' || cp == '<' || cp == 0x2018 || cp == 0x2019;
}

// Code point ending right before `pos`, or 0 at the start of the text.
std::uint32_t codepointBefore(std::string_view text, std::size_t pos) {
    if (pos == 0) return 0;
    std::size_t start = pos - 1;
    while (start > 0 && (static_cast<unsigned char>(text[start]) & 0xC0) == 0x80 && pos - start < 4) {
        --start;
    }
    std::uint32_t byteLen = 0;
    const std::uint32_t cp = decodeUtf8Codepoint(text, start, byteLen);
    if (start + byteLen != pos) return 0xFFFD;
    return cp;
}

std::size_t nibbleRunLength(std::string_view text, std::size_t pos) {
    std::size_t end = pos;
    while (end < text.size()) {
        std::uint32_t byteLen = 0;
        const std::uint32_t cp = decodeUtf8Codepoint(text, end, byteLen);
        if (byteLen == 0 || cp < kNibbleBase || cp > kNibbleLast) break;
        end += byteLen;
    }
    return end - pos;
}

} // namespace

std::optional<StartMarkerMatch> findStartMarker(std::string_view text, std::uint32_t from) {
    std::size_t pos = from;
    while (pos < text.size()) {
        const std::size_t found = text.find(kStartBytes, pos);
        if (found == std::string_view::npos) {
            return std::nullopt;
        }
        const std::size_t payloadStart = found + kStartBytes.size();
        const std::size_t payloadBytes = nibbleRunLength(text, payloadStart);
        if (payloadBytes > 0 && !isGuardCodepoint(codepointBefore(text, found))) {
            return StartMarkerMatch{
                static_cast<std::uint32_t>(found),
                static_cast<std::uint32_t>(kStartBytes.size() + payloadBytes),
                text.substr(payloadStart, payloadBytes),
            };
        }
        pos = payloadStart;
    }
    return std::nullopt;
}

std::optional<std::uint32_t> findEndMarker(std::string_view text, std::uint32_t from) {
    if (from >= text.size()) return std::nullopt;
    const std::size_t found = text.find(kEndBytes, from);
    if (found == std::string_view::npos) return std::nullopt;
    return static_cast<std::uint32_t>(found);
}

} // namespace xray::marker
