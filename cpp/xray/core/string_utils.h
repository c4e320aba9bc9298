#pragma once

#include <cstdint>
#include <cstddef>
#include <algorithm>
#include <string>
#include <string_view>

namespace xray {

// =============================================================================
// Code points used by the marker wire format
// =============================================================================

constexpr std::uint32_t kZeroWidthSpace = 0x200B;     // start marker
constexpr std::uint32_t kZeroWidthNonJoiner = 0x200C; // end marker
constexpr std::uint32_t kNibbleBase = 0xFE00;         // variation selector block
constexpr std::uint32_t kNibbleLast = 0xFE0F;

// =============================================================================
// UTF-8 helpers
// =============================================================================

// Decodes the code point at `pos`. Malformed or truncated sequences decode as
// U+FFFD with byteLen 1; byteLen is 0 only at or past the end.
inline std::uint32_t decodeUtf8Codepoint(std::string_view content, std::size_t pos, std::uint32_t& byteLen) {
    if (pos >= content.size()) {
        byteLen = 0;
        return 0;
    }

    const unsigned char lead = static_cast<unsigned char>(content[pos]);
    std::uint32_t cp = 0;
    std::uint32_t trail = 0;
    if (lead < 0x80) {
        byteLen = 1;
        return lead;
    } else if ((lead & 0xE0) == 0xC0) {
        cp = lead & 0x1F;
        trail = 1;
    } else if ((lead & 0xF0) == 0xE0) {
        cp = lead & 0x0F;
        trail = 2;
    } else if ((lead & 0xF8) == 0xF0) {
        cp = lead & 0x07;
        trail = 3;
    } else {
        byteLen = 1;
        return 0xFFFD;
    }

    if (pos + trail >= content.size()) {
        byteLen = 1;
        return 0xFFFD;
    }
    for (std::uint32_t i = 1; i <= trail; ++i) {
        const unsigned char c = static_cast<unsigned char>(content[pos + i]);
        if ((c & 0xC0) != 0x80) {
            byteLen = 1;
            return 0xFFFD;
        }
        cp = (cp << 6) | (c & 0x3F);
    }
    byteLen = trail + 1;
    return cp;
}

// Inverse of decodeUtf8Codepoint for valid scalar values.
inline void appendUtf8(std::string& out, std::uint32_t cp) {
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
        return;
    }
    int trail = cp < 0x800 ? 1 : (cp < 0x10000 ? 2 : 3);
    static constexpr unsigned char kLeadMarks[] = {0x00, 0xC0, 0xE0, 0xF0};
    out.push_back(static_cast<char>(kLeadMarks[trail] | (cp >> (6 * trail))));
    for (int shift = 6 * (trail - 1); shift >= 0; shift -= 6) {
        out.push_back(static_cast<char>(0x80 | ((cp >> shift) & 0x3F)));
    }
}

// Copy of `content` with every ill-formed sequence (bad continuation,
// overlong form, surrogate, beyond U+10FFFF) replaced by U+FFFD, one per byte.
inline std::string sanitizeUtf8(std::string_view content) {
    std::string out;
    out.reserve(content.size());
    std::size_t pos = 0;
    while (pos < content.size()) {
        std::uint32_t byteLen = 0;
        const std::uint32_t cp = decodeUtf8Codepoint(content, pos, byteLen);
        const std::uint32_t minimal = cp < 0x80 ? 1u : (cp < 0x800 ? 2u : (cp < 0x10000 ? 3u : 4u));
        const bool wellFormed = byteLen == minimal
            && !(cp >= 0xD800 && cp <= 0xDFFF)
            && cp <= 0x10FFFF
            && !(cp == 0xFFFD && byteLen == 1);
        if (wellFormed) {
            out.append(content.substr(pos, byteLen));
        } else {
            appendUtf8(out, 0xFFFD);
            byteLen = 1;
        }
        pos += byteLen;
    }
    return out;
}

/**
 * Code point count of a UTF-8 string (malformed bytes count as one each).
 */
inline std::size_t codepointCount(std::string_view content) {
    std::size_t count = 0;
    std::size_t pos = 0;
    while (pos < content.size()) {
        std::uint32_t byteLen = 0;
        decodeUtf8Codepoint(content, pos, byteLen);
        if (byteLen == 0) break;
        pos += byteLen;
        ++count;
    }
    return count;
}

/**
 * Prefix of at most maxCodepoints code points, never splitting a sequence.
 */
inline std::string_view utf8Prefix(std::string_view content, std::size_t maxCodepoints) {
    std::size_t pos = 0;
    std::size_t count = 0;
    while (pos < content.size() && count < maxCodepoints) {
        std::uint32_t byteLen = 0;
        decodeUtf8Codepoint(content, pos, byteLen);
        if (byteLen == 0) break;
        pos += byteLen;
        ++count;
    }
    return content.substr(0, pos);
}

/**
 * Map UTF-8 byte index to logical index (UTF-16 code unit count).
 */
inline std::uint32_t byteToLogicalIndex(std::string_view content, std::uint32_t byteIndex) {
    std::uint32_t logicalCount = 0;
    const std::size_t n = content.size();
    const std::size_t limit = std::min<std::size_t>(n, byteIndex);
    std::size_t pos = 0;
    while (pos < limit) {
        std::uint32_t byteLen = 0;
        const std::uint32_t cp = decodeUtf8Codepoint(content, pos, byteLen);
        if (byteLen == 0 || pos + byteLen > limit) break;
        logicalCount += cp > 0xFFFF ? 2u : 1u;
        pos += byteLen;
    }
    return logicalCount;
}

inline std::string_view trimAscii(std::string_view s) {
    auto isSpace = [](char c) {
        return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
    };
    while (!s.empty() && isSpace(s.front())) s.remove_prefix(1);
    while (!s.empty() && isSpace(s.back())) s.remove_suffix(1);
    return s;
}

inline std::string toUpperAscii(std::string_view s) {
    std::string out(s);
    for (char& c : out) {
        if (c >= 'a' && c <= 'z') c = static_cast<char>(c - 'a' + 'A');
    }
    return out;
}

} // namespace xray
