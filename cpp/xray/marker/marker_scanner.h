#ifndef LQA_XRAY_MARKER_SCANNER_H
#define LQA_XRAY_MARKER_SCANNER_H

#include <cstdint>
#include <optional>
#include <string_view>

namespace xray::marker {

struct StartMarkerMatch {
    std::uint32_t offset;      // byte offset of U+200B
    std::uint32_t length;      // bytes of U+200B plus the nibble run
    std::string_view payload;  // the nibble run, a view into the scanned text
};

// Next start marker at or after `from`. A marker immediately preceded by a
// quote or '<' is skipped (markup or attribute text quoting a marker).
std::optional<StartMarkerMatch> findStartMarker(std::string_view text, std::uint32_t from);

// Byte offset of the next U+200C at or after `from`.
std::optional<std::uint32_t> findEndMarker(std::string_view text, std::uint32_t from);

// Byte length of the end marker in UTF-8.
constexpr std::uint32_t kEndMarkerBytes = 3;

} // namespace xray::marker

#endif // LQA_XRAY_MARKER_SCANNER_H
