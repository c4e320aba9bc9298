#pragma once

#include "xray/core/config.h"
#include "xray/core/types.h"
#include "xray/extract/segment.h"

#include <cstdint>
#include <string>
#include <vector>

namespace xray::overlay {

enum class HighlightColor : std::uint8_t {
    Default = 0,
    Matched = 1,
    Unmatched = 2,
};

enum class TooltipPlacement : std::uint8_t {
    Above = 0,
    Below = 1,
};

struct Highlight {
    std::uint32_t index;            // position in the displayed segment list
    Rect box;                       // padded page rect
    HighlightColor color;
    std::vector<std::string> tooltipLines;
    TooltipPlacement tooltipPlacement;
    float tooltipOffset;            // distance from the highlight edge
    std::string copyText;           // empty when the segment has no GUID
};

struct HighlightLayer {
    Size size;                      // whole document
    std::vector<Highlight> highlights;
};

HighlightColor colorFor(MatchState matched);
const char* colorClassName(HighlightColor color);

// Padded box with the minimum size applied before padding.
Rect highlightBox(const Rect& geometry, const OverlayConfig& config);

std::vector<std::string> tooltipLines(const Segment& segment, std::uint32_t index, const OverlayConfig& config);
std::string joinLines(const std::vector<std::string>& lines);

// GUID of the translation unit a segment maps to ("g" metadata), or "".
std::string copyTextFor(const Segment& segment);

Highlight buildHighlight(const Segment& segment, std::uint32_t index, const OverlayConfig& config);
HighlightLayer buildHighlightLayer(const std::vector<Segment>& segments, const Size& documentSize, const OverlayConfig& config);

} // namespace xray::overlay
