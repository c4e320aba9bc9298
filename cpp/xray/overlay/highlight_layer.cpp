#include "xray/overlay/highlight_layer.h"

#include "xray/core/string_utils.h"

#include <algorithm>

namespace xray::overlay {

namespace {

constexpr float kTooltipGap = 5.0f;

std::string truncated(std::string_view value, std::uint32_t limit) {
    if (codepointCount(value) <= limit) {
        return std::string(value);
    }
    std::string out(utf8Prefix(value, limit));
    out += "...";
    return out;
}

std::string displayKey(const std::string& key) {
    std::string out = key;
    if (!out.empty() && out[0] >= 'a' && out[0] <= 'z') {
        out[0] = static_cast<char>(out[0] - 'a' + 'A');
    }
    return out;
}

std::string displayValue(const nlohmann::json& value) {
    if (value.is_string()) return value.get<std::string>();
    return value.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // namespace

HighlightColor colorFor(MatchState matched) {
    switch (matched) {
        case MatchState::Matched: return HighlightColor::Matched;
        case MatchState::Unmatched: return HighlightColor::Unmatched;
        default: return HighlightColor::Default;
    }
}

const char* colorClassName(HighlightColor color) {
    switch (color) {
        case HighlightColor::Matched: return "matched";
        case HighlightColor::Unmatched: return "unmatched";
        default: return "default";
    }
}

Rect highlightBox(const Rect& geometry, const OverlayConfig& config) {
    const float pad = config.padding;
    return Rect{
        geometry.x - pad,
        geometry.y - pad,
        std::max(geometry.width, config.minWidth) + pad * 2.0f,
        std::max(geometry.height, config.minHeight) + pad * 2.0f,
    };
}

std::vector<std::string> tooltipLines(const Segment& segment, std::uint32_t index, const OverlayConfig& config) {
    std::vector<std::string> lines;
    lines.push_back("Segment #" + std::to_string(index + 1));
    lines.push_back("Text: " + truncated(segment.text, config.tooltipTextLimit));

    std::vector<std::string> metadataLines;
    if (segment.metadata.is_object()) {
        for (auto it = segment.metadata.begin(); it != segment.metadata.end(); ++it) {
            if (isReservedSegmentKey(it.key()) || it.value().is_null()) continue;
            metadataLines.push_back(
                displayKey(it.key()) + ": " + truncated(displayValue(it.value()), config.tooltipValueLimit));
        }
    }
    if (!metadataLines.empty()) {
        lines.emplace_back();
        lines.insert(lines.end(), metadataLines.begin(), metadataLines.end());
    }

    if (segment.decodingError) {
        lines.emplace_back();
        lines.push_back("Decode Error: " + *segment.decodingError);
    }
    return lines;
}

std::string joinLines(const std::vector<std::string>& lines) {
    std::string out;
    for (std::size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) out.push_back('\n');
        out += lines[i];
    }
    return out;
}

std::string copyTextFor(const Segment& segment) {
    if (!segment.metadata.is_object()) return {};
    const auto it = segment.metadata.find("g");
    if (it == segment.metadata.end() || !it->is_string()) return {};
    return it->get<std::string>();
}

Highlight buildHighlight(const Segment& segment, std::uint32_t index, const OverlayConfig& config) {
    return Highlight{
        index,
        highlightBox(segment.geometry, config),
        colorFor(segment.matched),
        tooltipLines(segment, index, config),
        segment.geometry.y > config.tooltipFlipY ? TooltipPlacement::Above : TooltipPlacement::Below,
        segment.geometry.height + kTooltipGap,
        copyTextFor(segment),
    };
}

HighlightLayer buildHighlightLayer(const std::vector<Segment>& segments, const Size& documentSize, const OverlayConfig& config) {
    HighlightLayer layer{documentSize, {}};
    layer.highlights.reserve(segments.size());
    for (std::size_t i = 0; i < segments.size(); ++i) {
        layer.highlights.push_back(buildHighlight(segments[i], static_cast<std::uint32_t>(i), config));
    }
    return layer;
}

} // namespace xray::overlay
