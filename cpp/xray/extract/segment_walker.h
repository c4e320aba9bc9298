#pragma once

#include "xray/core/config.h"
#include "xray/core/types.h"
#include "xray/dom/render_tree_port.h"
#include "xray/extract/segment.h"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace xray {

// Single forward pass over the content root's text nodes. Rebuilds the
// segments delimited by start/end markers, including segments whose markers
// sit in different text nodes.
class SegmentWalker {
public:
    SegmentWalker(const dom::RenderTreePort& tree, const XrayConfig& config)
        : tree_(tree), config_(config) {}

    ExtractionResult walk();

    // Stats (Dev only)
    struct Stats {
        std::uint32_t nodesVisited;
        std::uint32_t nodesSkipped;
        std::uint32_t segmentsEmitted;
        std::uint32_t decodeErrors;
        std::uint32_t unterminated;
    };
    Stats getLastStats() const { return lastStats_; }

private:
    // At most one segment is open at any scan position.
    struct OpenSegment {
        TextPosition start;
        ElementId owner;
        std::string text;
        std::string payload;
    };

    // Resolves the owning element into `owner` and applies the text-node filter.
    bool acceptsNode(NodeId node, ElementId& owner) const;
    bool readText(NodeId node, std::string& out) const;

    Segment finalize(
        const TextPosition& start,
        const TextPosition& end,
        ElementId owner,
        std::string text,
        std::string_view payload
    );

    Rect measure(const TextPosition& start, const TextPosition& end, ElementId owner) const;

    const dom::RenderTreePort& tree_;
    const XrayConfig& config_;
    Stats lastStats_{0, 0, 0, 0, 0};
};

} // namespace xray
