#include "xray/extract/segment_walker.h"

#include "xray/core/logging.h"
#include "xray/dom/text_node_filter.h"
#include "xray/marker/marker_codec.h"
#include "xray/marker/marker_scanner.h"
#include "xray/visibility/visibility_oracle.h"

#include <exception>
#include <utility>
#include <vector>

namespace xray {

namespace {
constexpr const char* kMissingRootError = "Document body not found.";
constexpr const char* kUnterminatedError = "Unterminated segment";
} // namespace

bool SegmentWalker::acceptsNode(NodeId node, ElementId& owner) const {
    try {
        owner = tree_.owningElement(node);
        return dom::TextNodeFilter(tree_).acceptsOwner(owner);
    } catch (const std::exception& e) {
        XRAY_LOG_WARN("style lookup failed for text node %u: %s", node, e.what());
        return false;
    }
}

bool SegmentWalker::readText(NodeId node, std::string& out) const {
    try {
        out = tree_.nodeText(node);
        return true;
    } catch (const std::exception& e) {
        XRAY_LOG_WARN("text read failed for node %u: %s", node, e.what());
        return false;
    }
}

Rect SegmentWalker::measure(const TextPosition& start, const TextPosition& end, ElementId owner) const {
    try {
        const Rect rect = tree_.rangeRect(start, end);
        const visibility::VisibilityOracle oracle(tree_, config_.visibility);
        if (!oracle.isVisible(rect, owner)) {
            return kZeroRect;
        }
        const Viewport vp = tree_.viewport();
        return Rect{rect.x + vp.scrollX, rect.y + vp.scrollY, rect.width, rect.height};
    } catch (const std::exception& e) {
        XRAY_LOG_WARN("range geometry failed (node %u..%u): %s", start.node, end.node, e.what());
        return kZeroRect;
    }
}

Segment SegmentWalker::finalize(
    const TextPosition& start,
    const TextPosition& end,
    ElementId owner,
    std::string text,
    std::string_view payload) {
    Segment segment;
    segment.text = std::move(text);

    marker::DecodedMetadata decoded = marker::decodeMetadata(payload);
    segment.metadata = std::move(decoded.metadata);
    segment.decodingError = std::move(decoded.decodingError);
    if (segment.decodingError) {
        lastStats_.decodeErrors++;
    }

    segment.geometry = measure(start, end, owner);
    lastStats_.segmentsEmitted++;
    return segment;
}

ExtractionResult SegmentWalker::walk() {
    lastStats_ = Stats{0, 0, 0, 0, 0};

    ExtractionResult result;
    if (tree_.contentRoot() == kNoElement) {
        result.error = kMissingRootError;
        return result;
    }

    std::vector<NodeId> nodes;
    try {
        nodes = tree_.textNodes();
    } catch (const std::exception& e) {
        XRAY_LOG_WARN("text node enumeration failed: %s", e.what());
        result.error = std::string("Text node enumeration failed: ") + e.what();
        return result;
    }

    std::optional<OpenSegment> open;

    for (const NodeId node : nodes) {
        lastStats_.nodesVisited++;
        std::string text;
        ElementId owner = kNoElement;
        if (!acceptsNode(node, owner) || !readText(node, text)) {
            lastStats_.nodesSkipped++;
            continue;
        }

        const std::string_view view(text);
        std::uint32_t pos = 0;

        while (pos < view.size()) {
            if (open) {
                const auto endPos = marker::findEndMarker(view, pos);
                if (!endPos) {
                    open->text.append(view.substr(pos));
                    break;
                }
                open->text.append(view.substr(pos, *endPos - pos));
                result.textElements.push_back(finalize(
                    open->start,
                    TextPosition{node, *endPos},
                    open->owner,
                    std::move(open->text),
                    open->payload));
                open.reset();
                pos = *endPos + marker::kEndMarkerBytes;
                continue;
            }

            const auto match = marker::findStartMarker(view, pos);
            if (!match) break;

            const std::uint32_t textStart = match->offset + match->length;
            const TextPosition start{node, match->offset};
            const auto endPos = marker::findEndMarker(view, textStart);
            if (endPos) {
                result.textElements.push_back(finalize(
                    start,
                    TextPosition{node, *endPos},
                    owner,
                    std::string(view.substr(textStart, *endPos - textStart)),
                    match->payload));
                pos = *endPos + marker::kEndMarkerBytes;
            } else {
                open = OpenSegment{
                    start,
                    owner,
                    std::string(view.substr(textStart)),
                    std::string(match->payload),
                };
                break;
            }
        }
    }

    if (open) {
        lastStats_.unterminated++;
        if (config_.walker.unterminatedPolicy == UnterminatedPolicy::Emit) {
            Segment segment;
            segment.text = std::move(open->text);
            marker::DecodedMetadata decoded = marker::decodeMetadata(open->payload);
            segment.metadata = std::move(decoded.metadata);
            segment.decodingError = decoded.decodingError ? std::move(decoded.decodingError)
                                                          : std::optional<std::string>(kUnterminatedError);
            result.textElements.push_back(std::move(segment));
            lastStats_.segmentsEmitted++;
        } else {
            XRAY_LOG_DEBUG("dropping unterminated segment (%zu bytes of text)", open->text.size());
        }
    }

    XRAY_LOG_DEBUG("walk: %u nodes, %u skipped, %u segments",
        lastStats_.nodesVisited, lastStats_.nodesSkipped, lastStats_.segmentsEmitted);
    return result;
}

} // namespace xray
