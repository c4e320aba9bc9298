#pragma once

#include "xray/core/types.h"

#include <string>
#include <vector>

namespace xray::dom {

// The subset of computed style the walker and the visibility oracle read.
struct ComputedStyle {
    std::string tagName;     // as reported by the tree, compared case-insensitively
    std::string display;
    std::string visibility;
    std::string opacity;     // CSS string, parsed by consumers
    std::string overflow;
    std::string overflowX;
    std::string overflowY;
};

// Narrow query surface over a live (or synthetic) render tree.
// Every query is synchronous. Geometry and hit-test queries may throw
// std::exception when layout is unavailable; callers treat that as "not visible".
class RenderTreePort {
public:
    virtual ~RenderTreePort() = default;

    // Root element scanned for text (the page body). kNoElement if absent.
    virtual ElementId contentRoot() const = 0;

    // Text nodes under contentRoot() in document order.
    virtual std::vector<NodeId> textNodes() const = 0;
    virtual std::string nodeText(NodeId node) const = 0;
    virtual ElementId owningElement(NodeId node) const = 0;

    virtual ComputedStyle computedStyle(ElementId element) const = 0;

    // Viewport-relative bounding rect of the text between two positions.
    virtual Rect rangeRect(const TextPosition& start, const TextPosition& end) const = 0;
    virtual Rect elementRect(ElementId element) const = 0;
    virtual ElementId elementAtPoint(float x, float y) const = 0;
    virtual ElementId parentElement(ElementId element) const = 0;

    virtual Viewport viewport() const = 0;
    virtual Size documentSize() const = 0;

    // True if `element` is `ancestor` or sits below it.
    bool contains(ElementId ancestor, ElementId element) const {
        if (ancestor == kNoElement) return false;
        for (ElementId e = element; e != kNoElement; e = parentElement(e)) {
            if (e == ancestor) return true;
        }
        return false;
    }
};

} // namespace xray::dom
