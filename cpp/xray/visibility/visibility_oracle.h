#pragma once

#include "xray/core/config.h"
#include "xray/core/types.h"
#include "xray/dom/render_tree_port.h"

namespace xray::visibility {

// Answers whether a viewport-relative rect could actually be seen by a user:
// not mostly clipped by an overflow ancestor, inside the viewport and not
// covered by an unrelated element at any of its four (inset) corners.
class VisibilityOracle {
public:
    VisibilityOracle(const dom::RenderTreePort& tree, const VisibilityConfig& config)
        : tree_(tree), config_(config) {}

    // Pure query. Any exception from the render tree yields false.
    bool isVisible(const Rect& rect, ElementId owningElement) const noexcept;

    static bool clipsOverflow(const dom::ComputedStyle& style);

private:
    bool passesClipping(const Rect& rect, ElementId owningElement) const;
    bool passesCornerProbes(const Rect& rect, ElementId owningElement, const Viewport& vp) const;

    const dom::RenderTreePort& tree_;
    const VisibilityConfig& config_;
};

} // namespace xray::visibility
