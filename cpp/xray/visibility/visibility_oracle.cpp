#include "xray/visibility/visibility_oracle.h"

#include "xray/core/logging.h"

#include <algorithm>
#include <array>
#include <exception>
#include <string>

namespace xray::visibility {

namespace {

bool hasClippingKeyword(const std::string& value) {
    return value.find("hidden") != std::string::npos
        || value.find("scroll") != std::string::npos
        || value.find("clip") != std::string::npos;
}

bool outside(const Rect& rect, const Rect& bounds) {
    return rect.right() <= bounds.left() || rect.left() >= bounds.right()
        || rect.bottom() <= bounds.top() || rect.top() >= bounds.bottom();
}

} // namespace

bool VisibilityOracle::clipsOverflow(const dom::ComputedStyle& style) {
    return hasClippingKeyword(style.overflow)
        || hasClippingKeyword(style.overflowX)
        || hasClippingKeyword(style.overflowY);
}

bool VisibilityOracle::passesClipping(const Rect& rect, ElementId owningElement) const {
    const ElementId root = tree_.contentRoot();
    for (ElementId element = owningElement;
         element != kNoElement && element != root;
         element = tree_.parentElement(element)) {
        if (!clipsOverflow(tree_.computedStyle(element))) continue;

        const Rect bounds = tree_.elementRect(element);
        if (outside(rect, bounds)) {
            return false;
        }

        const float visibleWidth = std::min(rect.right(), bounds.right()) - std::max(rect.left(), bounds.left());
        const float visibleHeight = std::min(rect.bottom(), bounds.bottom()) - std::max(rect.top(), bounds.top());
        if (visibleWidth < rect.width * config_.clipOverlapRatio
            || visibleHeight < rect.height * config_.clipOverlapRatio) {
            return false;
        }
    }
    return true;
}

bool VisibilityOracle::passesCornerProbes(const Rect& rect, ElementId owningElement, const Viewport& vp) const {
    const float inset = config_.cornerInsetPx;
    const std::array<Point, 4> corners = {{
        {rect.left() + inset, rect.top() + inset},
        {rect.right() - inset, rect.top() + inset},
        {rect.left() + inset, rect.bottom() - inset},
        {rect.right() - inset, rect.bottom() - inset},
    }};

    for (const Point& corner : corners) {
        if (corner.x < 0.0f || corner.x >= vp.width || corner.y < 0.0f || corner.y >= vp.height) {
            return false;
        }

        const ElementId hit = tree_.elementAtPoint(corner.x, corner.y);
        if (hit == kNoElement) {
            return false;
        }

        const bool related = hit == owningElement
            || tree_.contains(owningElement, hit)
            || tree_.contains(hit, owningElement);
        if (!related) {
            return false;
        }
    }
    return true;
}

bool VisibilityOracle::isVisible(const Rect& rect, ElementId owningElement) const noexcept {
    if (rect.width <= 0.0f || rect.height <= 0.0f) {
        return false;
    }

    try {
        if (!passesClipping(rect, owningElement)) {
            return false;
        }

        const Viewport vp = tree_.viewport();
        const Rect viewportRect{0.0f, 0.0f, vp.width, vp.height};
        if (outside(rect, viewportRect)) {
            return false;
        }

        return passesCornerProbes(rect, owningElement, vp);
    } catch (const std::exception& e) {
        XRAY_LOG_WARN("visibility query failed for element %u: %s", owningElement, e.what());
        return false;
    }
}

} // namespace xray::visibility
