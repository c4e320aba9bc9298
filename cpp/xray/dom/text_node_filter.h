#pragma once

#include "xray/core/types.h"
#include "xray/dom/render_tree_port.h"

namespace xray::dom {

// Decides whether a text node takes part in marker scanning.
class TextNodeFilter {
public:
    explicit TextNodeFilter(const RenderTreePort& tree) : tree_(tree) {}

    bool accepts(NodeId node) const;
    // Same decision when the caller already resolved the owning element.
    bool acceptsOwner(ElementId owner) const;

    static bool isRendered(const ComputedStyle& style);
    static bool isExcludedTag(const ComputedStyle& style);

private:
    const RenderTreePort& tree_;
};

} // namespace xray::dom
