#include "xray/dom/text_node_filter.h"

#include "xray/core/string_utils.h"

#include <array>
#include <locale>
#include <sstream>
#include <string_view>

namespace xray::dom {

namespace {

constexpr std::array<std::string_view, 5> kExcludedTags = {
    "SCRIPT", "STYLE", "NOSCRIPT", "TEXTAREA", "HEAD",
};

// parseFloat semantics: leading number, anything unparsable is not zero.
// Parsed in the classic locale so "0.5" never reads as 0.
bool opacityIsZero(const std::string& opacity) {
    const std::string_view trimmed = trimAscii(opacity);
    if (trimmed.empty()) return false;
    std::istringstream in{std::string(trimmed)};
    in.imbue(std::locale::classic());
    double parsed = 1.0;
    in >> parsed;
    if (in.fail()) return false;
    return parsed == 0.0;
}

} // namespace

bool TextNodeFilter::isRendered(const ComputedStyle& style) {
    if (style.display == "none") return false;
    if (style.visibility == "hidden") return false;
    if (opacityIsZero(style.opacity)) return false;
    return true;
}

bool TextNodeFilter::isExcludedTag(const ComputedStyle& style) {
    const std::string tag = toUpperAscii(style.tagName);
    for (const std::string_view excluded : kExcludedTags) {
        if (tag == excluded) return true;
    }
    return false;
}

bool TextNodeFilter::accepts(NodeId node) const {
    return acceptsOwner(tree_.owningElement(node));
}

bool TextNodeFilter::acceptsOwner(ElementId owner) const {
    if (owner == kNoElement) return false;

    const ComputedStyle style = tree_.computedStyle(owner);
    return isRendered(style) && !isExcludedTag(style);
}

} // namespace xray::dom
