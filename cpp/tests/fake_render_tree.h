#pragma once

#include "xray/dom/render_tree_port.h"
#include "xray/marker/marker_codec.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

namespace xray_test {

// In-memory render tree. Elements added later paint on top of earlier ones.
// Text geometry is linear in UTF-8 bytes across the node's rect.
class FakeRenderTree : public xray::dom::RenderTreePort {
public:
    struct Element {
        xray::ElementId parent;
        xray::Rect rect;
        xray::dom::ComputedStyle style;
        bool hitTestable;
    };

    struct TextNode {
        xray::ElementId owner;
        std::string text;
        xray::Rect rect;
    };

    FakeRenderTree() {
        body_ = addElement(xray::kNoElement, "BODY", xray::Rect{0.0f, 0.0f, 1024.0f, 768.0f});
    }

    xray::ElementId body() const { return body_; }

    xray::ElementId addElement(xray::ElementId parent, const std::string& tag, const xray::Rect& rect) {
        const xray::ElementId id = nextId_++;
        xray::dom::ComputedStyle style;
        style.tagName = tag;
        style.display = "block";
        style.visibility = "visible";
        style.opacity = "1";
        style.overflow = "visible";
        style.overflowX = "visible";
        style.overflowY = "visible";
        elements_[id] = Element{parent, rect, style, true};
        paintOrder_.push_back(id);
        return id;
    }

    xray::NodeId addText(xray::ElementId owner, const std::string& text, const xray::Rect& rect) {
        const xray::NodeId id = nextId_++;
        nodes_[id] = TextNode{owner, text, rect};
        nodeOrder_.push_back(id);
        return id;
    }

    // An element-backed text node whose owner fills the same rect.
    xray::NodeId addSpanText(const std::string& text, const xray::Rect& rect, xray::ElementId parent = xray::kNoElement) {
        const xray::ElementId span = addElement(parent == xray::kNoElement ? body_ : parent, "SPAN", rect);
        return addText(span, text, rect);
    }

    xray::dom::ComputedStyle& style(xray::ElementId id) { return elements_.at(id).style; }
    Element& element(xray::ElementId id) { return elements_.at(id); }
    TextNode& node(xray::NodeId id) { return nodes_.at(id); }

    void removeTextNode(xray::NodeId id) {
        nodes_.erase(id);
        nodeOrder_.erase(std::remove(nodeOrder_.begin(), nodeOrder_.end(), id), nodeOrder_.end());
    }

    void setViewport(const xray::Viewport& vp) { viewport_ = vp; }
    void setDocumentSize(const xray::Size& size) { documentSize_ = size; }
    void setHasRoot(bool hasRoot) { hasRoot_ = hasRoot; }
    void setThrowOnGeometry(bool value) { throwOnGeometry_ = value; }
    void setThrowOnHitTest(bool value) { throwOnHitTest_ = value; }
    void setThrowOnOwnerOf(xray::NodeId node) { throwOnOwnerOf_ = node; }

    // Moves every text node and its owner by (dx, dy).
    void shift(float dx, float dy) {
        for (auto& kv : nodes_) {
            kv.second.rect.x += dx;
            kv.second.rect.y += dy;
        }
        for (auto& kv : elements_) {
            if (kv.first == body_) continue;
            kv.second.rect.x += dx;
            kv.second.rect.y += dy;
        }
    }

    std::uint32_t rangeRectCalls() const { return rangeRectCalls_; }
    std::uint32_t owningElementCalls() const { return owningElementCalls_; }

    // RenderTreePort

    xray::ElementId contentRoot() const override { return hasRoot_ ? body_ : xray::kNoElement; }

    std::vector<xray::NodeId> textNodes() const override { return nodeOrder_; }

    std::string nodeText(xray::NodeId node) const override { return nodes_.at(node).text; }

    xray::ElementId owningElement(xray::NodeId node) const override {
        owningElementCalls_++;
        if (node == throwOnOwnerOf_) throw std::runtime_error("node detached");
        return nodes_.at(node).owner;
    }

    xray::dom::ComputedStyle computedStyle(xray::ElementId element) const override {
        return elements_.at(element).style;
    }

    xray::Rect rangeRect(const xray::TextPosition& start, const xray::TextPosition& end) const override {
        rangeRectCalls_++;
        if (throwOnGeometry_) throw std::runtime_error("layout unavailable");
        const TextNode& a = nodes_.at(start.node);
        const TextNode& b = nodes_.at(end.node);
        if (start.node == end.node) {
            return slice(a, start.offset, end.offset);
        }
        const xray::Rect first = slice(a, start.offset, static_cast<std::uint32_t>(a.text.size()));
        const xray::Rect last = slice(b, 0, end.offset);
        const float left = std::min(first.left(), last.left());
        const float top = std::min(first.top(), last.top());
        const float right = std::max(first.right(), last.right());
        const float bottom = std::max(first.bottom(), last.bottom());
        return xray::Rect{left, top, right - left, bottom - top};
    }

    xray::Rect elementRect(xray::ElementId element) const override {
        if (throwOnGeometry_) throw std::runtime_error("layout unavailable");
        return elements_.at(element).rect;
    }

    xray::ElementId elementAtPoint(float x, float y) const override {
        if (throwOnHitTest_) throw std::runtime_error("hit test unavailable");
        for (auto it = paintOrder_.rbegin(); it != paintOrder_.rend(); ++it) {
            const Element& e = elements_.at(*it);
            if (!e.hitTestable) continue;
            if (x >= e.rect.left() && x < e.rect.right() && y >= e.rect.top() && y < e.rect.bottom()) {
                return *it;
            }
        }
        return xray::kNoElement;
    }

    xray::ElementId parentElement(xray::ElementId element) const override {
        const auto it = elements_.find(element);
        return it == elements_.end() ? xray::kNoElement : it->second.parent;
    }

    xray::Viewport viewport() const override { return viewport_; }

    xray::Size documentSize() const override { return documentSize_; }

private:
    static xray::Rect slice(const TextNode& n, std::uint32_t from, std::uint32_t to) {
        const float len = n.text.empty() ? 1.0f : static_cast<float>(n.text.size());
        const float x0 = n.rect.x + n.rect.width * static_cast<float>(from) / len;
        const float x1 = n.rect.x + n.rect.width * static_cast<float>(to) / len;
        return xray::Rect{x0, n.rect.y, x1 - x0, n.rect.height};
    }

    xray::ElementId body_{xray::kNoElement};
    std::uint32_t nextId_{1};
    std::unordered_map<xray::ElementId, Element> elements_;
    std::vector<xray::ElementId> paintOrder_;
    std::unordered_map<xray::NodeId, TextNode> nodes_;
    std::vector<xray::NodeId> nodeOrder_;
    xray::Viewport viewport_{1024.0f, 768.0f, 0.0f, 0.0f};
    xray::Size documentSize_{1024.0f, 2000.0f};
    bool hasRoot_{true};
    bool throwOnGeometry_{false};
    bool throwOnHitTest_{false};
    xray::NodeId throwOnOwnerOf_{xray::kNoNode};
    mutable std::uint32_t rangeRectCalls_{0};
    mutable std::uint32_t owningElementCalls_{0};
};

inline std::string marked(const nlohmann::json& metadata, const std::string& text) {
    return xray::marker::encodeMarker(metadata, text);
}

// UTF-8 of the raw marker code points, for hand-built fixtures.
inline const std::string kStart = "\xE2\x80\x8B";
inline const std::string kEnd = "\xE2\x80\x8C";

} // namespace xray_test
