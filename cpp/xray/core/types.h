#ifndef LQA_XRAY_TYPES_H
#define LQA_XRAY_TYPES_H

#include <cstdint>
#include <cstddef>

// Lightweight types shared by the walker, the visibility oracle and the overlay.

namespace xray {

// Opaque render-tree handles. 0 is "none".
using ElementId = std::uint32_t;
using NodeId = std::uint32_t;
constexpr ElementId kNoElement = 0;
constexpr NodeId kNoNode = 0;

struct Point {
    float x;
    float y;
};

struct Size {
    float width;
    float height;
};

// Axis-aligned rectangle, origin top-left, y down (page/viewport space).
struct Rect {
    float x;
    float y;
    float width;
    float height;

    float left() const { return x; }
    float top() const { return y; }
    float right() const { return x + width; }
    float bottom() const { return y + height; }

    bool operator==(const Rect& other) const {
        return x == other.x && y == other.y && width == other.width && height == other.height;
    }
    bool operator!=(const Rect& other) const { return !(*this == other); }
};

// Geometry of a segment that is present but not visible.
constexpr Rect kZeroRect{0.0f, 0.0f, 0.0f, 0.0f};

struct Viewport {
    float width;
    float height;
    float scrollX;
    float scrollY;
};

// A caret position inside a text node. offset is a UTF-8 byte offset.
struct TextPosition {
    NodeId node;
    std::uint32_t offset;
};

enum class XrayError : std::uint32_t {
    Ok = 0,
    MissingRoot = 1,
    NoRenderTree = 2,
    InvalidConfig = 3,
};

} // namespace xray

#endif // LQA_XRAY_TYPES_H
