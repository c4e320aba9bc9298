/**
 * @file protocol_types.h
 * @brief POD types crossing the engine <-> host page boundary.
 *
 * Changes to EngineEvent or EventType require bumping kEventStreamVersion.
 */

#ifndef LQA_XRAY_PROTOCOL_TYPES_H
#define LQA_XRAY_PROTOCOL_TYPES_H

#include <cstdint>

namespace xray {
namespace protocol {

// =============================================================================
// Versions (must be non-zero)
// =============================================================================

constexpr std::uint32_t kProtocolVersion = 1;
constexpr std::uint32_t kEventStreamVersion = 1;
constexpr std::uint32_t kMarkerFormatVersion = 1;  // U+200B + U+FE0x nibbles ... U+200C

struct ProtocolInfo {
    std::uint32_t protocolVersion;
    std::uint32_t eventStreamVersion;
    std::uint32_t markerFormatVersion;
};

// =============================================================================
// Event Stream
// =============================================================================

enum class EventType : std::uint16_t {
    Overflow = 1,
    // The overlay removed itself after a resize changed the segment count.
    // a = stored segment count, b = count found by re-extraction.
    OverlayDisabledByResize = 2,
};

struct EngineEvent {
    std::uint16_t type;
    std::uint16_t flags;
    std::uint32_t a;
    std::uint32_t b;
};

struct EventBufferMeta {
    std::uint32_t generation;
    std::uint32_t count;
    std::uintptr_t ptr;
};

struct HideResult {
    bool wasVisible;
};

} // namespace protocol
} // namespace xray

#endif // LQA_XRAY_PROTOCOL_TYPES_H
