#pragma once

#include "xray/core/config.h"
#include "xray/core/types.h"
#include "xray/dom/render_tree_port.h"
#include "xray/extract/segment_walker.h"
#include "xray/overlay/highlight_painter.h"
#include "xray/overlay/overlay_state.h"
#include "xray/protocol/protocol_types.h"

#include <cstddef>
#include <cstdint>
#include <vector>

// Per page-session state owned by one XrayEngine.
struct EngineState {
    EngineState();

    EngineState(const EngineState&) = delete;
    EngineState& operator=(const EngineState&) = delete;

    xray::XrayConfig config{};

    const xray::dom::RenderTreePort* tree{nullptr};
    xray::overlay::HighlightPainter* painter{nullptr};

    xray::overlay::OverlayState overlay{};
    std::uint32_t generation{0};

    bool resizePending{false};
    double resizeDeadlineMs{0.0};

    xray::SegmentWalker::Stats lastWalkStats{0, 0, 0, 0, 0};

    static constexpr std::size_t kMaxEvents = 64;
    std::vector<xray::protocol::EngineEvent> eventQueue_{};
    std::size_t eventHead_{0};
    std::size_t eventTail_{0};
    std::size_t eventCount_{0};
    bool eventOverflowed_{false};
    std::uint32_t eventOverflowGeneration_{0};
    std::vector<xray::protocol::EngineEvent> eventBuffer_{};

    mutable xray::XrayError lastError{xray::XrayError::Ok};
};
