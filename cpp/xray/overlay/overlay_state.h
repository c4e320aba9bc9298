#pragma once

#include "xray/core/config.h"
#include "xray/core/types.h"
#include "xray/extract/segment.h"
#include "xray/overlay/highlight_layer.h"

#include <cstdint>
#include <vector>

namespace xray::overlay {

enum class OverlayPhase : std::uint8_t {
    Hidden = 0,
    Visible = 1,
    PeekHidden = 2,
};

// Everything the overlay remembers between commands.
struct OverlayState {
    OverlayPhase phase{OverlayPhase::Hidden};
    std::vector<Segment> segments;
    bool peekLatched{false};
};

// A side effect requested by a transition, replayed by the engine onto the
// painter and the event queue in order.
struct OverlayEffect {
    enum class Kind : std::uint8_t {
        Mount,
        Unmount,
        Hide,
        Unhide,
        UpdateGeometry,
        ResizeLayer,
        NotifyDisabledByResize,
    };

    Kind kind;
    HighlightLayer layer{};     // Mount
    std::uint32_t index{0};     // UpdateGeometry
    Rect box{kZeroRect};        // UpdateGeometry
    Size size{0.0f, 0.0f};      // ResizeLayer
    std::uint32_t before{0};    // NotifyDisabledByResize: stored count
    std::uint32_t after{0};     // NotifyDisabledByResize: fresh count
};

struct TransitionResult {
    OverlayState state;
    std::vector<OverlayEffect> effects;
    bool wasVisible{false};     // HideTemporarily only
};

// Inputs a transition may need besides the state itself.
struct LayoutContext {
    Size documentSize;
    const OverlayConfig& config;
};

bool hasMountedLayer(const OverlayState& state);

TransitionResult applyShow(OverlayState state, std::vector<Segment> segments, const LayoutContext& ctx);
TransitionResult applyRemove(OverlayState state);
TransitionResult applyHideTemporarily(OverlayState state);
TransitionResult applyRestore(OverlayState state, const LayoutContext& ctx);

// `fresh` is the result of re-running the walker after the debounce elapsed.
TransitionResult applyResize(OverlayState state, const ExtractionResult& fresh, const LayoutContext& ctx);

TransitionResult applyKeyDown(OverlayState state);
// `fresh` is null when no walker is available.
TransitionResult applyKeyUp(OverlayState state, const ExtractionResult* fresh, const LayoutContext& ctx);

const char* phaseName(OverlayPhase phase);

} // namespace xray::overlay
