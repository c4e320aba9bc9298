#include "xray/overlay/overlay_state.h"

#include "xray/core/logging.h"

#include <utility>

namespace xray::overlay {

namespace {

OverlayEffect effect(OverlayEffect::Kind kind) {
    OverlayEffect fx{};
    fx.kind = kind;
    return fx;
}

OverlayEffect mountEffect(const std::vector<Segment>& segments, const LayoutContext& ctx) {
    OverlayEffect fx = effect(OverlayEffect::Kind::Mount);
    fx.layer = buildHighlightLayer(segments, ctx.documentSize, ctx.config);
    return fx;
}

} // namespace

bool hasMountedLayer(const OverlayState& state) {
    return state.phase != OverlayPhase::Hidden;
}

TransitionResult applyShow(OverlayState state, std::vector<Segment> segments, const LayoutContext& ctx) {
    TransitionResult result;
    if (hasMountedLayer(state)) {
        result.effects.push_back(effect(OverlayEffect::Kind::Unmount));
    }
    result.effects.push_back(mountEffect(segments, ctx));

    result.state = std::move(state);
    result.state.segments = std::move(segments);
    result.state.phase = OverlayPhase::Visible;
    return result;
}

TransitionResult applyRemove(OverlayState state) {
    TransitionResult result;
    if (hasMountedLayer(state)) {
        result.effects.push_back(effect(OverlayEffect::Kind::Unmount));
    }
    result.state = std::move(state);
    result.state.segments.clear();
    result.state.phase = OverlayPhase::Hidden;
    return result;
}

TransitionResult applyHideTemporarily(OverlayState state) {
    TransitionResult result;
    result.wasVisible = state.phase == OverlayPhase::Visible;
    if (result.wasVisible) {
        result.effects.push_back(effect(OverlayEffect::Kind::Hide));
        state.phase = OverlayPhase::PeekHidden;
    }
    result.state = std::move(state);
    return result;
}

TransitionResult applyRestore(OverlayState state, const LayoutContext& ctx) {
    if (state.segments.empty()) {
        return TransitionResult{std::move(state), {}, false};
    }
    std::vector<Segment> segments = state.segments;
    return applyShow(std::move(state), std::move(segments), ctx);
}

TransitionResult applyResize(OverlayState state, const ExtractionResult& fresh, const LayoutContext& ctx) {
    if (state.phase != OverlayPhase::Visible || state.segments.empty() || !fresh.ok()) {
        return TransitionResult{std::move(state), {}, false};
    }

    if (fresh.textElements.size() != state.segments.size()) {
        XRAY_LOG_WARN("segment count changed on resize (%zu -> %zu), disabling overlay",
            state.segments.size(), fresh.textElements.size());
        const auto before = static_cast<std::uint32_t>(state.segments.size());
        TransitionResult result = applyRemove(std::move(state));
        OverlayEffect notify = effect(OverlayEffect::Kind::NotifyDisabledByResize);
        notify.before = before;
        notify.after = static_cast<std::uint32_t>(fresh.textElements.size());
        result.effects.push_back(notify);
        return result;
    }

    TransitionResult result;
    OverlayEffect resizeFx = effect(OverlayEffect::Kind::ResizeLayer);
    resizeFx.size = ctx.documentSize;
    result.effects.push_back(resizeFx);

    // Index correspondence is the only link between old and new segments.
    for (std::size_t i = 0; i < state.segments.size(); ++i) {
        state.segments[i].geometry = fresh.textElements[i].geometry;
        OverlayEffect fx = effect(OverlayEffect::Kind::UpdateGeometry);
        fx.index = static_cast<std::uint32_t>(i);
        fx.box = highlightBox(state.segments[i].geometry, ctx.config);
        result.effects.push_back(fx);
    }
    result.state = std::move(state);
    return result;
}

TransitionResult applyKeyDown(OverlayState state) {
    if (state.peekLatched || state.phase != OverlayPhase::Visible) {
        return TransitionResult{std::move(state), {}, false};
    }
    TransitionResult result = applyHideTemporarily(std::move(state));
    result.state.peekLatched = true;
    return result;
}

TransitionResult applyKeyUp(OverlayState state, const ExtractionResult* fresh, const LayoutContext& ctx) {
    if (!state.peekLatched) {
        return TransitionResult{std::move(state), {}, false};
    }
    state.peekLatched = false;
    if (state.phase != OverlayPhase::PeekHidden) {
        return TransitionResult{std::move(state), {}, false};
    }

    if (fresh == nullptr || !fresh->ok()) {
        TransitionResult result;
        result.effects.push_back(effect(OverlayEffect::Kind::Unhide));
        result.state = std::move(state);
        result.state.phase = OverlayPhase::Visible;
        return result;
    }

    std::vector<Segment> merged = fresh->textElements;
    for (std::size_t i = 0; i < merged.size(); ++i) {
        merged[i].matched = i < state.segments.size() ? state.segments[i].matched : MatchState::Unknown;
    }
    return applyShow(std::move(state), std::move(merged), ctx);
}

const char* phaseName(OverlayPhase phase) {
    switch (phase) {
        case OverlayPhase::Visible: return "visible";
        case OverlayPhase::PeekHidden: return "peek-hidden";
        default: return "hidden";
    }
}

} // namespace xray::overlay
