// XrayEngine overlay commands. Each command runs one pure transition from
// overlay_state.h and replays its effects onto the painter and event queue.

#include "xray/engine.h"
#include "xray/internal/engine_state.h"

#include "xray/core/logging.h"
#include "xray/core/util.h"

#include <exception>
#include <utility>

using xray::overlay::OverlayEffect;

xray::overlay::LayoutContext XrayEngine::layoutContext() const {
    xray::Size size{0.0f, 0.0f};
    if (state().tree != nullptr) {
        try {
            size = state().tree->documentSize();
        } catch (const std::exception& e) {
            XRAY_LOG_WARN("document size query failed: %s", e.what());
        }
    }
    return xray::overlay::LayoutContext{size, state().config.overlay};
}

void XrayEngine::replay(const OverlayEffect& fx) {
    xray::overlay::HighlightPainter* painter = state().painter;
    switch (fx.kind) {
        case OverlayEffect::Kind::Mount:
            if (painter) painter->mountLayer(fx.layer);
            break;
        case OverlayEffect::Kind::Unmount:
            if (painter) painter->unmountLayer();
            break;
        case OverlayEffect::Kind::Hide:
            if (painter) painter->setLayerHidden(true);
            break;
        case OverlayEffect::Kind::Unhide:
            if (painter) painter->setLayerHidden(false);
            break;
        case OverlayEffect::Kind::UpdateGeometry:
            if (painter) painter->updateHighlight(fx.index, fx.box);
            break;
        case OverlayEffect::Kind::ResizeLayer:
            if (painter) painter->resizeLayer(fx.size);
            break;
        case OverlayEffect::Kind::NotifyDisabledByResize:
            pushEvent(EngineEvent{
                static_cast<std::uint16_t>(EventType::OverlayDisabledByResize),
                0,
                fx.before,
                fx.after,
            });
            break;
    }
}

void XrayEngine::apply(xray::overlay::TransitionResult&& result) {
    const xray::overlay::OverlayPhase before = state().overlay.phase;
    state().overlay = std::move(result.state);
    if (!result.effects.empty()) {
        state().generation++;
    }
    for (const OverlayEffect& fx : result.effects) {
        replay(fx);
    }
    if (state().overlay.phase != OverlayPhase::Visible) {
        state().resizePending = false;
    }
    if (before != state().overlay.phase) {
        XRAY_LOG_DEBUG("overlay %s -> %s",
            xray::overlay::phaseName(before), xray::overlay::phaseName(state().overlay.phase));
    }
}

void XrayEngine::show(bool enabled, std::vector<xray::Segment> segments) {
    if (!enabled || segments.empty()) {
        remove();
        return;
    }
    apply(xray::overlay::applyShow(std::move(state().overlay), std::move(segments), layoutContext()));
}

bool XrayEngine::showJson(bool enabled, const std::string& segmentsJson) {
    std::vector<xray::Segment> segments;
    try {
        segments = xray::segmentsFromJson(nlohmann::json::parse(segmentsJson));
    } catch (const nlohmann::json::parse_error& e) {
        XRAY_LOG_WARN("show: segments are not valid JSON: %s", e.what());
        return false;
    } catch (const std::invalid_argument& e) {
        XRAY_LOG_WARN("show: %s", e.what());
        return false;
    }
    show(enabled, std::move(segments));
    return true;
}

void XrayEngine::remove() {
    apply(xray::overlay::applyRemove(std::move(state().overlay)));
}

XrayEngine::HideResult XrayEngine::hideTemporarily() {
    xray::overlay::TransitionResult result = xray::overlay::applyHideTemporarily(std::move(state().overlay));
    const bool wasVisible = result.wasVisible;
    apply(std::move(result));
    return HideResult{wasVisible};
}

void XrayEngine::restore() {
    apply(xray::overlay::applyRestore(std::move(state().overlay), layoutContext()));
}

void XrayEngine::notifyResize(double nowMs) {
    if (state().overlay.phase != OverlayPhase::Visible || state().overlay.segments.empty()) {
        return;
    }
    state().resizePending = true;
    state().resizeDeadlineMs = nowMs + state().config.overlay.resizeDebounceMs;
}

void XrayEngine::notifyResize() {
    notifyResize(emscripten_get_now());
}

void XrayEngine::tick(double nowMs) {
    if (!state().resizePending || nowMs < state().resizeDeadlineMs) {
        return;
    }
    state().resizePending = false;
    if (state().overlay.phase != OverlayPhase::Visible) {
        return;
    }

    const std::optional<xray::ExtractionResult> fresh = reextract();
    if (!fresh) {
        return;
    }
    if (!fresh->ok()) {
        XRAY_LOG_WARN("resize re-extraction failed, keeping overlay: %s", fresh->error.c_str());
        return;
    }
    apply(xray::overlay::applyResize(std::move(state().overlay), *fresh, layoutContext()));
}

void XrayEngine::tick() {
    tick(emscripten_get_now());
}

bool XrayEngine::isResizePending() const noexcept {
    return state().resizePending;
}

void XrayEngine::keyDown(const std::string& key) {
    if (key != state().config.overlay.peekKey) return;
    apply(xray::overlay::applyKeyDown(std::move(state().overlay)));
}

void XrayEngine::keyUp(const std::string& key) {
    if (key != state().config.overlay.peekKey) return;
    if (!state().overlay.peekLatched) return;

    const std::optional<xray::ExtractionResult> fresh =
        state().overlay.phase == OverlayPhase::PeekHidden ? reextract() : std::nullopt;
    apply(xray::overlay::applyKeyUp(
        std::move(state().overlay),
        fresh ? &*fresh : nullptr,
        layoutContext()));
}

std::string XrayEngine::activateHighlight(std::uint32_t index) {
    const std::vector<xray::Segment>& segments = state().overlay.segments;
    if (state().overlay.phase != OverlayPhase::Visible || index >= segments.size()) {
        return {};
    }
    std::string copyText = xray::overlay::copyTextFor(segments[index]);
    if (!copyText.empty() && state().painter) {
        state().painter->flashHighlight(index);
    }
    return copyText;
}
