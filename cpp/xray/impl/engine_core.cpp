// XrayEngine construction, port binding, configuration and state queries.

#include "xray/engine.h"
#include "xray/internal/engine_state.h"

#include "xray/core/logging.h"

#include <stdexcept>

XrayEngine::XrayEngine() : state_(std::make_unique<EngineState>()) {}

XrayEngine::~XrayEngine() = default;

void XrayEngine::bindRenderTree(const xray::dom::RenderTreePort* tree) noexcept {
    state().tree = tree;
}

void XrayEngine::bindPainter(xray::overlay::HighlightPainter* painter) noexcept {
    state().painter = painter;
}

void XrayEngine::setConfig(const xray::XrayConfig& config) {
    state().config = config;
}

const xray::XrayConfig& XrayEngine::getConfig() const noexcept {
    return state().config;
}

bool XrayEngine::setConfigJson(const std::string& json) {
    clearError();
    try {
        state().config = xray::configFromJson(nlohmann::json::parse(json));
        return true;
    } catch (const nlohmann::json::parse_error& e) {
        XRAY_LOG_WARN("config is not valid JSON: %s", e.what());
    } catch (const std::invalid_argument& e) {
        XRAY_LOG_WARN("config rejected: %s", e.what());
    }
    setError(xray::XrayError::InvalidConfig);
    return false;
}

XrayEngine::OverlayPhase XrayEngine::getOverlayPhase() const noexcept {
    return state().overlay.phase;
}

bool XrayEngine::isOverlayVisible() const noexcept {
    return state().overlay.phase == OverlayPhase::Visible;
}

const std::vector<xray::Segment>& XrayEngine::getOverlaySegments() const noexcept {
    return state().overlay.segments;
}

std::string XrayEngine::getOverlaySegmentsJson() const {
    return xray::toWireString(xray::segmentsToJson(state().overlay.segments));
}

std::uint32_t XrayEngine::getGeneration() const noexcept {
    return state().generation;
}

xray::SegmentWalker::Stats XrayEngine::getLastWalkStats() const noexcept {
    return state().lastWalkStats;
}

xray::XrayError XrayEngine::getLastError() const noexcept {
    return state().lastError;
}

void XrayEngine::clearError() const {
    state().lastError = xray::XrayError::Ok;
}

void XrayEngine::setError(xray::XrayError err) const {
    state().lastError = err;
}
