// XrayEngine extraction entry points.

#include "xray/engine.h"
#include "xray/internal/engine_state.h"

#include "xray/core/logging.h"

namespace {
constexpr const char* kNoRenderTreeError = "No render tree bound.";
}

xray::ExtractionResult XrayEngine::extract() {
    clearError();
    if (state().tree == nullptr) {
        setError(xray::XrayError::NoRenderTree);
        xray::ExtractionResult result;
        result.error = kNoRenderTreeError;
        return result;
    }

    xray::SegmentWalker walker(*state().tree, state().config);
    xray::ExtractionResult result = walker.walk();
    state().lastWalkStats = walker.getLastStats();
    if (!result.ok()) {
        setError(xray::XrayError::MissingRoot);
        XRAY_LOG_WARN("extraction failed: %s", result.error.c_str());
    }
    return result;
}

std::string XrayEngine::extractJson() {
    return xray::toWireString(xray::extractionResultToJson(extract()));
}

std::optional<xray::ExtractionResult> XrayEngine::reextract() {
    if (state().tree == nullptr) {
        return std::nullopt;
    }
    return extract();
}
