#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>

namespace xray {

struct VisibilityConfig {
    // A clipping ancestor must leave at least this share of each dimension visible.
    float clipOverlapRatio = 0.5f;
    // Corner probes are moved this far inward before hit-testing.
    float cornerInsetPx = 2.0f;
};

enum class UnterminatedPolicy : std::uint8_t {
    Drop = 0,
    Emit = 1,
};

struct WalkerConfig {
    UnterminatedPolicy unterminatedPolicy = UnterminatedPolicy::Drop;
};

struct OverlayConfig {
    float padding = 4.0f;
    float minWidth = 20.0f;
    float minHeight = 16.0f;
    std::uint32_t tooltipTextLimit = 60;
    std::uint32_t tooltipValueLimit = 40;
    float tooltipFlipY = 100.0f;
    double resizeDebounceMs = 250.0;
    std::string peekKey = "Shift";
};

struct XrayConfig {
    VisibilityConfig visibility;
    WalkerConfig walker;
    OverlayConfig overlay;
};

// Throws std::invalid_argument on wrong types or out-of-range values.
// Keys that are absent keep their defaults; unknown keys are ignored.
XrayConfig configFromJson(const nlohmann::json& j);
nlohmann::json configToJson(const XrayConfig& config);

} // namespace xray
