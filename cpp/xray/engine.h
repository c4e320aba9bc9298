#pragma once

#include "xray/core/config.h"
#include "xray/core/types.h"
#include "xray/dom/render_tree_port.h"
#include "xray/extract/segment.h"
#include "xray/extract/segment_walker.h"
#include "xray/overlay/highlight_painter.h"
#include "xray/overlay/overlay_state.h"
#include "xray/protocol/protocol_types.h"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

struct EngineState;

// One engine per page session: extraction against the bound render tree plus
// the overlay kept in sync with it. Single-threaded; callers serialize commands.
class XrayEngine {
    friend class XrayEngineTestAccessor;
public:
    using EventType = xray::protocol::EventType;
    using EngineEvent = xray::protocol::EngineEvent;
    using EventBufferMeta = xray::protocol::EventBufferMeta;
    using ProtocolInfo = xray::protocol::ProtocolInfo;
    using HideResult = xray::protocol::HideResult;
    using OverlayPhase = xray::overlay::OverlayPhase;

    XrayEngine();
    ~XrayEngine();

    XrayEngine(const XrayEngine&) = delete;
    XrayEngine& operator=(const XrayEngine&) = delete;

    // Ports are borrowed; they must outlive the engine or be unbound first.
    void bindRenderTree(const xray::dom::RenderTreePort* tree) noexcept;
    void bindPainter(xray::overlay::HighlightPainter* painter) noexcept;

    void setConfig(const xray::XrayConfig& config);
    const xray::XrayConfig& getConfig() const noexcept;
    // Returns false (lastError = InvalidConfig) and keeps the old config on failure.
    bool setConfigJson(const std::string& json);

    ProtocolInfo getProtocolInfo() const noexcept {
        return ProtocolInfo{
            xray::protocol::kProtocolVersion,
            xray::protocol::kEventStreamVersion,
            xray::protocol::kMarkerFormatVersion,
        };
    }

    // ==============================================================================
    // Extraction
    // ==============================================================================
    xray::ExtractionResult extract();
    std::string extractJson();
    xray::SegmentWalker::Stats getLastWalkStats() const noexcept;

    // ==============================================================================
    // Overlay commands
    // ==============================================================================
    void show(bool enabled, std::vector<xray::Segment> segments);
    // Returns false (nothing changes) when the JSON is not a segment array.
    bool showJson(bool enabled, const std::string& segmentsJson);
    void remove();
    HideResult hideTemporarily();
    void restore();

    // Resize is debounced: notifyResize arms the timer, tick fires it.
    void notifyResize(double nowMs);
    void notifyResize();
    void tick(double nowMs);
    void tick();
    bool isResizePending() const noexcept;

    void keyDown(const std::string& key);
    void keyUp(const std::string& key);

    // Copy text ("g" GUID) of a highlight; flashes it when there is one.
    std::string activateHighlight(std::uint32_t index);

    // ==============================================================================
    // State query
    // ==============================================================================
    OverlayPhase getOverlayPhase() const noexcept;
    bool isOverlayVisible() const noexcept;
    const std::vector<xray::Segment>& getOverlaySegments() const noexcept;
    std::string getOverlaySegmentsJson() const;
    std::uint32_t getGeneration() const noexcept;

    // ==============================================================================
    // Events
    // ==============================================================================
    EventBufferMeta pollEvents(std::uint32_t maxEvents);
    void ackResync(std::uint32_t resyncGeneration);

    xray::XrayError getLastError() const noexcept;

private:
    EngineState& state() noexcept { return *state_; }
    const EngineState& state() const noexcept { return *state_; }

    xray::overlay::LayoutContext layoutContext() const;
    std::optional<xray::ExtractionResult> reextract();
    void apply(xray::overlay::TransitionResult&& result);
    void replay(const xray::overlay::OverlayEffect& fx);

    void clearEventState();
    bool pushEvent(const EngineEvent& ev);

    void clearError() const;
    void setError(xray::XrayError err) const;

    std::unique_ptr<EngineState> state_;
};
