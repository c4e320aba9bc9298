#ifdef EMSCRIPTEN
#include <emscripten/bind.h>
#include <emscripten/emscripten.h>
#include <emscripten/val.h>
#endif

// Include the engine public API header for bindings.
#include "xray/engine.h"
#include "xray/core/string_utils.h"

#ifdef EMSCRIPTEN
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

using emscripten::val;

xray::Rect rectFromVal(const val& v, const char* what) {
    if (v.isNull() || v.isUndefined()) {
        throw std::runtime_error(std::string(what) + " unavailable");
    }
    return xray::Rect{
        v["left"].as<float>(),
        v["top"].as<float>(),
        v["width"].as<float>(),
        v["height"].as<float>(),
    };
}

std::string stringOr(const val& v, const char* key) {
    const val field = v[key];
    return field.isString() ? field.as<std::string>() : std::string();
}

// Render-tree port backed by a JS host object that resolves handles to DOM
// nodes. Offsets cross the boundary as UTF-16 code units.
class JsRenderTree final : public xray::dom::RenderTreePort {
public:
    explicit JsRenderTree(val host) : host_(std::move(host)) {}

    xray::ElementId contentRoot() const override {
        return host_.call<xray::ElementId>("contentRoot");
    }

    std::vector<xray::NodeId> textNodes() const override {
        return emscripten::vecFromJSArray<xray::NodeId>(host_.call<val>("textNodes"));
    }

    std::string nodeText(xray::NodeId node) const override {
        return host_.call<std::string>("nodeText", node);
    }

    xray::ElementId owningElement(xray::NodeId node) const override {
        return host_.call<xray::ElementId>("owningElement", node);
    }

    xray::dom::ComputedStyle computedStyle(xray::ElementId element) const override {
        const val style = host_.call<val>("computedStyle", element);
        return xray::dom::ComputedStyle{
            stringOr(style, "tagName"),
            stringOr(style, "display"),
            stringOr(style, "visibility"),
            stringOr(style, "opacity"),
            stringOr(style, "overflow"),
            stringOr(style, "overflowX"),
            stringOr(style, "overflowY"),
        };
    }

    xray::Rect rangeRect(const xray::TextPosition& start, const xray::TextPosition& end) const override {
        const std::uint32_t startUnits = xray::byteToLogicalIndex(nodeText(start.node), start.offset);
        const std::uint32_t endUnits = xray::byteToLogicalIndex(nodeText(end.node), end.offset);
        return rectFromVal(host_.call<val>("rangeRect", start.node, startUnits, end.node, endUnits), "rangeRect");
    }

    xray::Rect elementRect(xray::ElementId element) const override {
        return rectFromVal(host_.call<val>("elementRect", element), "elementRect");
    }

    xray::ElementId elementAtPoint(float x, float y) const override {
        return host_.call<xray::ElementId>("elementAtPoint", x, y);
    }

    xray::ElementId parentElement(xray::ElementId element) const override {
        return host_.call<xray::ElementId>("parentElement", element);
    }

    xray::Viewport viewport() const override {
        const val v = host_.call<val>("viewport");
        return xray::Viewport{
            v["width"].as<float>(),
            v["height"].as<float>(),
            v["scrollX"].as<float>(),
            v["scrollY"].as<float>(),
        };
    }

    xray::Size documentSize() const override {
        const val v = host_.call<val>("documentSize");
        return xray::Size{v["width"].as<float>(), v["height"].as<float>()};
    }

private:
    val host_;
};

val rectToVal(const xray::Rect& r) {
    val out = val::object();
    out.set("left", r.x);
    out.set("top", r.y);
    out.set("width", r.width);
    out.set("height", r.height);
    return out;
}

// Painter that forwards to a JS object owning the overlay DOM.
class JsHighlightPainter final : public xray::overlay::HighlightPainter {
public:
    explicit JsHighlightPainter(val host) : host_(std::move(host)) {}

    void mountLayer(const xray::overlay::HighlightLayer& layer) override {
        val highlights = val::array();
        for (const auto& h : layer.highlights) {
            val item = val::object();
            item.set("index", h.index);
            item.set("box", rectToVal(h.box));
            item.set("colorClass", std::string(xray::overlay::colorClassName(h.color)));
            item.set("tooltip", xray::overlay::joinLines(h.tooltipLines));
            item.set("tooltipAbove", h.tooltipPlacement == xray::overlay::TooltipPlacement::Above);
            item.set("tooltipOffset", h.tooltipOffset);
            item.set("copyText", h.copyText);
            highlights.call<void>("push", item);
        }
        host_.call<void>("mountLayer", layer.size.width, layer.size.height, highlights);
    }

    void unmountLayer() override { host_.call<void>("unmountLayer"); }

    void setLayerHidden(bool hidden) override { host_.call<void>("setLayerHidden", hidden); }

    void updateHighlight(std::uint32_t index, const xray::Rect& box) override {
        host_.call<void>("updateHighlight", index, rectToVal(box));
    }

    void resizeLayer(const xray::Size& size) override {
        host_.call<void>("resizeLayer", size.width, size.height);
    }

    void flashHighlight(std::uint32_t index) override { host_.call<void>("flashHighlight", index); }

private:
    val host_;
};

// Owns the JS-backed ports alongside the engine that borrows them.
class XrayPage {
public:
    XrayPage(val renderTreeHost, val painterHost)
        : tree_(std::move(renderTreeHost)), painter_(std::move(painterHost)) {
        engine_.bindRenderTree(&tree_);
        engine_.bindPainter(&painter_);
    }

    XrayEngine& engine() { return engine_; }

private:
    JsRenderTree tree_;
    JsHighlightPainter painter_;
    XrayEngine engine_;
};

} // namespace

EMSCRIPTEN_BINDINGS(xray_engine_module) {
    emscripten::enum_<xray::overlay::OverlayPhase>("OverlayPhase")
        .value("Hidden", xray::overlay::OverlayPhase::Hidden)
        .value("Visible", xray::overlay::OverlayPhase::Visible)
        .value("PeekHidden", xray::overlay::OverlayPhase::PeekHidden);

    emscripten::enum_<xray::XrayError>("XrayError")
        .value("Ok", xray::XrayError::Ok)
        .value("MissingRoot", xray::XrayError::MissingRoot)
        .value("NoRenderTree", xray::XrayError::NoRenderTree)
        .value("InvalidConfig", xray::XrayError::InvalidConfig);

    emscripten::value_object<xray::protocol::ProtocolInfo>("ProtocolInfo")
        .field("protocolVersion", &xray::protocol::ProtocolInfo::protocolVersion)
        .field("eventStreamVersion", &xray::protocol::ProtocolInfo::eventStreamVersion)
        .field("markerFormatVersion", &xray::protocol::ProtocolInfo::markerFormatVersion);

    emscripten::value_object<xray::protocol::EventBufferMeta>("EventBufferMeta")
        .field("generation", &xray::protocol::EventBufferMeta::generation)
        .field("count", &xray::protocol::EventBufferMeta::count)
        .field("ptr", &xray::protocol::EventBufferMeta::ptr);

    emscripten::value_object<xray::protocol::HideResult>("HideResult")
        .field("wasVisible", &xray::protocol::HideResult::wasVisible);

    emscripten::class_<XrayPage>("XrayPage")
        .constructor<val, val>()
        .function("extract", emscripten::optional_override([](XrayPage& self) {
            return self.engine().extractJson();
        }))
        .function("setConfig", emscripten::optional_override([](XrayPage& self, const std::string& json) {
            return self.engine().setConfigJson(json);
        }))
        .function("show", emscripten::optional_override([](XrayPage& self, bool enabled, const std::string& segmentsJson) {
            return self.engine().showJson(enabled, segmentsJson);
        }))
        .function("remove", emscripten::optional_override([](XrayPage& self) {
            self.engine().remove();
        }))
        .function("hideTemporarily", emscripten::optional_override([](XrayPage& self) {
            return self.engine().hideTemporarily();
        }))
        .function("restore", emscripten::optional_override([](XrayPage& self) {
            self.engine().restore();
        }))
        .function("notifyResize", emscripten::optional_override([](XrayPage& self) {
            self.engine().notifyResize();
        }))
        .function("tick", emscripten::optional_override([](XrayPage& self) {
            self.engine().tick();
        }))
        .function("keyDown", emscripten::optional_override([](XrayPage& self, const std::string& key) {
            self.engine().keyDown(key);
        }))
        .function("keyUp", emscripten::optional_override([](XrayPage& self, const std::string& key) {
            self.engine().keyUp(key);
        }))
        .function("activateHighlight", emscripten::optional_override([](XrayPage& self, std::uint32_t index) {
            return self.engine().activateHighlight(index);
        }))
        .function("getOverlayPhase", emscripten::optional_override([](XrayPage& self) {
            return self.engine().getOverlayPhase();
        }))
        .function("getOverlaySegments", emscripten::optional_override([](XrayPage& self) {
            return self.engine().getOverlaySegmentsJson();
        }))
        .function("pollEvents", emscripten::optional_override([](XrayPage& self, std::uint32_t maxEvents) {
            return self.engine().pollEvents(maxEvents);
        }))
        .function("ackResync", emscripten::optional_override([](XrayPage& self, std::uint32_t generation) {
            self.engine().ackResync(generation);
        }))
        .function("getProtocolInfo", emscripten::optional_override([](XrayPage& self) {
            return self.engine().getProtocolInfo();
        }))
        .function("getLastError", emscripten::optional_override([](XrayPage& self) {
            return self.engine().getLastError();
        }));
}
#endif
