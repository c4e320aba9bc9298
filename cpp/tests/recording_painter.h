#pragma once

#include "xray/overlay/highlight_painter.h"

#include <cstdint>
#include <string>
#include <vector>

namespace xray_test {

// Keeps the last mounted layer and a log of every call.
class RecordingPainter : public xray::overlay::HighlightPainter {
public:
    void mountLayer(const xray::overlay::HighlightLayer& layer) override {
        log.push_back("mount");
        mounted = true;
        hidden = false;
        layer_ = layer;
        mountCount++;
    }

    void unmountLayer() override {
        log.push_back("unmount");
        mounted = false;
        hidden = false;
        layer_ = xray::overlay::HighlightLayer{};
    }

    void setLayerHidden(bool value) override {
        log.push_back(value ? "hide" : "unhide");
        hidden = value;
    }

    void updateHighlight(std::uint32_t index, const xray::Rect& box) override {
        log.push_back("update:" + std::to_string(index));
        if (index < layer_.highlights.size()) {
            layer_.highlights[index].box = box;
        }
    }

    void resizeLayer(const xray::Size& size) override {
        log.push_back("resize");
        layer_.size = size;
    }

    void flashHighlight(std::uint32_t index) override {
        log.push_back("flash:" + std::to_string(index));
    }

    const xray::overlay::HighlightLayer& layer() const { return layer_; }

    std::vector<std::string> log;
    bool mounted{false};
    bool hidden{false};
    std::uint32_t mountCount{0};

private:
    xray::overlay::HighlightLayer layer_{};
};

} // namespace xray_test
