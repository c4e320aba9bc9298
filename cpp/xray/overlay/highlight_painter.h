#pragma once

#include "xray/core/types.h"
#include "xray/overlay/highlight_layer.h"

#include <cstdint>

namespace xray::overlay {

// Paint side of the overlay. The host draws; the engine only tells it what.
// At most one layer is mounted at a time.
class HighlightPainter {
public:
    virtual ~HighlightPainter() = default;

    virtual void mountLayer(const HighlightLayer& layer) = 0;
    virtual void unmountLayer() = 0;
    virtual void setLayerHidden(bool hidden) = 0;
    virtual void updateHighlight(std::uint32_t index, const Rect& box) = 0;
    virtual void resizeLayer(const Size& size) = 0;
    virtual void flashHighlight(std::uint32_t index) = 0;
};

} // namespace xray::overlay
