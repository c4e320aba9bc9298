#include <gtest/gtest.h>
#include "xray/overlay/highlight_layer.h"

using namespace xray::overlay;
using xray::MatchState;
using xray::Rect;
using xray::Segment;

namespace {
Segment makeSegment(const std::string& text, const Rect& geometry, nlohmann::json metadata = nlohmann::json::object()) {
    Segment segment;
    segment.text = text;
    segment.geometry = geometry;
    segment.metadata = std::move(metadata);
    return segment;
}
} // namespace

TEST(HighlightLayerTest, BoxIsPaddedWithMinimumSize) {
    const xray::OverlayConfig config;
    EXPECT_EQ(highlightBox(Rect{100.0f, 200.0f, 50.0f, 18.0f}, config), (Rect{96.0f, 196.0f, 58.0f, 26.0f}));
    // Tiny and zero rects grow to 20x16 before padding.
    EXPECT_EQ(highlightBox(Rect{10.0f, 10.0f, 5.0f, 5.0f}, config), (Rect{6.0f, 6.0f, 28.0f, 24.0f}));
    EXPECT_EQ(highlightBox(xray::kZeroRect, config), (Rect{-4.0f, -4.0f, 28.0f, 24.0f}));
}

TEST(HighlightLayerTest, ColorFollowsMatchState) {
    EXPECT_EQ(colorFor(MatchState::Unknown), HighlightColor::Default);
    EXPECT_EQ(colorFor(MatchState::Matched), HighlightColor::Matched);
    EXPECT_EQ(colorFor(MatchState::Unmatched), HighlightColor::Unmatched);
    EXPECT_STREQ(colorClassName(HighlightColor::Unmatched), "unmatched");
}

TEST(HighlightLayerTest, TooltipListsSegmentTextAndMetadata) {
    const xray::OverlayConfig config;
    const Segment segment = makeSegment("Welcome back", Rect{0.0f, 0.0f, 10.0f, 10.0f},
        nlohmann::json{{"g", "guid-1"}, {"sid", "home.welcome"}, {"count", 3}, {"skip", nullptr}});

    const std::vector<std::string> lines = tooltipLines(segment, 4, config);
    const std::vector<std::string> expected = {
        "Segment #5",
        "Text: Welcome back",
        "",
        "Count: 3",
        "G: guid-1",
        "Sid: home.welcome",
    };
    EXPECT_EQ(lines, expected);
}

TEST(HighlightLayerTest, TooltipTruncatesLongValues) {
    const xray::OverlayConfig config;
    const std::string longText(80, 'a');
    const std::string longValue(50, 'b');
    const Segment segment = makeSegment(longText, xray::kZeroRect, nlohmann::json{{"note", longValue}});

    const std::vector<std::string> lines = tooltipLines(segment, 0, config);
    ASSERT_EQ(lines.size(), 4u);
    EXPECT_EQ(lines[1], "Text: " + std::string(60, 'a') + "...");
    EXPECT_EQ(lines[3], "Note: " + std::string(40, 'b') + "...");
}

TEST(HighlightLayerTest, TooltipReportsDecodeError) {
    const xray::OverlayConfig config;
    Segment segment = makeSegment("Broken", xray::kZeroRect);
    segment.decodingError = "Invalid fe00 encoded input length";

    const std::vector<std::string> lines = tooltipLines(segment, 0, config);
    ASSERT_EQ(lines.size(), 4u);
    EXPECT_EQ(lines[2], "");
    EXPECT_EQ(lines[3], "Decode Error: Invalid fe00 encoded input length");
    EXPECT_EQ(joinLines({"a", "", "b"}), "a\n\nb");
}

TEST(HighlightLayerTest, TooltipFlipsAboveLowerOnThePage) {
    const xray::OverlayConfig config;
    const Highlight top = buildHighlight(makeSegment("t", Rect{10.0f, 50.0f, 40.0f, 18.0f}), 0, config);
    const Highlight low = buildHighlight(makeSegment("t", Rect{10.0f, 300.0f, 40.0f, 18.0f}), 1, config);
    EXPECT_EQ(top.tooltipPlacement, TooltipPlacement::Below);
    EXPECT_EQ(low.tooltipPlacement, TooltipPlacement::Above);
    EXPECT_FLOAT_EQ(low.tooltipOffset, 23.0f);
}

TEST(HighlightLayerTest, CopyTextIsTheGuid) {
    EXPECT_EQ(copyTextFor(makeSegment("t", xray::kZeroRect, nlohmann::json{{"g", "guid-9"}})), "guid-9");
    EXPECT_EQ(copyTextFor(makeSegment("t", xray::kZeroRect, nlohmann::json{{"g", 12}})), "");
    EXPECT_EQ(copyTextFor(makeSegment("t", xray::kZeroRect)), "");
}

TEST(HighlightLayerTest, LayerCoversDocumentAndIndexesHighlights) {
    const xray::OverlayConfig config;
    std::vector<Segment> segments = {
        makeSegment("a", Rect{0.0f, 0.0f, 30.0f, 20.0f}),
        makeSegment("b", Rect{0.0f, 40.0f, 30.0f, 20.0f}),
    };
    segments[1].matched = MatchState::Matched;

    const HighlightLayer layer = buildHighlightLayer(segments, xray::Size{1024.0f, 3000.0f}, config);
    EXPECT_FLOAT_EQ(layer.size.height, 3000.0f);
    ASSERT_EQ(layer.highlights.size(), 2u);
    EXPECT_EQ(layer.highlights[1].index, 1u);
    EXPECT_EQ(layer.highlights[1].color, HighlightColor::Matched);
    EXPECT_EQ(layer.highlights[1].tooltipLines[0], "Segment #2");
}
