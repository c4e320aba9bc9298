#include <gtest/gtest.h>
#include "xray/dom/text_node_filter.h"
#include "tests/fake_render_tree.h"

#include <locale>
#include <stdexcept>

using xray::dom::ComputedStyle;
using xray::dom::TextNodeFilter;
using xray_test::FakeRenderTree;

namespace {
ComputedStyle visibleStyle(const std::string& tag) {
    ComputedStyle style;
    style.tagName = tag;
    style.display = "inline";
    style.visibility = "visible";
    style.opacity = "1";
    return style;
}
} // namespace

TEST(TextNodeFilterTest, HiddenStylesAreNotRendered) {
    ComputedStyle style = visibleStyle("SPAN");
    EXPECT_TRUE(TextNodeFilter::isRendered(style));

    style.display = "none";
    EXPECT_FALSE(TextNodeFilter::isRendered(style));

    style = visibleStyle("SPAN");
    style.visibility = "hidden";
    EXPECT_FALSE(TextNodeFilter::isRendered(style));

    style = visibleStyle("SPAN");
    style.opacity = "0";
    EXPECT_FALSE(TextNodeFilter::isRendered(style));
    style.opacity = "0.0";
    EXPECT_FALSE(TextNodeFilter::isRendered(style));
}

TEST(TextNodeFilterTest, NearZeroOrUnparsableOpacityStillRenders) {
    ComputedStyle style = visibleStyle("SPAN");
    style.opacity = "0.01";
    EXPECT_TRUE(TextNodeFilter::isRendered(style));
    style.opacity = "";
    EXPECT_TRUE(TextNodeFilter::isRendered(style));
    style.opacity = "auto";
    EXPECT_TRUE(TextNodeFilter::isRendered(style));
}

TEST(TextNodeFilterTest, OpacityParsingIgnoresCommaDecimalLocale) {
    const std::locale previous;
    try {
        std::locale::global(std::locale("de_DE.UTF-8"));
    } catch (const std::runtime_error&) {
        GTEST_SKIP() << "de_DE.UTF-8 locale not installed";
    }

    ComputedStyle style = visibleStyle("SPAN");
    style.opacity = "0.5";
    const bool halfRendered = TextNodeFilter::isRendered(style);
    style.opacity = "0.0";
    const bool zeroRendered = TextNodeFilter::isRendered(style);
    std::locale::global(previous);

    EXPECT_TRUE(halfRendered);
    EXPECT_FALSE(zeroRendered);
}

TEST(TextNodeFilterTest, NonContentTagsAreExcludedCaseInsensitively) {
    for (const char* tag : {"SCRIPT", "style", "NoScript", "TEXTAREA", "head"}) {
        EXPECT_TRUE(TextNodeFilter::isExcludedTag(visibleStyle(tag))) << tag;
    }
    EXPECT_FALSE(TextNodeFilter::isExcludedTag(visibleStyle("P")));
    EXPECT_FALSE(TextNodeFilter::isExcludedTag(visibleStyle("BUTTON")));
}

TEST(TextNodeFilterTest, AcceptsUsesOwningElementStyle) {
    FakeRenderTree tree;
    const xray::NodeId shown = tree.addSpanText("shown", xray::Rect{10.0f, 10.0f, 50.0f, 20.0f});
    const xray::ElementId script = tree.addElement(tree.body(), "SCRIPT", xray::Rect{0.0f, 0.0f, 0.0f, 0.0f});
    const xray::NodeId code = tree.addText(script, "var x;", xray::Rect{0.0f, 0.0f, 0.0f, 0.0f});
    const xray::NodeId orphan = tree.addText(xray::kNoElement, "detached", xray::Rect{0.0f, 0.0f, 1.0f, 1.0f});

    const TextNodeFilter filter(tree);
    EXPECT_TRUE(filter.accepts(shown));
    EXPECT_FALSE(filter.accepts(code));
    EXPECT_FALSE(filter.accepts(orphan));

    tree.style(tree.owningElement(shown)).display = "none";
    EXPECT_FALSE(filter.accepts(shown));
}
