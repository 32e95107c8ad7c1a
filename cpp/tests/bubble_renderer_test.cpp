#include <gtest/gtest.h>
#include "balloon/render/bubble_renderer.h"
#include "balloon/render/path_flatten.h"
#include "balloon/shape/shape_generator.h"
#include "tests/test_common.h"

#include <algorithm>
#include <cmath>

using namespace balloon;
using namespace balloon_test;

class BubbleRendererTest : public ::testing::Test {
protected:
    FixedAdvanceSurface surface;
    BubbleRenderer renderer{surface};
};

TEST_F(BubbleRendererTest, SpeechBubbleDrawsFilledOutlineAndText) {
    Bubble b = speechDownWithTail();
    b.x = 40.0f;
    b.y = 30.0f;
    renderer.render(b);

    const auto polygons = surface.commandsOf(DrawCommandKind::FillPolygon);
    const auto strokes = surface.commandsOf(DrawCommandKind::StrokePolyline);
    ASSERT_EQ(polygons.size(), 1u);
    ASSERT_EQ(strokes.size(), 1u);
    EXPECT_EQ(polygons[0]->fillRGBA, 0xFFFFFFFFu);
    EXPECT_EQ(strokes[0]->strokeRGBA, 0x000000FFu);
    EXPECT_FLOAT_EQ(strokes[0]->strokeWidth, 2.0f);
    EXPECT_TRUE(strokes[0]->dash.empty());
    EXPECT_TRUE(strokes[0]->closed);

    // Outline is drawn in canvas space: the tail tip sits at (x + 75, y + 120).
    float maxY = 0.0f;
    float minX = 1e9f;
    for (const Point2& p : polygons[0]->points) {
        maxY = std::max(maxY, p.y);
        minX = std::min(minX, p.x);
    }
    EXPECT_NEAR(maxY, 30.0f + 120.0f, 1e-3f);
    EXPECT_NEAR(minX, 40.0f, 0.5f);

    const auto texts = surface.commandsOf(DrawCommandKind::FillText);
    ASSERT_EQ(texts.size(), 1u);
    EXPECT_EQ(texts[0]->text, "Hello");
    EXPECT_EQ(texts[0]->font.family, "Comic Neue");
    EXPECT_GT(texts[0]->points[0].x, 40.0f);
    EXPECT_LT(texts[0]->points[0].y, 30.0f + 90.0f);
}

TEST_F(BubbleRendererTest, WhisperIsDashed) {
    renderer.render(makeBubble(BubbleType::Whisper));
    const auto strokes = surface.commandsOf(DrawCommandKind::StrokePolyline);
    ASSERT_FALSE(strokes.empty());
    EXPECT_EQ(strokes[0]->dash, (std::vector<float>{5.0f, 5.0f}));
}

TEST_F(BubbleRendererTest, TextOnlyDrawsNoBody) {
    renderer.render(makeBubble(BubbleType::TextOnly));
    EXPECT_TRUE(surface.commandsOf(DrawCommandKind::FillPolygon).empty());
    EXPECT_TRUE(surface.commandsOf(DrawCommandKind::StrokePolyline).empty());
    EXPECT_EQ(surface.commandsOf(DrawCommandKind::FillText).size(), 1u);
}

TEST_F(BubbleRendererTest, ThoughtDotsAreCircles) {
    const Bubble b = thoughtWithDots(1, 3);
    renderer.render(b);

    const std::size_t cloudContours = vector::flattenPath(shape::generateShape(b).outline, 0.25f).size();
    const auto polygons = surface.commandsOf(DrawCommandKind::FillPolygon);
    ASSERT_EQ(polygons.size(), cloudContours + 3);

    // Last polygon is the third dot: center (80, 124), radius 4.
    for (const Point2& p : polygons.back()->points) {
        const float dx = p.x - 80.0f;
        const float dy = p.y - 124.0f;
        EXPECT_NEAR(std::sqrt(dx * dx + dy * dy), 4.0f, 1e-2f);
    }
}

TEST_F(BubbleRendererTest, BorderColorIsParsed) {
    Bubble b = makeBubble(BubbleType::Descriptive);
    b.borderColor = "#ff0000";
    renderer.render(b);
    const auto strokes = surface.commandsOf(DrawCommandKind::StrokePolyline);
    ASSERT_EQ(strokes.size(), 1u);
    EXPECT_EQ(strokes[0]->strokeRGBA, 0xFF0000FFu);

    // Unparseable colors fall back to black.
    surface.clear();
    b.borderColor = "not-a-color";
    renderer.render(b);
    EXPECT_EQ(surface.commandsOf(DrawCommandKind::StrokePolyline)[0]->strokeRGBA, 0x000000FFu);
}

TEST_F(BubbleRendererTest, SceneDrawsInZOrder) {
    Bubble low = makeBubble(BubbleType::Descriptive, 150.0f, 90.0f, 1);
    low.text = "low";
    low.zIndex = 5;
    Bubble high = makeBubble(BubbleType::Descriptive, 150.0f, 90.0f, 2);
    high.text = "high";
    high.zIndex = 12;
    renderer.renderScene({high, low});

    const auto texts = surface.commandsOf(DrawCommandKind::FillText);
    ASSERT_EQ(texts.size(), 2u);
    EXPECT_EQ(texts[0]->text, "low");
    EXPECT_EQ(texts[1]->text, "high");
}

TEST_F(BubbleRendererTest, RenderLeavesTheSurfaceStateUntouched) {
    Bubble b = makeBubble(BubbleType::Shout);
    b.x = 300.0f;
    b.y = 200.0f;
    renderer.render(b);

    surface.strokeLine(0.0f, 0.0f, 1.0f, 1.0f);
    const auto lines = surface.commandsOf(DrawCommandKind::StrokeLine);
    ASSERT_FALSE(lines.empty());
    EXPECT_FLOAT_EQ(lines.back()->points[0].x, 0.0f);
    EXPECT_FLOAT_EQ(lines.back()->points[0].y, 0.0f);
}

TEST(BubbleTextStyleTest, UsesBubbleFontSettings) {
    Bubble b = makeBubble(BubbleType::SpeechDown);
    b.fontFamily = FontName::Bangers;
    b.fontSize = 22.0f;
    b.textColor = "#123456";
    const text::TextStyle style = bubbleTextStyle(b);
    EXPECT_EQ(style.fontFamily, "font-bangers");
    EXPECT_FLOAT_EQ(style.fontSize, 22.0f);
    EXPECT_EQ(style.color, "#123456");
}
