#include <gtest/gtest.h>
#include "balloon/render/path_flatten.h"
#include "balloon/shape/shape_generator.h"
#include "tests/test_common.h"

#include <algorithm>

using namespace balloon;
using namespace balloon::shape;
using namespace balloon_test;

namespace {

std::size_t countSegments(const vector::Path& path, vector::SegmentKind kind) {
    return static_cast<std::size_t>(std::count_if(path.segments.begin(), path.segments.end(),
        [kind](const vector::Segment& s) { return s.kind == kind; }));
}

} // namespace

TEST(ShapeGeneratorTest, SpeechOutlineReachesTheTailTip) {
    const Bubble b = speechDownWithTail();
    const BubbleShape shape = generateShape(b);
    ASSERT_FALSE(shape.outline.empty());
    EXPECT_TRUE(shape.auxiliaryCircles.empty());

    const vector::Bounds bounds = vector::pathBounds(shape.outline, 0.1f);
    EXPECT_NEAR(bounds.minX, 0.0f, 0.01f);
    EXPECT_NEAR(bounds.maxX, 150.0f, 0.01f);
    EXPECT_NEAR(bounds.minY, 0.0f, 0.01f);
    EXPECT_NEAR(bounds.maxY, 120.0f, 0.01f);
    // Two quadratics cut the tail into the bottom edge.
    EXPECT_EQ(countSegments(shape.outline, vector::SegmentKind::Quad), 2u);
}

TEST(ShapeGeneratorTest, SpeechUpTailPointsAboveTheBody) {
    Bubble b = makeBubble(BubbleType::SpeechUp);
    b.parts.push_back(bottomTail(2, 75.0f, 0.0f, 75.0f, -30.0f));
    EXPECT_EQ(tailEdgeOf(b.parts[0].tail(), b.width, b.height), TailEdge::Top);

    const vector::Bounds bounds = vector::pathBounds(generateShape(b).outline, 0.1f);
    EXPECT_NEAR(bounds.minY, -30.0f, 0.01f);
    EXPECT_NEAR(bounds.maxY, 90.0f, 0.01f);
}

TEST(ShapeGeneratorTest, TailOnASideEdge) {
    Bubble b = makeBubble(BubbleType::SpeechDown);
    b.parts.push_back(bottomTail(2, 150.0f, 45.0f, 190.0f, 45.0f));
    EXPECT_EQ(tailEdgeOf(b.parts[0].tail(), b.width, b.height), TailEdge::Right);

    const vector::Bounds bounds = vector::pathBounds(generateShape(b).outline, 0.1f);
    EXPECT_NEAR(bounds.maxX, 190.0f, 0.01f);
    EXPECT_NEAR(bounds.maxY, 90.0f, 0.01f);
}

TEST(ShapeGeneratorTest, TailEdgeClassification) {
    SpeechTailPart tail;
    tail.baseCX = 75.0f;
    tail.baseCY = 45.0f;
    EXPECT_EQ(tailEdgeOf(tail, 150.0f, 90.0f), TailEdge::None);

    tail.baseCX = 0.0f;
    EXPECT_EQ(tailEdgeOf(tail, 150.0f, 90.0f), TailEdge::Left);

    // Out-of-range bases are clamped onto the rectangle first.
    tail.baseCX = 75.0f;
    tail.baseCY = 200.0f;
    EXPECT_EQ(tailEdgeOf(tail, 150.0f, 90.0f), TailEdge::Bottom);
}

TEST(ShapeGeneratorTest, CornerRadiusPerType) {
    EXPECT_FLOAT_EQ(cornerRadiusFor(BubbleType::SpeechDown, 150.0f, 90.0f), 45.0f);
    EXPECT_FLOAT_EQ(cornerRadiusFor(BubbleType::Whisper, 60.0f, 200.0f), 30.0f);
    EXPECT_FLOAT_EQ(cornerRadiusFor(BubbleType::Descriptive, 150.0f, 90.0f), 5.0f);
    EXPECT_FLOAT_EQ(cornerRadiusFor(BubbleType::Shout, 150.0f, 90.0f), 0.0f);
}

TEST(ShapeGeneratorTest, TextOnlyHasNoOutline) {
    const BubbleShape shape = generateShape(makeBubble(BubbleType::TextOnly));
    EXPECT_TRUE(shape.outline.empty());
    EXPECT_TRUE(shape.auxiliaryCircles.empty());
}

TEST(ShapeGeneratorTest, ThoughtCloudAndDots) {
    const Bubble b = thoughtWithDots(1, 3);
    const BubbleShape shape = generateShape(b);

    const std::size_t lobes = countSegments(shape.outline, vector::SegmentKind::Quad);
    EXPECT_GE(lobes, 7u);
    EXPECT_LE(lobes, 12u);

    ASSERT_EQ(shape.auxiliaryCircles.size(), 3u);
    for (std::size_t i = 0; i < 3; ++i) {
        EXPECT_EQ(shape.auxiliaryCircles[i].id, b.parts[i].id);
        EXPECT_FLOAT_EQ(shape.auxiliaryCircles[i].center.x, b.parts[i].dot().offsetX);
        EXPECT_FLOAT_EQ(shape.auxiliaryCircles[i].radius, b.parts[i].dot().size * 0.5f);
    }
}

TEST(ShapeGeneratorTest, ShoutStarHasFourteenSpikes) {
    const BubbleShape shape = generateShape(makeBubble(BubbleType::Shout));
    EXPECT_EQ(countSegments(shape.outline, vector::SegmentKind::Move), 1u);
    EXPECT_EQ(countSegments(shape.outline, vector::SegmentKind::Line), 27u);
    EXPECT_EQ(countSegments(shape.outline, vector::SegmentKind::Close), 1u);
}

TEST(ShapeGeneratorTest, ShoutVariantsDifferButAreReproducible) {
    Bubble v0 = makeBubble(BubbleType::Shout, 150.0f, 90.0f, 7);
    Bubble v1 = v0;
    v1.shapeVariant = 1;

    const std::string a = vector::toSvgPathData(generateShape(v0).outline);
    const std::string b = vector::toSvgPathData(generateShape(v1).outline);
    EXPECT_NE(a, b);
    EXPECT_EQ(a, vector::toSvgPathData(generateShape(v0).outline));
    EXPECT_EQ(b, vector::toSvgPathData(generateShape(v1).outline));
}

TEST(ShapeGeneratorTest, ThoughtCloudIsReproducible) {
    const Bubble b = thoughtWithDots(4, 0);
    EXPECT_EQ(vector::toSvgPathData(generateShape(b).outline), vector::toSvgPathData(generateShape(b).outline));
}

TEST(ShapeGeneratorTest, DegenerateSizeIsClampedNotFatal) {
    const Bubble b = makeBubble(BubbleType::Descriptive, 0.0f, -10.0f);
    const vector::Bounds bounds = vector::pathBounds(generateShape(b).outline, 0.1f);
    EXPECT_NEAR(bounds.width(), kMinBubbleWidth, 0.01f);
    EXPECT_NEAR(bounds.height(), kMinBubbleHeight, 0.01f);
}

TEST(ShapeGeneratorTest, OverallBoundsCoverTailAndPadding) {
    const Rect r = overallBounds(speechDownWithTail());
    EXPECT_FLOAT_EQ(r.x, -10.0f);
    EXPECT_FLOAT_EQ(r.y, -10.0f);
    EXPECT_FLOAT_EQ(r.width, 170.0f);
    EXPECT_FLOAT_EQ(r.height, 140.0f);
}
