#include <gtest/gtest.h>
#include "balloon/render/path_flatten.h"

#include <cmath>

using namespace balloon;
using namespace balloon::vector;

namespace {

constexpr float kPi = 3.14159265358979323846f;

Path rectPath(float w, float h) {
    Path p;
    p.moveTo(Point2{0.0f, 0.0f});
    p.lineTo(Point2{w, 0.0f});
    p.lineTo(Point2{w, h});
    p.lineTo(Point2{0.0f, h});
    p.close();
    return p;
}

} // namespace

TEST(VectorPathTest, ClosedContourRepeatsFirstPoint) {
    const std::vector<Contour> contours = flattenPath(rectPath(100.0f, 50.0f));
    ASSERT_EQ(contours.size(), 1u);
    const Contour& c = contours[0];
    EXPECT_TRUE(c.closed);
    ASSERT_EQ(c.points.size(), 5u);
    EXPECT_FLOAT_EQ(c.points.front().x, c.points.back().x);
    EXPECT_FLOAT_EQ(c.points.front().y, c.points.back().y);
    EXPECT_NEAR(polylineLength(c.points), 300.0f, 1e-3f);
}

TEST(VectorPathTest, ArcPointsStayOnTheCircle) {
    Path p;
    const Point2 center{50.0f, 50.0f};
    p.moveTo(Segment::arcPoint(center, 20.0f, 0.0f));
    p.arcTo(center, 20.0f, 0.0f, kPi * 0.5f);

    const std::vector<Contour> contours = flattenPath(p, 0.1f);
    ASSERT_EQ(contours.size(), 1u);
    ASSERT_GT(contours[0].points.size(), 3u);
    for (const Point2& pt : contours[0].points) {
        EXPECT_NEAR(std::hypot(pt.x - center.x, pt.y - center.y), 20.0f, 1e-3f);
    }
    EXPECT_NEAR(contours[0].points.back().x, 50.0f, 1e-3f);
    EXPECT_NEAR(contours[0].points.back().y, 70.0f, 1e-3f);
}

TEST(VectorPathTest, QuadFlatteningHonorsTolerance) {
    Path p;
    p.moveTo(Point2{0.0f, 0.0f});
    p.quadTo(Point2{50.0f, 100.0f}, Point2{100.0f, 0.0f});

    const std::vector<Contour> coarse = flattenPath(p, 5.0f);
    const std::vector<Contour> fine = flattenPath(p, 0.05f);
    ASSERT_EQ(coarse.size(), 1u);
    ASSERT_EQ(fine.size(), 1u);
    EXPECT_LT(coarse[0].points.size(), fine[0].points.size());

    // The curve peaks at half the control height.
    const Bounds b = pathBounds(p, 0.05f);
    EXPECT_NEAR(b.maxY, 50.0f, 0.1f);
    EXPECT_NEAR(b.width(), 100.0f, 1e-3f);
}

TEST(VectorPathTest, ResampleSpacesPointsEvenly) {
    const std::vector<Contour> contours = flattenPath(rectPath(100.0f, 50.0f));
    const std::vector<Point2> samples = resampleByArcLength(contours, 6);
    ASSERT_EQ(samples.size(), 7u);
    // Perimeter 300: one sample every 50 units.
    EXPECT_NEAR(samples[0].x, 0.0f, 1e-3f);
    EXPECT_NEAR(samples[1].x, 50.0f, 1e-3f);
    EXPECT_NEAR(samples[2].x, 100.0f, 1e-3f);
    EXPECT_NEAR(samples[3].y, 50.0f, 1e-3f);
    EXPECT_NEAR(samples[3].x, 100.0f, 1e-3f);
    EXPECT_NEAR(samples[6].x, 0.0f, 1e-3f);
    EXPECT_NEAR(samples[6].y, 0.0f, 1e-3f);
}

TEST(VectorPathTest, ResampleOfEmptyInputIsEmpty) {
    EXPECT_TRUE(resampleByArcLength({}, 10).empty());
    EXPECT_TRUE(flattenPath(Path{}).empty());
}

TEST(VectorPathTest, SvgPathData) {
    Path p;
    p.moveTo(Point2{0.0f, 0.0f});
    p.lineTo(Point2{10.5f, 0.0f});
    p.quadTo(Point2{12.0f, 5.0f}, Point2{10.0f, 10.0f});
    p.close();
    EXPECT_EQ(toSvgPathData(p), "M0,0 L10.5,0 Q12,5 10,10 Z");
}
