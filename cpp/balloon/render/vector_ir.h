#ifndef BALLOON_RENDER_VECTOR_IR_H
#define BALLOON_RENDER_VECTOR_IR_H

#include "balloon/core/types.h"

#include <cstdint>
#include <vector>

namespace balloon::vector {

// Outline geometry in bubble-local coordinates (y grows downward).

enum class SegmentKind : std::uint8_t { Move = 0, Line = 1, Quad = 2, Cubic = 3, Arc = 4, Close = 5 };

struct Segment {
    SegmentKind kind{SegmentKind::Move};
    // For Move/Line: to
    // For Quad: c, to
    // For Cubic: c1, c2, to
    // For Arc: center, radius, startAngle, endAngle, ccw (ccw = increasing angle)
    Point2 to{};
    Point2 c{};
    Point2 c1{};
    Point2 c2{};
    Point2 center{};
    float radius{0.0f};
    float startAngle{0.0f};
    float endAngle{0.0f};
    bool ccw{true};

    static Segment moveTo(Point2 p) noexcept {
        Segment s;
        s.kind = SegmentKind::Move;
        s.to = p;
        return s;
    }
    static Segment lineTo(Point2 p) noexcept {
        Segment s;
        s.kind = SegmentKind::Line;
        s.to = p;
        return s;
    }
    static Segment quadTo(Point2 control, Point2 p) noexcept {
        Segment s;
        s.kind = SegmentKind::Quad;
        s.c = control;
        s.to = p;
        return s;
    }
    static Segment cubicTo(Point2 control1, Point2 control2, Point2 p) noexcept {
        Segment s;
        s.kind = SegmentKind::Cubic;
        s.c1 = control1;
        s.c2 = control2;
        s.to = p;
        return s;
    }
    // Circular arc continuing from the current point (which must sit at startAngle).
    static Segment arcTo(Point2 arcCenter, float arcRadius, float arcStartAngle, float arcEndAngle, bool arcCcw) noexcept {
        Segment s;
        s.kind = SegmentKind::Arc;
        s.center = arcCenter;
        s.radius = arcRadius;
        s.startAngle = arcStartAngle;
        s.endAngle = arcEndAngle;
        s.ccw = arcCcw;
        s.to = arcPoint(arcCenter, arcRadius, arcEndAngle);
        return s;
    }
    static Segment close() noexcept {
        Segment s;
        s.kind = SegmentKind::Close;
        return s;
    }

    static Point2 arcPoint(Point2 center, float radius, float angle) noexcept;
};

struct Path {
    std::vector<Segment> segments;

    bool empty() const { return segments.empty(); }
    void moveTo(Point2 p) { segments.push_back(Segment::moveTo(p)); }
    void lineTo(Point2 p) { segments.push_back(Segment::lineTo(p)); }
    void quadTo(Point2 c, Point2 p) { segments.push_back(Segment::quadTo(c, p)); }
    void arcTo(Point2 center, float radius, float start, float end, bool ccw = true) {
        segments.push_back(Segment::arcTo(center, radius, start, end, ccw));
    }
    void close() { segments.push_back(Segment::close()); }
};

struct Bounds {
    float minX{0.0f};
    float minY{0.0f};
    float maxX{0.0f};
    float maxY{0.0f};

    float width() const { return maxX - minX; }
    float height() const { return maxY - minY; }
};

} // namespace balloon::vector

#endif // BALLOON_RENDER_VECTOR_IR_H
