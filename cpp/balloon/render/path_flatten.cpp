#include "balloon/render/path_flatten.h"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdio>
#include <limits>

namespace balloon::vector {

namespace {

static constexpr float eps = 1e-6f;
static constexpr float kPi = 3.14159265358979323846f;

inline Point2 sub(const Point2& a, const Point2& b) noexcept { return Point2{a.x - b.x, a.y - b.y}; }
inline Point2 add(const Point2& a, const Point2& b) noexcept { return Point2{a.x + b.x, a.y + b.y}; }
inline Point2 mul(const Point2& a, float s) noexcept { return Point2{a.x * s, a.y * s}; }
inline float dot(const Point2& a, const Point2& b) noexcept { return a.x * b.x + a.y * b.y; }
inline float len2(const Point2& v) noexcept { return dot(v, v); }
inline float len(const Point2& v) noexcept { return std::sqrt(len2(v)); }

void pushUniquePoint(const Point2& p, std::vector<Point2>& out, float minDist2) {
    if (out.empty()) {
        out.push_back(p);
        return;
    }
    const Point2 d = sub(p, out.back());
    if (len2(d) <= minDist2) return;
    out.push_back(p);
}

float pointLineDistance(const Point2& p, const Point2& a, const Point2& b) noexcept {
    const Point2 ab = sub(b, a);
    const float abLen2 = len2(ab);
    if (!(abLen2 > eps)) return len(sub(p, a));
    const float t = dot(sub(p, a), ab) / abLen2;
    const float clamped = std::min(1.0f, std::max(0.0f, t));
    const Point2 proj = add(a, mul(ab, clamped));
    return len(sub(p, proj));
}

void flattenQuadratic(const Point2& p0, const Point2& c, const Point2& p1, float tol,
    std::vector<QuadWork>& stack, std::vector<Point2>& out) {
    stack.clear();
    stack.push_back(QuadWork{p0, c, p1});

    const float minDist2 = tol * tol * 0.25f;
    while (!stack.empty()) {
        const QuadWork w = stack.back();
        stack.pop_back();

        const float d = pointLineDistance(w.c, w.p0, w.p1);
        if (!(d > tol)) {
            pushUniquePoint(w.p1, out, minDist2);
            continue;
        }

        const Point2 p0c = mul(add(w.p0, w.c), 0.5f);
        const Point2 cp1 = mul(add(w.c, w.p1), 0.5f);
        const Point2 mid = mul(add(p0c, cp1), 0.5f);
        // Second half first so the first half pops first.
        stack.push_back(QuadWork{mid, cp1, w.p1});
        stack.push_back(QuadWork{w.p0, p0c, mid});
    }
}

void flattenCubic(const Point2& p0, const Point2& c1, const Point2& c2, const Point2& p1, float tol,
    std::vector<CubicWork>& stack, std::vector<Point2>& out) {
    stack.clear();
    stack.push_back(CubicWork{p0, c1, c2, p1});

    const float minDist2 = tol * tol * 0.25f;
    while (!stack.empty()) {
        const CubicWork w = stack.back();
        stack.pop_back();

        const float d = std::max(pointLineDistance(w.c1, w.p0, w.p1), pointLineDistance(w.c2, w.p0, w.p1));
        if (!(d > tol)) {
            pushUniquePoint(w.p1, out, minDist2);
            continue;
        }

        const Point2 p01 = mul(add(w.p0, w.c1), 0.5f);
        const Point2 p12 = mul(add(w.c1, w.c2), 0.5f);
        const Point2 p23 = mul(add(w.c2, w.p1), 0.5f);
        const Point2 p012 = mul(add(p01, p12), 0.5f);
        const Point2 p123 = mul(add(p12, p23), 0.5f);
        const Point2 mid = mul(add(p012, p123), 0.5f);

        stack.push_back(CubicWork{mid, p123, p23, w.p1});
        stack.push_back(CubicWork{w.p0, p01, p012, mid});
    }
}

// Signed sweep from start to end in the requested direction, in (-2pi, 2pi).
float arcSweep(float startAngle, float endAngle, bool ccw) noexcept {
    constexpr float twoPi = 2.0f * kPi;
    float sweep = std::fmod(endAngle - startAngle, twoPi);
    if (ccw) {
        if (sweep < 0.0f) sweep += twoPi;
    } else {
        if (sweep > 0.0f) sweep -= twoPi;
    }
    return sweep;
}

void flattenArc(const Point2& center, float radius, float startAngle, float endAngle, bool ccw, float tol,
    std::vector<Point2>& out) {
    const float r = std::abs(radius);
    if (!(r > eps)) return;

    const float sweep = arcSweep(startAngle, endAngle, ccw);
    const float absSweep = std::abs(sweep);
    if (!(absSweep > eps)) return;

    // Step bounded by the sagitta tolerance.
    float step = absSweep;
    if (tol > 0.0f && r > tol) {
        const float cosv = 1.0f - std::min(1.0f, tol / r);
        const float maxStep = std::max(1e-3f, 2.0f * std::acos(std::max(-1.0f, std::min(1.0f, cosv))));
        step = std::min(step, maxStep);
    } else {
        step = std::min(step, 0.15f);
    }

    const int segments = std::max(1, static_cast<int>(std::ceil(absSweep / step)));
    const float minDist2 = tol * tol * 0.25f;
    for (int i = 1; i <= segments; i++) {
        const float t = static_cast<float>(i) / static_cast<float>(segments);
        pushUniquePoint(Segment::arcPoint(center, r, startAngle + sweep * t), out, minDist2);
    }
}

void appendNumber(std::string& out, float v) {
    char buf[32];
    const float cleaned = (std::abs(v) < 1e-4f) ? 0.0f : v;
    std::snprintf(buf, sizeof(buf), "%.3f", static_cast<double>(cleaned));
    std::string s(buf);
    // Trim trailing zeros for compact output.
    const std::size_t dotPos = s.find('.');
    if (dotPos != std::string::npos) {
        std::size_t last = s.find_last_not_of('0');
        if (last == dotPos) --last;
        s.erase(last + 1);
    }
    out += s;
}

void appendPoint(std::string& out, const Point2& p) {
    appendNumber(out, p.x);
    out += ',';
    appendNumber(out, p.y);
}

} // namespace

Point2 Segment::arcPoint(Point2 center, float radius, float angle) noexcept {
    return Point2{center.x + std::cos(angle) * radius, center.y + std::sin(angle) * radius};
}

std::vector<Contour> PathFlattener::flatten(const Path& path) {
    std::vector<Contour> contours;
    Point2 curr{0.0f, 0.0f};
    Point2 start{0.0f, 0.0f};
    bool contourOpen = false;

    const float tol = tolerance_ > 0.0f ? tolerance_ : 0.25f;
    const float minDist2 = tol * tol * 0.25f;
    const auto startContour = [&](const Point2& p) {
        contours.emplace_back();
        contourOpen = true;
        start = p;
        curr = p;
        contours.back().points.push_back(p);
    };

    for (const Segment& seg : path.segments) {
        switch (seg.kind) {
            case SegmentKind::Move:
                startContour(seg.to);
                break;
            case SegmentKind::Line:
                if (!contourOpen) {
                    startContour(seg.to);
                    break;
                }
                pushUniquePoint(seg.to, contours.back().points, minDist2);
                curr = seg.to;
                break;
            case SegmentKind::Quad:
                if (!contourOpen) {
                    startContour(seg.to);
                    break;
                }
                flattenQuadratic(curr, seg.c, seg.to, tol, quadStack_, contours.back().points);
                curr = seg.to;
                break;
            case SegmentKind::Cubic:
                if (!contourOpen) {
                    startContour(seg.to);
                    break;
                }
                flattenCubic(curr, seg.c1, seg.c2, seg.to, tol, cubicStack_, contours.back().points);
                curr = seg.to;
                break;
            case SegmentKind::Arc:
                if (!contourOpen) {
                    startContour(Segment::arcPoint(seg.center, seg.radius, seg.startAngle));
                }
                flattenArc(seg.center, seg.radius, seg.startAngle, seg.endAngle, seg.ccw, tol, contours.back().points);
                curr = seg.to;
                break;
            case SegmentKind::Close:
                if (!contourOpen) break;
                pushUniquePoint(start, contours.back().points, minDist2);
                contours.back().closed = true;
                contourOpen = false;
                curr = start;
                break;
        }
    }
    return contours;
}

std::vector<Contour> flattenPath(const Path& path, float tolerance) {
    PathFlattener flattener(tolerance);
    return flattener.flatten(path);
}

float polylineLength(const std::vector<Point2>& points) {
    float total = 0.0f;
    for (std::size_t i = 1; i < points.size(); ++i) {
        total += len(sub(points[i], points[i - 1]));
    }
    return total;
}

std::vector<Point2> resampleByArcLength(const std::vector<Contour>& contours, std::uint32_t sampleCount) {
    std::vector<Point2> out;
    float total = 0.0f;
    for (const Contour& c : contours) total += polylineLength(c.points);
    if (contours.empty() || sampleCount == 0) return out;

    out.reserve(sampleCount + 1);
    if (!(total > eps)) {
        const Point2 only = contours.front().points.empty() ? Point2{0.0f, 0.0f} : contours.front().points.front();
        out.assign(sampleCount + 1, only);
        return out;
    }

    // Walk the edges once, emitting every target length that falls on each.
    std::uint32_t next = 0;
    float walked = 0.0f;
    Point2 last{0.0f, 0.0f};
    for (const Contour& c : contours) {
        for (std::size_t i = 1; i < c.points.size(); ++i) {
            const Point2 a = c.points[i - 1];
            const Point2 b = c.points[i];
            const float edge = len(sub(b, a));
            if (!(edge > 0.0f)) continue;
            while (next <= sampleCount) {
                const float target = total * static_cast<float>(next) / static_cast<float>(sampleCount);
                if (target > walked + edge) break;
                const float t = std::min(1.0f, std::max(0.0f, (target - walked) / edge));
                out.push_back(add(a, mul(sub(b, a), t)));
                ++next;
            }
            walked += edge;
            last = b;
        }
    }
    // Float drift can leave the final target just past the accumulated length.
    while (next <= sampleCount) {
        out.push_back(last);
        ++next;
    }
    return out;
}

Bounds pathBounds(const Path& path, float tolerance) {
    Bounds b;
    bool any = false;
    for (const Contour& c : flattenPath(path, tolerance)) {
        for (const Point2& p : c.points) {
            if (!any) {
                b = Bounds{p.x, p.y, p.x, p.y};
                any = true;
                continue;
            }
            b.minX = std::min(b.minX, p.x);
            b.minY = std::min(b.minY, p.y);
            b.maxX = std::max(b.maxX, p.x);
            b.maxY = std::max(b.maxY, p.y);
        }
    }
    return b;
}

std::string toSvgPathData(const Path& path) {
    std::string out;
    out.reserve(path.segments.size() * 24);
    for (const Segment& seg : path.segments) {
        if (!out.empty()) out += ' ';
        switch (seg.kind) {
            case SegmentKind::Move:
                out += 'M';
                appendPoint(out, seg.to);
                break;
            case SegmentKind::Line:
                out += 'L';
                appendPoint(out, seg.to);
                break;
            case SegmentKind::Quad:
                out += 'Q';
                appendPoint(out, seg.c);
                out += ' ';
                appendPoint(out, seg.to);
                break;
            case SegmentKind::Cubic:
                out += 'C';
                appendPoint(out, seg.c1);
                out += ' ';
                appendPoint(out, seg.c2);
                out += ' ';
                appendPoint(out, seg.to);
                break;
            case SegmentKind::Arc: {
                const float sweep = arcSweep(seg.startAngle, seg.endAngle, seg.ccw);
                out += 'A';
                appendNumber(out, seg.radius);
                out += ',';
                appendNumber(out, seg.radius);
                out += " 0 ";
                out += std::abs(sweep) > kPi ? '1' : '0';
                out += ' ';
                out += seg.ccw ? '1' : '0';
                out += ' ';
                appendPoint(out, seg.to);
                break;
            }
            case SegmentKind::Close:
                out += 'Z';
                break;
        }
    }
    return out;
}

} // namespace balloon::vector
