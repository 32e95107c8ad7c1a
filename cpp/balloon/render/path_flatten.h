#ifndef BALLOON_RENDER_PATH_FLATTEN_H
#define BALLOON_RENDER_PATH_FLATTEN_H

#include "balloon/render/vector_ir.h"

#include <cstdint>
#include <string>
#include <vector>

namespace balloon::vector {

struct Contour {
    std::vector<Point2> points;
    bool closed{false};
};

struct QuadWork {
    Point2 p0;
    Point2 c;
    Point2 p1;
};

struct CubicWork {
    Point2 p0;
    Point2 c1;
    Point2 c2;
    Point2 p1;
};

// Converts a path into polylines, one per contour. Curves subdivide until the
// control polygon lies within `tolerance` of the chord. A closed contour ends
// with a copy of its first point.
class PathFlattener {
public:
    explicit PathFlattener(float tolerance = 0.25f) : tolerance_(tolerance) {}

    std::vector<Contour> flatten(const Path& path);

private:
    float tolerance_;
    std::vector<QuadWork> quadStack_;
    std::vector<CubicWork> cubicStack_;
};

std::vector<Contour> flattenPath(const Path& path, float tolerance = 0.25f);

float polylineLength(const std::vector<Point2>& points);

// Returns sampleCount + 1 points spaced evenly by arc length along all
// contours in order, the first at length 0 and the last at the full length.
// Gaps between contours are not counted.
std::vector<Point2> resampleByArcLength(const std::vector<Contour>& contours, std::uint32_t sampleCount);

// Axis-aligned bounds of the flattened path. Empty paths yield a zero box.
Bounds pathBounds(const Path& path, float tolerance = 0.25f);

// SVG path data (M, L, Q, C, A, Z) for collaborators that draw with SVG.
std::string toSvgPathData(const Path& path);

} // namespace balloon::vector

#endif // BALLOON_RENDER_PATH_FLATTEN_H
