#ifndef BALLOON_SHAPE_SHAPE_GENERATOR_H
#define BALLOON_SHAPE_SHAPE_GENERATOR_H

#include "balloon/core/types.h"
#include "balloon/render/vector_ir.h"

#include <cstdint>
#include <vector>

namespace balloon::shape {

struct AuxCircle {
    std::uint32_t id{0};
    Point2 center{};
    float radius{0.0f};
};

// Presentation geometry of one bubble in its local space.
struct BubbleShape {
    vector::Path outline;                  // empty for TextOnly
    std::vector<AuxCircle> auxiliaryCircles;
};

enum class TailEdge : std::uint8_t { None = 0, Top, Bottom, Left, Right };

// Edge the tail is cut into. The base is clamped into the rectangle first;
// a base strictly inside the rectangle yields None.
TailEdge tailEdgeOf(const SpeechTailPart& tail, float width, float height);

// Corner radius of the rounded-rectangle types; 0 for the others.
float cornerRadiusFor(BubbleType type, float width, float height);

// Seed for the randomized silhouettes.
std::int64_t shapeSeed(const Bubble& bubble);

// Pure and deterministic in (bubble.id, bubble.shapeVariant).
BubbleShape generateShape(const Bubble& bubble);

struct Rect {
    float x{0.0f};
    float y{0.0f};
    float width{0.0f};
    float height{0.0f};
};

// Local-space box covering the body, tail tip and dots, padded by 10px.
Rect overallBounds(const Bubble& bubble);

} // namespace balloon::shape

#endif // BALLOON_SHAPE_SHAPE_GENERATOR_H
