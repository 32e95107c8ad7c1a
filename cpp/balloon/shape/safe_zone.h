#ifndef BALLOON_SHAPE_SAFE_ZONE_H
#define BALLOON_SHAPE_SAFE_ZONE_H

#include "balloon/core/types.h"
#include "balloon/render/vector_ir.h"

#include <cstdint>
#include <vector>

namespace balloon::shape {

struct SafeZoneFactors {
    float widthFactor;
    float heightFactor;
};

// Fraction of the bounding box usable for text, per bubble type.
SafeZoneFactors safeZoneFactors(BubbleType type);

// Centered text rectangle in bubble-local space.
struct SafeZone {
    float width{0.0f};
    float height{0.0f};
    float xOffset{0.0f};
    float yOffset{0.0f};
};

SafeZone computeSafeZone(const Bubble& bubble);

struct SafeZoneOptions {
    std::uint32_t pathSamples{100};  // points taken along the outline perimeter
    std::uint32_t rowSamples{20};    // horizontal scanlines across the height
    float shrink{0.70f};             // fraction of the measured crossing span kept
    float flattenTolerance{0.1f};
};

enum class ExtentStrategy : std::uint8_t { ClosedForm = 0, Sampled = 1 };

ExtentStrategy extentStrategyFor(BubbleType type);

// Usable text width as a function of local y. Sampled extents answer with
// the nearest scanline; y outside [0, height] clamps to the end rows.
class TextExtent {
public:
    static TextExtent constant(float width);
    static TextExtent sampled(std::vector<float> rows, float height);

    float operator()(float y) const;

    ExtentStrategy strategy() const { return strategy_; }
    const std::vector<float>& rows() const { return rows_; }

private:
    ExtentStrategy strategy_{ExtentStrategy::ClosedForm};
    float constant_{0.0f};
    float height_{0.0f};
    std::vector<float> rows_;
};

TextExtent extentAtY(const Bubble& bubble, const SafeZoneOptions& options = {});

// Per-row span between the extreme crossings of the outline, scaled by
// options.shrink. Rows with fewer than two crossings report 0.
std::vector<float> sampleRowExtents(const vector::Path& outline, float height, const SafeZoneOptions& options);

} // namespace balloon::shape

#endif // BALLOON_SHAPE_SAFE_ZONE_H
