#include "balloon/shape/safe_zone.h"
#include "balloon/render/path_flatten.h"
#include "balloon/shape/shape_generator.h"
#include "balloon/core/util.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <utility>

namespace balloon::shape {

SafeZoneFactors safeZoneFactors(BubbleType type) {
    switch (type) {
        case BubbleType::Shout: return SafeZoneFactors{0.50f, 0.55f};
        case BubbleType::Thought: return SafeZoneFactors{0.50f, 0.65f};
        case BubbleType::SpeechDown: return SafeZoneFactors{0.83f, 0.83f};
        case BubbleType::SpeechUp: return SafeZoneFactors{0.83f, 0.83f};
        case BubbleType::Whisper: return SafeZoneFactors{0.80f, 0.80f};
        case BubbleType::Descriptive: return SafeZoneFactors{0.90f, 0.85f};
        case BubbleType::TextOnly: return SafeZoneFactors{0.95f, 0.90f};
    }
    return SafeZoneFactors{0.50f, 0.50f};
}

SafeZone computeSafeZone(const Bubble& bubble) {
    const SafeZoneFactors f = safeZoneFactors(bubble.type);
    const float w = std::max(kMinBubbleWidth, finiteOr(bubble.width, kMinBubbleWidth));
    const float h = std::max(kMinBubbleHeight, finiteOr(bubble.height, kMinBubbleHeight));
    SafeZone zone;
    zone.width = w * f.widthFactor;
    zone.height = h * f.heightFactor;
    zone.xOffset = (w - zone.width) * 0.5f;
    zone.yOffset = (h - zone.height) * 0.5f;
    return zone;
}

ExtentStrategy extentStrategyFor(BubbleType type) {
    if (type == BubbleType::Descriptive || type == BubbleType::TextOnly) {
        return ExtentStrategy::ClosedForm;
    }
    return ExtentStrategy::Sampled;
}

TextExtent TextExtent::constant(float width) {
    TextExtent e;
    e.strategy_ = ExtentStrategy::ClosedForm;
    e.constant_ = std::max(0.0f, width);
    return e;
}

TextExtent TextExtent::sampled(std::vector<float> rows, float height) {
    TextExtent e;
    e.strategy_ = ExtentStrategy::Sampled;
    e.rows_ = std::move(rows);
    e.height_ = height;
    return e;
}

float TextExtent::operator()(float y) const {
    if (strategy_ == ExtentStrategy::ClosedForm) return constant_;
    if (rows_.empty()) return 0.0f;
    if (rows_.size() == 1 || !(height_ > 0.0f)) return rows_.front();

    const float rel = clampf(finiteOr(y, 0.0f) / height_, 0.0f, 1.0f);
    const auto last = static_cast<float>(rows_.size() - 1);
    const auto index = static_cast<std::size_t>(std::lround(rel * last));
    return rows_[std::min(index, rows_.size() - 1)];
}

std::vector<float> sampleRowExtents(const vector::Path& outline, float height, const SafeZoneOptions& options) {
    const std::uint32_t rowCount = std::max<std::uint32_t>(1, options.rowSamples);
    std::vector<float> rows(rowCount, 0.0f);
    if (outline.empty()) return rows;

    const std::vector<vector::Contour> contours = vector::flattenPath(outline, options.flattenTolerance);
    const std::vector<Point2> samples =
        vector::resampleByArcLength(contours, std::max<std::uint32_t>(1, options.pathSamples));
    if (samples.size() < 2) return rows;

    std::vector<float> crossings;
    for (std::uint32_t row = 0; row < rowCount; ++row) {
        const float target = rowCount > 1
            ? (static_cast<float>(row) / static_cast<float>(rowCount - 1)) * height
            : height * 0.5f;

        crossings.clear();
        bool wasAbove = samples.front().y < target;
        for (std::size_t i = 1; i < samples.size(); ++i) {
            const Point2& prev = samples[i - 1];
            const Point2& curr = samples[i];
            const bool isAbove = curr.y < target;
            if (isAbove != wasAbove) {
                const float dy = curr.y - prev.y;
                const float t = std::fabs(dy) > 1e-9f ? (target - prev.y) / dy : 0.0f;
                crossings.push_back(prev.x + t * (curr.x - prev.x));
            }
            wasAbove = isAbove;
        }

        if (crossings.size() < 2) continue;
        const auto [minIt, maxIt] = std::minmax_element(crossings.begin(), crossings.end());
        rows[row] = std::max(0.0f, (*maxIt - *minIt) * options.shrink);
    }
    return rows;
}

TextExtent extentAtY(const Bubble& bubble, const SafeZoneOptions& options) {
    const float w = std::max(kMinBubbleWidth, finiteOr(bubble.width, kMinBubbleWidth));
    const float h = std::max(kMinBubbleHeight, finiteOr(bubble.height, kMinBubbleHeight));

    if (extentStrategyFor(bubble.type) == ExtentStrategy::ClosedForm) {
        return TextExtent::constant(w * safeZoneFactors(bubble.type).widthFactor);
    }

    const BubbleShape shape = generateShape(bubble);
    std::vector<float> rows = sampleRowExtents(shape.outline, h, options);
    for (float& r : rows) r = std::min(r, w);
    return TextExtent::sampled(std::move(rows), h);
}

} // namespace balloon::shape
