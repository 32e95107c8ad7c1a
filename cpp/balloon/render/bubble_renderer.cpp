#include "balloon/render/bubble_renderer.h"
#include "balloon/core/bubble.h"
#include "balloon/core/color.h"
#include "balloon/render/path_flatten.h"
#include "balloon/shape/shape_generator.h"

#include <algorithm>
#include <utility>

namespace balloon {

namespace {

constexpr float kPi = 3.14159265358979323846f;

// Two half arcs; a single 2*pi arc has no sweep once normalized.
vector::Path circlePath(Point2 center, float radius) {
    vector::Path path;
    path.moveTo(vector::Segment::arcPoint(center, radius, 0.0f));
    path.arcTo(center, radius, 0.0f, kPi);
    path.arcTo(center, radius, kPi, 2.0f * kPi);
    path.close();
    return path;
}

} // namespace

text::TextStyle bubbleTextStyle(const Bubble& bubble) {
    text::TextStyle style;
    style.fontFamily = fontKey(bubble.fontFamily);
    style.fontSize = bubble.fontSize;
    style.color = bubble.textColor;
    return style;
}

BubbleRenderer::BubbleRenderer(DrawSurface& surface, text::FontFamilyResolver resolver, RenderOptions options)
    : surface_(surface),
      resolver_(resolver ? std::move(resolver) : text::defaultFontFamilyResolver()),
      options_(std::move(options)) {}

void BubbleRenderer::drawBody(const Bubble& bubble) {
    const shape::BubbleShape shape = shape::generateShape(bubble);
    const std::uint32_t border = parseColorOr(bubble.borderColor, kColorBlack);
    const std::vector<float> dash = bubble.type == BubbleType::Whisper
        ? options_.whisperDash
        : std::vector<float>{};

    for (const vector::Contour& contour : vector::flattenPath(shape.outline, options_.flattenTolerance)) {
        surface_.setFillColor(options_.fillRGBA);
        surface_.fillPolygon(contour.points);
        surface_.setStrokeStyle(border, options_.borderWidth, dash);
        surface_.strokePolyline(contour.points, contour.closed);
    }

    for (const shape::AuxCircle& circle : shape.auxiliaryCircles) {
        const vector::Path path = circlePath(circle.center, circle.radius);
        for (const vector::Contour& contour : vector::flattenPath(path, options_.flattenTolerance)) {
            surface_.setFillColor(options_.fillRGBA);
            surface_.fillPolygon(contour.points);
            surface_.setStrokeStyle(border, options_.borderWidth, {});
            surface_.strokePolyline(contour.points, true);
        }
    }
}

void BubbleRenderer::drawText(const Bubble& bubble) {
    const shape::TextExtent extent = shape::extentAtY(bubble, options_.safeZone);
    const text::LayoutBox box{0.0f, 0.0f, bubble.width, bubble.height};
    text::layoutAndDraw(
        surface_,
        bubble.text,
        box,
        bubbleTextStyle(bubble),
        resolver_,
        [extent](float y) { return extent(y); }
    );
}

void BubbleRenderer::render(const Bubble& bubble) {
    surface_.save();
    surface_.translate(bubble.x, bubble.y);
    if (bubble.type != BubbleType::TextOnly) {
        drawBody(bubble);
    }
    drawText(bubble);
    surface_.restore();
}

void BubbleRenderer::renderScene(const std::vector<Bubble>& bubbles) {
    std::vector<const Bubble*> order;
    order.reserve(bubbles.size());
    for (const Bubble& b : bubbles) order.push_back(&b);
    std::stable_sort(order.begin(), order.end(), [](const Bubble* a, const Bubble* b) {
        return a->zIndex < b->zIndex;
    });
    for (const Bubble* b : order) render(*b);
}

} // namespace balloon
