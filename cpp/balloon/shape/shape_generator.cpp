#include "balloon/shape/shape_generator.h"
#include "balloon/core/bubble.h"
#include "balloon/core/seeded_random.h"
#include "balloon/core/util.h"

#include <algorithm>
#include <cmath>

namespace balloon::shape {

namespace {

static constexpr float kPi = 3.14159265358979323846f;
static constexpr float kDescriptiveRadius = 5.0f;
static constexpr int kShoutSpikes = 14;
static constexpr float kBoundsPadding = 10.0f;

struct Bracket {
    float from;
    float to;
};

// Edge interval covered by the tail base, kept off the rounded corners.
Bracket bracketBase(float center, float halfBase, float lo, float hi) {
    float a = std::max(lo, center - halfBase);
    float b = std::min(hi, center + halfBase);
    if (a > b) {
        const float mid = clampf(center, lo, hi);
        a = mid;
        b = mid;
    }
    return Bracket{a, b};
}

// Two quadratics from `from` out to the tip and back to `to`. The control
// points sit 25% of the way toward the tip along the edge and halfway
// between the edge and the tip across it.
void appendTailCut(vector::Path& path, Point2 from, Point2 to, Point2 base, Point2 tip, bool horizontalEdge) {
    path.lineTo(from);
    if (horizontalEdge) {
        const float midY = base.y + (tip.y - base.y) * 0.5f;
        path.quadTo(Point2{from.x + (tip.x - from.x) * 0.25f, midY}, tip);
        path.quadTo(Point2{to.x + (tip.x - to.x) * 0.25f, midY}, to);
    } else {
        const float midX = base.x + (tip.x - base.x) * 0.5f;
        path.quadTo(Point2{midX, from.y + (tip.y - from.y) * 0.25f}, tip);
        path.quadTo(Point2{midX, to.y + (tip.y - to.y) * 0.25f}, to);
    }
}

// Clockwise on screen: top edge, right, bottom, left.
vector::Path roundedRect(float w, float h, float r, TailEdge edge, const SpeechTailPart* tail) {
    vector::Path path;
    Point2 base{0.0f, 0.0f};
    Point2 tip{0.0f, 0.0f};
    float halfBase = 0.0f;
    if (tail) {
        base = Point2{clampf(tail->baseCX, 0.0f, w), clampf(tail->baseCY, 0.0f, h)};
        tip = Point2{tail->tipX, tail->tipY};
        halfBase = std::max(0.0f, tail->baseWidth) * 0.5f;
    }

    path.moveTo(Point2{r, 0.0f});
    if (edge == TailEdge::Top) {
        const Bracket b = bracketBase(base.x, halfBase, r, w - r);
        appendTailCut(path, Point2{b.from, 0.0f}, Point2{b.to, 0.0f}, base, tip, true);
    }
    path.lineTo(Point2{w - r, 0.0f});
    path.arcTo(Point2{w - r, r}, r, -kPi * 0.5f, 0.0f);

    if (edge == TailEdge::Right) {
        const Bracket b = bracketBase(base.y, halfBase, r, h - r);
        appendTailCut(path, Point2{w, b.from}, Point2{w, b.to}, base, tip, false);
    }
    path.lineTo(Point2{w, h - r});
    path.arcTo(Point2{w - r, h - r}, r, 0.0f, kPi * 0.5f);

    if (edge == TailEdge::Bottom) {
        const Bracket b = bracketBase(base.x, halfBase, r, w - r);
        appendTailCut(path, Point2{b.to, h}, Point2{b.from, h}, base, tip, true);
    }
    path.lineTo(Point2{r, h});
    path.arcTo(Point2{r, h - r}, r, kPi * 0.5f, kPi);

    if (edge == TailEdge::Left) {
        const Bracket b = bracketBase(base.y, halfBase, r, h - r);
        appendTailCut(path, Point2{0.0f, b.to}, Point2{0.0f, b.from}, base, tip, false);
    }
    path.lineTo(Point2{0.0f, r});
    path.arcTo(Point2{r, r}, r, kPi, kPi * 1.5f);
    path.close();
    return path;
}

vector::Path thoughtCloud(float w, float h, SeededRandom& rng) {
    vector::Path path;
    const float cx = w * 0.5f;
    const float cy = h * 0.5f;
    const float rx = w * 0.30f;
    const float ry = h * 0.30f;

    const int lobes = static_cast<int>(std::floor(rng.next() * 6.0)) + 7;
    for (int i = 0; i < lobes; ++i) {
        const float angle = (static_cast<float>(i) / lobes) * kPi * 2.0f - kPi * 0.5f;
        const float nextAngle = (static_cast<float>(i + 1) / lobes) * kPi * 2.0f - kPi * 0.5f;
        if (i == 0) {
            path.moveTo(Point2{cx + rx * std::cos(angle), cy + ry * std::sin(angle)});
        }
        const float midAngle = (angle + nextAngle) * 0.5f;
        const float bulge = static_cast<float>(rng.range(1.3, 1.6));
        path.quadTo(
            Point2{cx + rx * bulge * std::cos(midAngle), cy + ry * bulge * std::sin(midAngle)},
            Point2{cx + rx * std::cos(nextAngle), cy + ry * std::sin(nextAngle)});
    }
    path.close();
    return path;
}

// Valleys vary little so the text area stays usable; spikes vary a lot.
vector::Path shoutStar(float w, float h, SeededRandom& rng) {
    vector::Path path;
    const float cx = w * 0.5f;
    const float cy = h * 0.5f;
    const float outerRx = w / 2.0f;
    const float outerRy = h / 2.0f;
    const float innerRx = w / 3.5f;
    const float innerRy = h / 3.5f;

    for (int i = 0; i < kShoutSpikes * 2; ++i) {
        const float angle = (static_cast<float>(i) * kPi) / kShoutSpikes - kPi * 0.5f;
        const bool outer = (i % 2) == 0;
        const float factor = outer
            ? static_cast<float>(rng.range(0.6, 1.4))
            : static_cast<float>(rng.range(0.9, 1.1));
        const float rx = (outer ? outerRx : innerRx) * factor;
        const float ry = (outer ? outerRy : innerRy) * factor;
        const Point2 p{cx + rx * std::cos(angle), cy + ry * std::sin(angle)};
        if (i == 0) {
            path.moveTo(p);
        } else {
            path.lineTo(p);
        }
    }
    path.close();
    return path;
}

} // namespace

TailEdge tailEdgeOf(const SpeechTailPart& tail, float width, float height) {
    const float bx = clampf(tail.baseCX, 0.0f, width);
    const float by = clampf(tail.baseCY, 0.0f, height);
    if (std::fabs(by - height) < kEdgeEpsilon) return TailEdge::Bottom;
    if (std::fabs(by) < kEdgeEpsilon) return TailEdge::Top;
    if (std::fabs(bx - width) < kEdgeEpsilon) return TailEdge::Right;
    if (std::fabs(bx) < kEdgeEpsilon) return TailEdge::Left;
    return TailEdge::None;
}

float cornerRadiusFor(BubbleType type, float width, float height) {
    if (typeAllowsTail(type)) {
        return std::min(width, height) * 0.5f;
    }
    if (type == BubbleType::Descriptive) {
        return std::min(kDescriptiveRadius, std::min(width, height) * 0.5f);
    }
    return 0.0f;
}

std::int64_t shapeSeed(const Bubble& bubble) {
    return static_cast<std::int64_t>(bubble.id) + static_cast<std::int64_t>(bubble.shapeVariant);
}

BubbleShape generateShape(const Bubble& bubble) {
    BubbleShape shape;
    const float w = std::max(kMinBubbleWidth, finiteOr(bubble.width, kMinBubbleWidth));
    const float h = std::max(kMinBubbleHeight, finiteOr(bubble.height, kMinBubbleHeight));
    const float r = cornerRadiusFor(bubble.type, w, h);

    switch (bubble.type) {
        case BubbleType::SpeechDown:
        case BubbleType::SpeechUp:
        case BubbleType::Whisper: {
            const Part* tailPart = findTail(bubble);
            const SpeechTailPart* tail = tailPart ? &tailPart->tail() : nullptr;
            const TailEdge edge = tail ? tailEdgeOf(*tail, w, h) : TailEdge::None;
            shape.outline = roundedRect(w, h, r, edge, tail);
            break;
        }
        case BubbleType::Descriptive:
            shape.outline = roundedRect(w, h, r, TailEdge::None, nullptr);
            break;
        case BubbleType::Thought: {
            SeededRandom rng(shapeSeed(bubble));
            shape.outline = thoughtCloud(w, h, rng);
            for (const Part& p : bubble.parts) {
                if (!p.isDot()) continue;
                shape.auxiliaryCircles.push_back(
                    AuxCircle{p.id, Point2{p.dot().offsetX, p.dot().offsetY}, p.dot().size * 0.5f});
            }
            break;
        }
        case BubbleType::Shout: {
            SeededRandom rng(shapeSeed(bubble));
            shape.outline = shoutStar(w, h, rng);
            break;
        }
        case BubbleType::TextOnly:
            break;
    }
    return shape;
}

Rect overallBounds(const Bubble& bubble) {
    float minX = 0.0f;
    float minY = 0.0f;
    float maxX = bubble.width;
    float maxY = bubble.height;

    for (const Part& p : bubble.parts) {
        if (p.isTail() && typeAllowsTail(bubble.type)) {
            minX = std::min(minX, p.tail().tipX);
            maxX = std::max(maxX, p.tail().tipX);
            minY = std::min(minY, p.tail().tipY);
            maxY = std::max(maxY, p.tail().tipY);
        } else if (p.isDot() && typeAllowsDots(bubble.type)) {
            const float half = p.dot().size * 0.5f;
            minX = std::min(minX, p.dot().offsetX - half);
            maxX = std::max(maxX, p.dot().offsetX + half);
            minY = std::min(minY, p.dot().offsetY - half);
            maxY = std::max(maxY, p.dot().offsetY + half);
        }
    }

    minX -= kBoundsPadding;
    minY -= kBoundsPadding;
    maxX += kBoundsPadding;
    maxY += kBoundsPadding;
    return Rect{minX, minY, maxX - minX, maxY - minY};
}

} // namespace balloon::shape
