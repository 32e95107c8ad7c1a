#include "balloon/interaction/interaction_session.h"
#include "balloon/core/bubble.h"
#include "balloon/core/logging.h"
#include "balloon/core/util.h"

#include <algorithm>
#include <cmath>
#include <utility>

namespace balloon {

namespace {

const Part* findPart(const Bubble& bubble, std::uint32_t partId) {
    for (const Part& p : bubble.parts) {
        if (p.id == partId) return &p;
    }
    return nullptr;
}

Part* findPart(Bubble& bubble, std::uint32_t partId) {
    for (Part& p : bubble.parts) {
        if (p.id == partId) return &p;
    }
    return nullptr;
}

float safeScale(float newSize, float oldSize) {
    return oldSize > 0.0f ? newSize / oldSize : 1.0f;
}

} // namespace

GestureMode gestureModeFor(const Bubble& bubble, const GestureTarget& target) {
    switch (target.subTarget) {
        case PickSubTarget::Body:
            return GestureMode::Moving;
        case PickSubTarget::ResizeHandle:
            return target.handle == ResizeHandle::None ? GestureMode::Idle : GestureMode::Resizing;
        case PickSubTarget::Dot: {
            const Part* p = findPart(bubble, target.partId);
            return (p && p->isDot()) ? GestureMode::MovingPart : GestureMode::Idle;
        }
        case PickSubTarget::TailTip:
        case PickSubTarget::TailBase: {
            const Part* p = findPart(bubble, target.partId);
            if (!p || !p->isTail()) return GestureMode::Idle;
            return target.subTarget == PickSubTarget::TailTip
                ? GestureMode::MovingTailTip
                : GestureMode::MovingTailBase;
        }
        default:
            return GestureMode::Idle;
    }
}

GestureSnapshot captureGesture(const Bubble& bubble, const GestureTarget& target, float x, float y) {
    GestureSnapshot snap;
    snap.mode = gestureModeFor(bubble, target);
    snap.handle = target.handle;
    snap.partId = target.partId;
    snap.startX = x;
    snap.startY = y;
    snap.original = bubble;
    return snap;
}

Bubble moveBubble(const Bubble& original, float dx, float dy) {
    Bubble out = original;
    out.x = original.x + dx;
    out.y = original.y + dy;
    return out;
}

SpeechTailPart rescaleTail(const SpeechTailPart& tail, float origW, float origH, float newW, float newH) {
    const float sx = safeScale(newW, origW);
    const float sy = safeScale(newH, origH);
    const EdgeAnchor anchor = edgeAnchorOf(tail.baseCX, tail.baseCY, origW, origH);

    SpeechTailPart out = tail;
    if (anchor.right) out.baseCX = newW;
    else if (anchor.left) out.baseCX = 0.0f;
    else out.baseCX = clampf(tail.baseCX * sx, 0.0f, newW);

    if (anchor.bottom) out.baseCY = newH;
    else if (anchor.top) out.baseCY = 0.0f;
    else out.baseCY = clampf(tail.baseCY * sy, 0.0f, newH);

    out.tipX = out.baseCX + (tail.tipX - tail.baseCX) * sx;
    out.tipY = out.baseCY + (tail.tipY - tail.baseCY) * sy;

    // The base runs along the edge it sits on.
    const float widthScale = (anchor.onVerticalEdge() && !anchor.onHorizontalEdge()) ? sy : sx;
    out.baseWidth = std::max(1.0f, tail.baseWidth * widthScale);
    out.initialBaseWidth = std::max(1.0f, tail.initialBaseWidth * widthScale);
    return out;
}

ThoughtDotPart rescaleDot(const ThoughtDotPart& dot, float origW, float origH, float newW, float newH) {
    const float sx = safeScale(newW, origW);
    const float sy = safeScale(newH, origH);
    ThoughtDotPart out = dot;
    out.offsetX = dot.offsetX * sx;
    out.offsetY = dot.offsetY * sy;
    out.size = std::max(2.0f, dot.size * ((sx + sy) * 0.5f));
    return out;
}

Bubble resizeBubble(const Bubble& original, ResizeHandle handle, float dx, float dy) {
    const HandleEdges edges = handleEdges(handle);
    float dw = 0.0f;
    float dh = 0.0f;
    if (edges.left) dw = -dx;
    if (edges.right) dw = dx;
    if (edges.top) dh = -dy;
    if (edges.bottom) dh = dy;

    Bubble out = original;
    out.width = std::max(kMinBubbleWidth, original.width + dw);
    out.height = std::max(kMinBubbleHeight, original.height + dh);
    // Opposite edge stays put, including when the minimum clamps.
    if (edges.left) out.x = original.x + original.width - out.width;
    if (edges.top) out.y = original.y + original.height - out.height;

    for (Part& p : out.parts) {
        if (p.isTail()) {
            p.tail() = rescaleTail(p.tail(), original.width, original.height, out.width, out.height);
        } else if (p.isDot()) {
            p.dot() = rescaleDot(p.dot(), original.width, original.height, out.width, out.height);
        }
    }
    return out;
}

Bubble moveDot(const Bubble& original, std::uint32_t partId, float dx, float dy) {
    Bubble out = original;
    Part* p = findPart(out, partId);
    if (!p || !p->isDot()) return out;
    p->dot().offsetX += dx;
    p->dot().offsetY += dy;
    return out;
}

Bubble moveTailTip(const Bubble& original, std::uint32_t partId, float dx, float dy) {
    Bubble out = original;
    Part* p = findPart(out, partId);
    if (!p || !p->isTail()) return out;
    p->tail().tipX += dx;
    p->tail().tipY += dy;
    return out;
}

Bubble moveTailBase(const Bubble& original, std::uint32_t partId, float dx, float dy) {
    Bubble out = original;
    Part* p = findPart(out, partId);
    if (!p || !p->isTail()) return out;

    const SpeechTailPart& init = findPart(original, partId)->tail();
    const float w = original.width;
    const float h = original.height;
    const float pointerX = init.baseCX + dx;
    const float pointerY = init.baseCY + dy;
    const EdgeAnchor anchor = edgeAnchorOf(init.baseCX, init.baseCY, w, h);

    SpeechTailPart& tail = p->tail();
    if (anchor.onHorizontalEdge()) {
        tail.baseCX = clampf(pointerX, 0.0f, w);
        tail.baseCY = anchor.bottom ? h : 0.0f;
    } else if (anchor.onVerticalEdge()) {
        tail.baseCY = clampf(pointerY, 0.0f, h);
        tail.baseCX = anchor.right ? w : 0.0f;
    } else {
        // Not on an edge: project from the center onto the edge of the
        // dominant drag axis.
        const float cx = pointerX - w * 0.5f;
        const float cy = pointerY - h * 0.5f;
        if (std::fabs(cx / w) > std::fabs(cy / h)) {
            const float ax = std::fabs(cx) > 0.0f ? std::fabs(cx) : 1.0f;
            tail.baseCX = cx > 0.0f ? w : 0.0f;
            tail.baseCY = h * 0.5f + cy * (w / (2.0f * ax));
        } else {
            const float ay = std::fabs(cy) > 0.0f ? std::fabs(cy) : 1.0f;
            tail.baseCY = cy > 0.0f ? h : 0.0f;
            tail.baseCX = w * 0.5f + cx * (h / (2.0f * ay));
        }
        tail.baseCX = clampf(tail.baseCX, 0.0f, w);
        tail.baseCY = clampf(tail.baseCY, 0.0f, h);
    }

    // Rigid tail: the tip follows the base.
    tail.tipX = tail.baseCX + (init.tipX - init.baseCX);
    tail.tipY = tail.baseCY + (init.tipY - init.baseCY);
    return out;
}

Bubble applyTransform(const GestureSnapshot& snapshot, float dx, float dy) {
    dx = finiteOr(dx, 0.0f);
    dy = finiteOr(dy, 0.0f);
    switch (snapshot.mode) {
        case GestureMode::Moving:
            return moveBubble(snapshot.original, dx, dy);
        case GestureMode::Resizing:
            return resizeBubble(snapshot.original, snapshot.handle, dx, dy);
        case GestureMode::MovingPart:
            return moveDot(snapshot.original, snapshot.partId, dx, dy);
        case GestureMode::MovingTailTip:
            return moveTailTip(snapshot.original, snapshot.partId, dx, dy);
        case GestureMode::MovingTailBase:
            return moveTailBase(snapshot.original, snapshot.partId, dx, dy);
        default:
            return snapshot.original;
    }
}

bool InteractionSession::begin(const Bubble& bubble, const GestureTarget& target, float x, float y) {
    GestureSnapshot snap = captureGesture(bubble, target, x, y);
    if (snap.mode == GestureMode::Idle) {
        BALLOON_LOG_DEBUG("gesture rejected on bubble %u (sub-target %u, part %u)",
            bubble.id, static_cast<unsigned>(target.subTarget), target.partId);
        snapshot_.reset();
        return false;
    }
    snapshot_ = std::move(snap);
    return true;
}

std::optional<Bubble> InteractionSession::update(float x, float y) const {
    if (!snapshot_) return std::nullopt;
    return applyTransform(*snapshot_, x - snapshot_->startX, y - snapshot_->startY);
}

void InteractionSession::end() {
    snapshot_.reset();
}

std::optional<Bubble> InteractionSession::cancel() {
    if (!snapshot_) return std::nullopt;
    Bubble original = std::move(snapshot_->original);
    snapshot_.reset();
    return original;
}

} // namespace balloon
