#include "balloon/engine.h"
#include "balloon/core/logging.h"

#include <utility>

namespace balloon {

PickResult BalloonEngine::pointerDown(float x, float y) {
    if (session_.isActive()) session_.end();

    const PickResult hit = pickSystem_.pick(bubbles_, selectedId_, x, y);
    if (!hit.hit()) return hit;

    if (hit.target.bubbleId != selectedId_) {
        selectBubble(hit.target.bubbleId);
    }
    const Bubble* b = findBubble(hit.target.bubbleId);
    if (!b || !session_.begin(*b, hit.target, x, y)) {
        fail(BalloonError::InvalidOperation);
        return hit;
    }
    lastError_ = BalloonError::Ok;
    return hit;
}

bool BalloonEngine::pointerMove(float x, float y) {
    std::optional<Bubble> next = session_.update(x, y);
    if (!next) return false;

    Bubble* b = findMutable(next->id);
    if (!b) {
        session_.cancel();
        return fail(BalloonError::UnknownBubble);
    }
    // Stacking may have changed since the gesture began.
    next->zIndex = b->zIndex;
    *b = std::move(*next);
    return true;
}

void BalloonEngine::pointerUp() {
    session_.end();
}

void BalloonEngine::cancelGesture() {
    std::optional<Bubble> original = session_.cancel();
    if (!original) return;
    if (Bubble* b = findMutable(original->id)) {
        original->zIndex = b->zIndex;
        *b = std::move(*original);
    }
}

} // namespace balloon
