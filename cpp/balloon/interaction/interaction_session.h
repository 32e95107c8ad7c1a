#pragma once

#include "balloon/interaction/interaction_types.h"
#include "balloon/core/types.h"

#include <optional>

namespace balloon {

// Gesture a hit target starts; Idle for None or a part the bubble lacks.
GestureMode gestureModeFor(const Bubble& bubble, const GestureTarget& target);

// Snapshot for a gesture starting at (x, y). Idle when the target is not
// draggable on this bubble.
GestureSnapshot captureGesture(const Bubble& bubble, const GestureTarget& target, float x, float y);

// New bubble for the cumulative pointer delta since the gesture started.
Bubble applyTransform(const GestureSnapshot& snapshot, float dx, float dy);

// Individual transforms, each a pure function of the original bubble.
Bubble moveBubble(const Bubble& original, float dx, float dy);
Bubble resizeBubble(const Bubble& original, ResizeHandle handle, float dx, float dy);
Bubble moveDot(const Bubble& original, std::uint32_t partId, float dx, float dy);
Bubble moveTailTip(const Bubble& original, std::uint32_t partId, float dx, float dy);
Bubble moveTailBase(const Bubble& original, std::uint32_t partId, float dx, float dy);

// Re-derives a tail from its pre-resize value. Bases pinned to an edge stay
// on it; the tip keeps its base offset scaled per axis.
SpeechTailPart rescaleTail(const SpeechTailPart& tail, float origW, float origH, float newW, float newH);
ThoughtDotPart rescaleDot(const ThoughtDotPart& dot, float origW, float origH, float newW, float newH);

/**
 * InteractionSession: one gesture at a time, from pointer-down to pointer-up.
 *
 * begin() captures the snapshot; update() returns the recomputed bubble for
 * the latest pointer position. end() and cancel() both return to Idle; the
 * caller keeps or discards the last bubble it received.
 */
class InteractionSession {
public:
    // False (and stays Idle) when the target cannot be dragged.
    bool begin(const Bubble& bubble, const GestureTarget& target, float x, float y);
    std::optional<Bubble> update(float x, float y) const;
    void end();
    // Original bubble of the aborted gesture, if one was active.
    std::optional<Bubble> cancel();

    GestureMode mode() const noexcept { return snapshot_ ? snapshot_->mode : GestureMode::Idle; }
    bool isActive() const noexcept { return snapshot_.has_value(); }
    std::uint32_t bubbleId() const noexcept { return snapshot_ ? snapshot_->original.id : 0; }

private:
    std::optional<GestureSnapshot> snapshot_;
};

} // namespace balloon
