#pragma once

#include "balloon/interaction/interaction_types.h"
#include "balloon/core/types.h"

#include <cstdint>
#include <limits>
#include <vector>

namespace balloon {

struct HitTestOptions {
    float handleSize{10.0f};         // resize handle square side
    float tipHandleRadius{7.0f};
    float baseHandleRadius{9.0f};
    float baseHandleOffsetX{10.0f};  // base handle sits right of the base point
};

struct PickResult {
    GestureTarget target;
    float distance{std::numeric_limits<float>::infinity()};

    bool hit() const { return target.subTarget != PickSubTarget::None; }
};

// Internal candidate during picking
struct PickCandidate {
    GestureTarget target;
    float distance;
    std::uint32_t zIndex;

    // Sort order:
    // 1. SubTarget priority: tail tip > tail base > dot > resize handle > body
    // 2. Z-Index: higher is better
    // 3. Distance: closer is better
    bool operator<(const PickCandidate& other) const {
        auto priority = [](PickSubTarget t) {
            switch (t) {
                case PickSubTarget::TailTip: return 10;
                case PickSubTarget::TailBase: return 9;
                case PickSubTarget::Dot: return 8;
                case PickSubTarget::ResizeHandle: return 5;
                case PickSubTarget::Body: return 1;
                default: return 0;
            }
        };
        const int p1 = priority(target.subTarget);
        const int p2 = priority(other.target.subTarget);
        if (p1 != p2) return p1 > p2;
        if (zIndex != other.zIndex) return zIndex > other.zIndex;
        return distance < other.distance;
    }
};

/**
 * PickSystem: resolves a canvas point to the bubble part under it.
 *
 * Tail, dot and resize handles are live only on the selected bubble; any
 * bubble's rectangle picks its body. Bubbles are scanned linearly, scenes
 * hold a handful of them.
 */
class PickSystem {
public:
    explicit PickSystem(const HitTestOptions& options = {}) : options_(options) {}

    PickResult pick(const std::vector<Bubble>& bubbles, std::uint32_t selectedId, float x, float y) const;

    // Canvas-space center of a resize handle.
    static Point2 handleCenter(const Bubble& bubble, ResizeHandle handle);

    const HitTestOptions& options() const { return options_; }

private:
    void collectHandles(const Bubble& bubble, float x, float y, std::vector<PickCandidate>& out) const;

    HitTestOptions options_;
};

} // namespace balloon
