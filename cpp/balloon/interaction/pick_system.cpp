#include "balloon/interaction/pick_system.h"

#include <algorithm>
#include <cmath>

namespace balloon {

static float distSq(float x1, float y1, float x2, float y2) {
    const float dx = x1 - x2;
    const float dy = y1 - y2;
    return dx * dx + dy * dy;
}

static const ResizeHandle kAllHandles[] = {
    ResizeHandle::TopLeft,
    ResizeHandle::TopCenter,
    ResizeHandle::TopRight,
    ResizeHandle::MiddleLeft,
    ResizeHandle::MiddleRight,
    ResizeHandle::BottomLeft,
    ResizeHandle::BottomCenter,
    ResizeHandle::BottomRight,
};

Point2 PickSystem::handleCenter(const Bubble& b, ResizeHandle handle) {
    const HandleEdges e = handleEdges(handle);
    float hx = b.width * 0.5f;
    float hy = b.height * 0.5f;
    if (e.left) hx = 0.0f;
    if (e.right) hx = b.width;
    if (e.top) hy = 0.0f;
    if (e.bottom) hy = b.height;
    return Point2{b.x + hx, b.y + hy};
}

void PickSystem::collectHandles(const Bubble& b, float x, float y, std::vector<PickCandidate>& out) const {
    for (const Part& part : b.parts) {
        if (part.isTail()) {
            const float tipX = b.x + part.tail().tipX;
            const float tipY = b.y + part.tail().tipY;
            const float dTip = std::sqrt(distSq(x, y, tipX, tipY));
            if (dTip <= options_.tipHandleRadius) {
                out.push_back({{b.id, PickSubTarget::TailTip, ResizeHandle::None, part.id}, dTip, b.zIndex});
            }

            const float baseX = b.x + part.tail().baseCX + options_.baseHandleOffsetX;
            const float baseY = b.y + part.tail().baseCY;
            const float dBase = std::sqrt(distSq(x, y, baseX, baseY));
            if (dBase <= options_.baseHandleRadius) {
                out.push_back({{b.id, PickSubTarget::TailBase, ResizeHandle::None, part.id}, dBase, b.zIndex});
            }
        } else if (part.isDot()) {
            const float d = std::sqrt(distSq(x, y, b.x + part.dot().offsetX, b.y + part.dot().offsetY));
            if (d <= part.dot().size * 0.5f) {
                out.push_back({{b.id, PickSubTarget::Dot, ResizeHandle::None, part.id}, d, b.zIndex});
            }
        }
    }

    const float half = options_.handleSize * 0.5f;
    for (ResizeHandle handle : kAllHandles) {
        const Point2 c = handleCenter(b, handle);
        if (std::fabs(x - c.x) <= half && std::fabs(y - c.y) <= half) {
            const float d = std::sqrt(distSq(x, y, c.x, c.y));
            out.push_back({{b.id, PickSubTarget::ResizeHandle, handle, 0}, d, b.zIndex});
        }
    }
}

PickResult PickSystem::pick(
    const std::vector<Bubble>& bubbles,
    std::uint32_t selectedId,
    float x,
    float y
) const {
    std::vector<PickCandidate> candidates;

    for (const Bubble& b : bubbles) {
        if (b.id == selectedId) {
            collectHandles(b, x, y, candidates);
        }
        if (x >= b.x && x <= b.x + b.width && y >= b.y && y <= b.y + b.height) {
            const float d = std::sqrt(distSq(x, y, b.x + b.width * 0.5f, b.y + b.height * 0.5f));
            candidates.push_back({{b.id, PickSubTarget::Body, ResizeHandle::None, 0}, d, b.zIndex});
        }
    }

    if (candidates.empty()) {
        return {};
    }

    const auto best = std::min_element(candidates.begin(), candidates.end());
    PickResult result;
    result.target = best->target;
    result.distance = best->distance;
    return result;
}

} // namespace balloon
