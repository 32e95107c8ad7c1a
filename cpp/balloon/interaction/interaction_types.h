#pragma once

#include "balloon/core/types.h"

#include <cstdint>

namespace balloon {

enum class GestureMode : std::uint8_t {
    Idle = 0,
    Moving = 1,
    Resizing = 2,
    MovingPart = 3,
    MovingTailTip = 4,
    MovingTailBase = 5
};

enum class ResizeHandle : std::uint8_t {
    None = 0,
    TopLeft = 1,
    TopCenter = 2,
    TopRight = 3,
    MiddleLeft = 4,
    MiddleRight = 5,
    BottomLeft = 6,
    BottomCenter = 7,
    BottomRight = 8
};

// Edges a handle drags.
struct HandleEdges {
    bool left{false};
    bool right{false};
    bool top{false};
    bool bottom{false};
};

inline HandleEdges handleEdges(ResizeHandle handle) {
    HandleEdges e;
    switch (handle) {
        case ResizeHandle::TopLeft:      e.top = true; e.left = true; break;
        case ResizeHandle::TopCenter:    e.top = true; break;
        case ResizeHandle::TopRight:     e.top = true; e.right = true; break;
        case ResizeHandle::MiddleLeft:   e.left = true; break;
        case ResizeHandle::MiddleRight:  e.right = true; break;
        case ResizeHandle::BottomLeft:   e.bottom = true; e.left = true; break;
        case ResizeHandle::BottomCenter: e.bottom = true; break;
        case ResizeHandle::BottomRight:  e.bottom = true; e.right = true; break;
        default: break;
    }
    return e;
}

enum class PickSubTarget : std::uint8_t {
    None = 0,
    Body = 1,
    ResizeHandle = 2,
    Dot = 3,
    TailTip = 4,
    TailBase = 5
};

// What a pointer-down landed on.
struct GestureTarget {
    std::uint32_t bubbleId{0};
    PickSubTarget subTarget{PickSubTarget::None};
    ResizeHandle handle{ResizeHandle::None};
    std::uint32_t partId{0};
};

// Captured once at pointer-down and never modified; every move recomputes
// from `original` plus the cumulative delta.
struct GestureSnapshot {
    GestureMode mode{GestureMode::Idle};
    ResizeHandle handle{ResizeHandle::None};
    std::uint32_t partId{0};
    float startX{0.0f};
    float startY{0.0f};
    Bubble original;
};

} // namespace balloon
