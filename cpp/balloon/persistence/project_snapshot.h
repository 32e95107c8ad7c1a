#ifndef BALLOON_PERSISTENCE_PROJECT_SNAPSHOT_H
#define BALLOON_PERSISTENCE_PROJECT_SNAPSHOT_H

#include "balloon/core/types.h"

#include <cstdint>
#include <vector>

namespace balloon {

struct ProjectSnapshot {
    ImageRef image;
    std::vector<Bubble> bubbles;
    ToolSettings toolSettings;
    std::uint32_t nextZIndex{kInitialZIndex};
    std::uint32_t nextId{1};    // next bubble/part id
    CanvasSize canvas;
    bool hasCanvas{false};      // false when CANV was absent on parse
    std::uint32_t version{0};
};

// Parse BLNP bytes. Returns BalloonError::Ok on success; `out` is
// unspecified otherwise. A missing CANV section defaults the canvas to half
// the image size. Bubbles are sanitized on the way in.
BalloonError parseProjectSnapshot(const std::uint8_t* src, std::uint32_t byteCount, ProjectSnapshot& out);

// Build BLNP bytes. Bubbles are written in id order.
std::vector<std::uint8_t> buildProjectSnapshotBytes(const ProjectSnapshot& data);

} // namespace balloon

#endif // BALLOON_PERSISTENCE_PROJECT_SNAPSHOT_H
