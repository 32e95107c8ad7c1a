#include "balloon/engine.h"
#include "balloon/core/logging.h"
#include "balloon/render/bubble_renderer.h"

#include <algorithm>
#include <utility>

namespace balloon {

BalloonError BalloonEngine::exportScene(DrawSurface& surface) {
    if (!surface.ready()) {
        lastError_ = BalloonError::SurfaceUnavailable;
        return lastError_;
    }
    if (!surface.fontsAvailable()) {
        BALLOON_LOG_WARN("export: no font available for text");
        lastError_ = BalloonError::FontUnavailable;
        return lastError_;
    }

    BubbleRenderer renderer(surface);
    renderer.renderScene(bubbles_);

    lastError_ = BalloonError::Ok;
    return lastError_;
}

std::vector<std::uint8_t> BalloonEngine::saveProject() {
    if (!hasImage_) {
        fail(BalloonError::InvalidOperation);
        return {};
    }

    ProjectSnapshot data;
    data.image = image_;
    data.bubbles = bubbles_;
    data.toolSettings = toolSettings_;
    data.nextZIndex = nextZIndex_;
    data.nextId = nextId_;
    data.canvas = canvas_;
    data.hasCanvas = true;

    succeed();
    return buildProjectSnapshotBytes(data);
}

BalloonError BalloonEngine::loadProject(const std::uint8_t* data, std::uint32_t byteCount) {
    ProjectSnapshot snapshot;
    const BalloonError err = parseProjectSnapshot(data, byteCount, snapshot);
    if (err != BalloonError::Ok) {
        BALLOON_LOG_WARN("loadProject failed (%u)", static_cast<unsigned>(err));
        lastError_ = err;
        return err;
    }

    session_.cancel();
    image_ = std::move(snapshot.image);
    hasImage_ = true;
    canvas_ = snapshot.canvas;
    bubbles_ = std::move(snapshot.bubbles);
    toolSettings_ = std::move(snapshot.toolSettings);
    selectedId_ = 0;

    // Counters never fall behind what the bubbles already use.
    std::uint32_t maxId = 0;
    std::uint32_t maxZ = 0;
    for (const Bubble& b : bubbles_) {
        maxId = std::max(maxId, b.id);
        for (const Part& p : b.parts) maxId = std::max(maxId, p.id);
        maxZ = std::max(maxZ, b.zIndex);
    }
    nextId_ = std::max(snapshot.nextId, maxId + 1);
    nextZIndex_ = std::max({snapshot.nextZIndex, maxZ + 1, kInitialZIndex});

    lastError_ = BalloonError::Ok;
    return lastError_;
}

} // namespace balloon
