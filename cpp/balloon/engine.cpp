#include "balloon/engine.h"
#include "balloon/core/logging.h"

#include <algorithm>
#include <cmath>

namespace balloon {

BalloonEngine::BalloonEngine() = default;

bool BalloonEngine::fail(BalloonError error) {
    lastError_ = error;
    return false;
}

bool BalloonEngine::succeed() {
    lastError_ = BalloonError::Ok;
    return true;
}

Bubble* BalloonEngine::findMutable(std::uint32_t id) {
    for (Bubble& b : bubbles_) {
        if (b.id == id) return &b;
    }
    return nullptr;
}

const Bubble* BalloonEngine::findBubble(std::uint32_t id) const {
    for (const Bubble& b : bubbles_) {
        if (b.id == id) return &b;
    }
    return nullptr;
}

bool BalloonEngine::setImage(const ImageRef& image, float viewportWidth, float viewportHeight) {
    if (!(image.width > 0.0f) || !(image.height > 0.0f)) {
        BALLOON_LOG_WARN("setImage: invalid image size %.1fx%.1f", image.width, image.height);
        return fail(BalloonError::InvalidOperation);
    }

    session_.cancel();
    image_ = image;
    hasImage_ = true;

    float scale = 1.0f;
    if (viewportWidth > 0.0f && viewportHeight > 0.0f) {
        const float scaleX = viewportWidth * 0.9f / image.width;
        const float scaleY = viewportHeight * 0.8f / image.height;
        scale = std::min({scaleX, scaleY, 1.0f});
    }
    canvas_.width = std::floor(image.width * scale);
    canvas_.height = std::floor(image.height * scale);

    bubbles_.clear();
    selectedId_ = 0;
    nextZIndex_ = kInitialZIndex;
    return succeed();
}

void BalloonEngine::clearAll() {
    session_.cancel();
    hasImage_ = false;
    image_ = ImageRef{};
    canvas_ = CanvasSize{800.0f, 600.0f};
    bubbles_.clear();
    selectedId_ = 0;
    nextZIndex_ = kInitialZIndex;
    lastError_ = BalloonError::Ok;
}

void BalloonEngine::syncToolSettingsFrom(const Bubble& bubble) {
    toolSettings_.fontFamily = bubble.fontFamily;
    toolSettings_.fontSize = bubble.fontSize;
    toolSettings_.textColor = bubble.textColor;
    toolSettings_.borderColor = bubble.borderColor;
}

} // namespace balloon
