#include "balloon/engine.h"
#include "balloon/core/bubble.h"
#include "balloon/core/logging.h"
#include "balloon/core/util.h"

#include <algorithm>
#include <cctype>
#include <utility>

namespace balloon {

namespace {

bool isBlankMarkup(const std::string& markup) {
    std::size_t first = 0;
    while (first < markup.size() && std::isspace(static_cast<unsigned char>(markup[first]))) ++first;
    std::size_t last = markup.size();
    while (last > first && std::isspace(static_cast<unsigned char>(markup[last - 1]))) --last;
    const std::string trimmed = markup.substr(first, last - first);
    return trimmed.empty() || trimmed == "<br>" || trimmed == "<br/>" || trimmed == "<br />";
}

} // namespace

std::vector<Part> BalloonEngine::defaultParts(BubbleType type, float width, float height) {
    std::vector<Part> parts;
    const float tailLength = std::max(kMinTailLength, toolSettings_.tailLength);
    const float baseWidth = std::max(kMinTailBaseWidth, toolSettings_.tailBaseWidth);

    if (type == BubbleType::SpeechDown || type == BubbleType::Whisper || type == BubbleType::SpeechUp) {
        const bool up = type == BubbleType::SpeechUp;
        SpeechTailPart tail;
        tail.baseCX = width * 0.5f;
        tail.baseCY = up ? 0.0f : height;
        tail.baseWidth = baseWidth;
        tail.tipX = tail.baseCX;
        tail.tipY = up ? tail.baseCY - tailLength : tail.baseCY + tailLength;
        tail.initialLength = tailLength;
        tail.initialBaseWidth = baseWidth;
        parts.push_back(Part::makeTail(allocateId(), tail));
    } else if (type == BubbleType::Thought) {
        const std::uint32_t count = std::min(kMaxDotCount, std::max(kMinDotCount, toolSettings_.dotCount));
        const float baseSize = clampf(toolSettings_.dotSize, kMinDotSize, kMaxDotSize);
        const float n = static_cast<float>(count);
        // Dots shrink away from the bubble, in a row below its center.
        const float shrinkStep = baseSize / std::max(1.0f, n - 1.0f) * 0.5f;
        for (std::uint32_t i = 0; i < count; ++i) {
            const float fi = static_cast<float>(i);
            ThoughtDotPart dot;
            dot.size = std::max(kMinDotSize, baseSize - fi * shrinkStep);
            dot.offsetX = width * 0.5f - (n * (dot.size + 5.0f)) * 0.5f + fi * (dot.size + 5.0f) + dot.size * 0.5f;
            dot.offsetY = height + fi * (dot.size * 0.5f + 2.0f) + 10.0f + dot.size * 0.5f;
            parts.push_back(Part::makeDot(allocateId(), dot));
        }
    }
    return parts;
}

std::uint32_t BalloonEngine::addBubble(float x, float y) {
    if (!hasImage_) {
        BALLOON_LOG_DEBUG("addBubble: no image loaded");
        fail(BalloonError::InvalidOperation);
        return 0;
    }

    Bubble b;
    b.id = allocateId();
    b.type = toolSettings_.type;
    b.text = text::kPlaceholderText;
    b.width = kDefaultBubbleWidth;
    b.height = kDefaultBubbleHeight;
    b.x = std::max(0.0f, std::min(x - b.width * 0.5f, canvas_.width - b.width));
    b.y = std::max(0.0f, std::min(y - b.height * 0.5f, canvas_.height - b.height));
    b.fontFamily = toolSettings_.fontFamily;
    b.fontSize = clampf(toolSettings_.fontSize, kMinFontSize, kMaxFontSize);
    b.textColor = toolSettings_.textColor;
    b.borderColor = toolSettings_.borderColor;
    b.zIndex = nextZIndex_++;
    b.parts = defaultParts(b.type, b.width, b.height);

    const std::uint32_t id = b.id;
    bubbles_.push_back(std::move(b));
    selectedId_ = id;
    BALLOON_LOG_DEBUG("added bubble %u (%s)", id, bubbleTypeName(toolSettings_.type));
    succeed();
    return id;
}

bool BalloonEngine::selectBubble(std::uint32_t id) {
    if (id == 0) {
        selectedId_ = 0;
        return succeed();
    }
    Bubble* b = findMutable(id);
    if (!b) return fail(BalloonError::UnknownBubble);

    b->zIndex = nextZIndex_++;
    selectedId_ = id;
    syncToolSettingsFrom(*b);
    return succeed();
}

bool BalloonEngine::updateBubble(const Bubble& bubble) {
    Bubble* b = findMutable(bubble.id);
    if (!b) return fail(BalloonError::UnknownBubble);

    Bubble next = bubble;
    sanitizeBubble(next);
    *b = std::move(next);
    if (selectedId_ == b->id) syncToolSettingsFrom(*b);
    return succeed();
}

bool BalloonEngine::deleteBubble(std::uint32_t id) {
    const auto it = std::find_if(bubbles_.begin(), bubbles_.end(), [id](const Bubble& b) { return b.id == id; });
    if (it == bubbles_.end()) return fail(BalloonError::UnknownBubble);

    if (session_.bubbleId() == id) session_.cancel();
    bubbles_.erase(it);
    if (selectedId_ == id) selectedId_ = 0;
    return succeed();
}

bool BalloonEngine::commitText(std::uint32_t id, const std::string& markup) {
    Bubble* b = findMutable(id);
    if (!b) return fail(BalloonError::UnknownBubble);
    b->text = isBlankMarkup(markup) ? std::string(text::kPlaceholderText) : markup;
    return succeed();
}

bool BalloonEngine::autoFitText(std::uint32_t id, DrawSurface& surface, const text::FitOptions& options) {
    Bubble* b = findMutable(id);
    if (!b) return fail(BalloonError::UnknownBubble);
    if (!surface.ready()) return fail(BalloonError::SurfaceUnavailable);

    const Bubble fitted = text::autoFitBubbleText(surface, *b, defaultFontFamily(b->fontFamily), options);
    b->fontSize = fitted.fontSize;
    if (selectedId_ == id) syncToolSettingsFrom(*b);
    return succeed();
}

void BalloonEngine::applyToolSettings(const ToolSettings& settings) {
    toolSettings_ = settings;
    sanitizeToolSettings(toolSettings_);

    if (Bubble* b = findMutable(selectedId_)) {
        b->fontFamily = toolSettings_.fontFamily;
        b->fontSize = toolSettings_.fontSize;
        b->textColor = toolSettings_.textColor;
        b->borderColor = toolSettings_.borderColor;
    }
    lastError_ = BalloonError::Ok;
}

bool BalloonEngine::cycleShapeVariant(std::uint32_t id, std::int32_t delta) {
    Bubble* b = findMutable(id);
    if (!b) return fail(BalloonError::UnknownBubble);
    if (!typeHasRandomSilhouette(b->type)) return fail(BalloonError::InvalidOperation);
    b->shapeVariant += delta;
    return succeed();
}

bool BalloonEngine::adjustFontSize(std::uint32_t id, float delta) {
    Bubble* b = findMutable(id);
    if (!b) return fail(BalloonError::UnknownBubble);
    b->fontSize = clampf(b->fontSize + delta, kMinFontSize, kMaxFontSize);
    if (selectedId_ == id) syncToolSettingsFrom(*b);
    return succeed();
}

} // namespace balloon
