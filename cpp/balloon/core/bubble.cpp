#include "balloon/core/bubble.h"
#include "balloon/core/logging.h"
#include "balloon/core/util.h"

#include <cmath>
#include <utility>

namespace balloon {

EdgeAnchor edgeAnchorOf(float localX, float localY, float width, float height) {
    EdgeAnchor a;
    a.left = std::fabs(localX) < kEdgeEpsilon;
    a.right = std::fabs(localX - width) < kEdgeEpsilon;
    a.top = std::fabs(localY) < kEdgeEpsilon;
    a.bottom = std::fabs(localY - height) < kEdgeEpsilon;
    return a;
}

bool typeAllowsTail(BubbleType type) {
    return type == BubbleType::SpeechDown
        || type == BubbleType::SpeechUp
        || type == BubbleType::Whisper;
}

bool typeAllowsDots(BubbleType type) {
    return type == BubbleType::Thought;
}

bool typeHasRandomSilhouette(BubbleType type) {
    return type == BubbleType::Thought || type == BubbleType::Shout;
}

const Part* findTail(const Bubble& bubble) {
    for (const Part& p : bubble.parts) {
        if (p.isTail()) return &p;
    }
    return nullptr;
}

Part* findTail(Bubble& bubble) {
    for (Part& p : bubble.parts) {
        if (p.isTail()) return &p;
    }
    return nullptr;
}

std::size_t sanitizeBubble(Bubble& bubble) {
    bubble.width = std::max(kMinBubbleWidth, finiteOr(bubble.width, kMinBubbleWidth));
    bubble.height = std::max(kMinBubbleHeight, finiteOr(bubble.height, kMinBubbleHeight));
    bubble.x = finiteOr(bubble.x, 0.0f);
    bubble.y = finiteOr(bubble.y, 0.0f);
    if (!(bubble.fontSize > 0.0f) || !std::isfinite(bubble.fontSize)) {
        bubble.fontSize = kMinFontSize;
    }

    const bool tails = typeAllowsTail(bubble.type);
    const bool dots = typeAllowsDots(bubble.type);
    bool haveTail = false;
    std::vector<Part> kept;
    kept.reserve(bubble.parts.size());
    for (const Part& p : bubble.parts) {
        if (p.isTail() && tails && !haveTail) {
            haveTail = true;
            kept.push_back(p);
        } else if (p.isDot() && dots) {
            kept.push_back(p);
        }
    }
    const std::size_t dropped = bubble.parts.size() - kept.size();
    if (dropped > 0) {
        BALLOON_LOG_WARN("bubble %u: dropped %zu part(s) unsupported for type %s",
            bubble.id, dropped, bubbleTypeName(bubble.type));
    }
    bubble.parts = std::move(kept);
    return dropped;
}

void sanitizeToolSettings(ToolSettings& settings) {
    const ToolSettings defaults;
    settings.fontSize = clampf(finiteOr(settings.fontSize, defaults.fontSize), kMinFontSize, kMaxFontSize);
    settings.dotSize = clampf(finiteOr(settings.dotSize, defaults.dotSize), kMinDotSize, kMaxDotSize);
    if (settings.dotCount > kMaxDotCount) {
        BALLOON_LOG_WARN("dot count %u clamped to %u", settings.dotCount, kMaxDotCount);
    }
    settings.dotCount = std::min(kMaxDotCount, std::max(kMinDotCount, settings.dotCount));
}

const char* fontKey(FontName font) {
    switch (font) {
        case FontName::Comic: return "font-comic";
        case FontName::Bangers: return "font-bangers";
        case FontName::Indie: return "font-indie";
        case FontName::Marker: return "font-marker";
        case FontName::Arial: return "font-arial";
    }
    return "font-comic";
}

bool parseFontKey(std::string_view key, FontName& out) {
    static constexpr FontName kAll[] = {
        FontName::Comic, FontName::Bangers, FontName::Indie, FontName::Marker, FontName::Arial,
    };
    for (FontName f : kAll) {
        if (key == fontKey(f)) {
            out = f;
            return true;
        }
    }
    return false;
}

const char* defaultFontFamily(FontName font) {
    switch (font) {
        case FontName::Comic: return "Comic Neue";
        case FontName::Bangers: return "Bangers";
        case FontName::Indie: return "Indie Flower";
        case FontName::Marker: return "Permanent Marker";
        case FontName::Arial: return "Arial";
    }
    return "Comic Neue";
}

const char* bubbleTypeName(BubbleType type) {
    switch (type) {
        case BubbleType::SpeechDown: return "speech-down";
        case BubbleType::SpeechUp: return "speech-up";
        case BubbleType::Thought: return "thought";
        case BubbleType::Shout: return "shout";
        case BubbleType::Descriptive: return "descriptive";
        case BubbleType::Whisper: return "whisper";
        case BubbleType::TextOnly: return "text-only";
    }
    return "unknown";
}

} // namespace balloon
