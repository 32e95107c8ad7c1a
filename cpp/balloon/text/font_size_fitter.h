#ifndef BALLOON_TEXT_FONT_SIZE_FITTER_H
#define BALLOON_TEXT_FONT_SIZE_FITTER_H

#include "balloon/core/types.h"
#include "balloon/render/draw_surface.h"

#include <cstdint>
#include <string>
#include <string_view>

namespace balloon::text {

// Placeholder text of a freshly added bubble; never auto-fitted.
static constexpr const char* kPlaceholderText = "Your text here";

struct FitOptions {
    float minFontSize{8.0f};
    float maxFontSize{40.0f};
    int maxIterations{20};
    float lineHeightFactor{1.4f};
};

struct FitResult {
    float fontSize{0.0f};
    bool fits{false};
    float textWidth{0.0f};
    float textHeight{0.0f};
    float scaleFactor{1.0f};   // fontSize relative to the bubble's own size
};

struct TextBlockMetrics {
    float width{0.0f};
    float height{0.0f};
    std::uint32_t lines{0};
};

// Word-wraps plain text at maxWidth. Words are never split, so an
// overlong word yields a block wider than maxWidth.
TextBlockMetrics measureWrappedText(
    DrawSurface& surface,
    std::string_view plain,
    const FontSpec& font,
    float maxWidth,
    float lineHeightFactor
);

/**
 * Largest size from min(bubble.fontSize, max) downward, in steps of one,
 * whose wrapped block fits the bubble's safe zone. Stops after
 * maxIterations steps or below min; the result is then measured at min and
 * `fits` reports whether that block actually fits.
 * `text` may be markup; tags are stripped before measuring.
 */
FitResult fitFontSize(
    DrawSurface& surface,
    std::string_view text,
    const Bubble& bubble,
    const std::string& fontFamily,
    const FitOptions& options = {}
);

// True when the text at the bubble's own font size exceeds the safe zone.
bool detectTextOverflow(
    DrawSurface& surface,
    std::string_view text,
    const Bubble& bubble,
    const std::string& fontFamily,
    float lineHeightFactor = 1.4f
);

// Copy of the bubble with the fitted font size. TextOnly bubbles, empty
// text and the placeholder are returned unchanged.
Bubble autoFitBubbleText(
    DrawSurface& surface,
    const Bubble& bubble,
    const std::string& fontFamily,
    const FitOptions& options = {}
);

} // namespace balloon::text

#endif // BALLOON_TEXT_FONT_SIZE_FITTER_H
