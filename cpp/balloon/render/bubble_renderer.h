#ifndef BALLOON_RENDER_BUBBLE_RENDERER_H
#define BALLOON_RENDER_BUBBLE_RENDERER_H

#include "balloon/core/types.h"
#include "balloon/render/draw_surface.h"
#include "balloon/shape/safe_zone.h"
#include "balloon/text/rich_text_layout.h"

#include <cstdint>
#include <vector>

namespace balloon {

struct RenderOptions {
    float borderWidth{2.0f};
    std::vector<float> whisperDash{5.0f, 5.0f};
    std::uint32_t fillRGBA{0xFFFFFFFFu};
    float flattenTolerance{0.25f};
    shape::SafeZoneOptions safeZone;
};

/**
 * BubbleRenderer: draws bubbles into a DrawSurface in canvas space.
 *
 * Per bubble: white-filled outline stroked in the border color (dashed for
 * Whisper), thought dots as circles, then the rich text laid out inside
 * the bubble rectangle and bounded by the per-row text extent. TextOnly
 * bubbles draw text only.
 */
class BubbleRenderer {
public:
    explicit BubbleRenderer(
        DrawSurface& surface,
        text::FontFamilyResolver resolver = text::defaultFontFamilyResolver(),
        RenderOptions options = {}
    );

    void render(const Bubble& bubble);

    // Draws in ascending zIndex; ties keep their order.
    void renderScene(const std::vector<Bubble>& bubbles);

private:
    void drawBody(const Bubble& bubble);
    void drawText(const Bubble& bubble);

    DrawSurface& surface_;
    text::FontFamilyResolver resolver_;
    RenderOptions options_;
};

// Default text style of a bubble: its font key, size and text color.
text::TextStyle bubbleTextStyle(const Bubble& bubble);

} // namespace balloon

#endif // BALLOON_RENDER_BUBBLE_RENDERER_H
