#include "balloon/text/font_surface.h"
#include "balloon/core/logging.h"
#include "balloon/text/utf8.h"

#include <hb.h>
#include <hb-ft.h>

namespace balloon::text {

float estimateTextWidth(std::string_view text, float fontSize, float perEm) {
    return static_cast<float>(utf8Length(text)) * fontSize * perEm;
}

FontSurface::FontSurface(FontManager& fonts)
    : fonts_(fonts), hbBuffer_(hb_buffer_create()) {}

FontSurface::~FontSurface() {
    if (hbBuffer_) {
        hb_buffer_destroy(hbBuffer_);
        hbBuffer_ = nullptr;
    }
}

bool FontSurface::ready() const {
    return hbBuffer_ != nullptr;
}

bool FontSurface::fontsAvailable() const {
    return fonts_.isInitialized() && fonts_.hasAnyFont();
}

float FontSurface::measureText(std::string_view text, const FontSpec& font) {
    if (text.empty()) {
        return 0.0f;
    }

    const std::uint32_t fontId = fonts_.findFont(font.family, font.bold, font.italic);
    const FontHandle* handle = fontId != 0 ? fonts_.getFont(fontId) : nullptr;
    if (!handle || !handle->hbFont || !hbBuffer_ || !fonts_.setFontSize(fontId, font.size)) {
        ++fallbackMeasurements_;
        return estimateTextWidth(text, font.size);
    }

    hb_buffer_reset(hbBuffer_);
    hb_buffer_add_utf8(hbBuffer_, text.data(), static_cast<int>(text.size()), 0, -1);
    // Direction, script and language come from the text itself.
    hb_buffer_guess_segment_properties(hbBuffer_);
    hb_shape(handle->hbFont, hbBuffer_, nullptr, 0);

    unsigned int glyphCount = 0;
    hb_glyph_position_t* glyphPos = hb_buffer_get_glyph_positions(hbBuffer_, &glyphCount);
    if (!glyphPos) {
        ++fallbackMeasurements_;
        return estimateTextWidth(text, font.size);
    }

    // HarfBuzz positions are 26.6 fixed point.
    float width = 0.0f;
    for (unsigned int i = 0; i < glyphCount; ++i) {
        width += static_cast<float>(glyphPos[i].x_advance) / 64.0f;
    }
    return width;
}

} // namespace balloon::text
