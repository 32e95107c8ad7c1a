#ifndef BALLOON_TEXT_FONT_SURFACE_H
#define BALLOON_TEXT_FONT_SURFACE_H

#include "balloon/render/draw_list.h"
#include "balloon/text/font_manager.h"

#include <string_view>

typedef struct hb_buffer_t hb_buffer_t;

namespace balloon::text {

/**
 * FontSurface: production surface. Runs are measured by shaping them with
 * HarfBuzz against the faces in a FontManager; draw calls are recorded for
 * the raster encoder.
 *
 * Without any loaded face the surface reports fontsAvailable() == false
 * and measures with a fixed per-character estimate so layout still
 * terminates.
 */
class FontSurface : public DrawListSurface {
public:
    explicit FontSurface(FontManager& fonts);
    ~FontSurface() override;

    FontSurface(const FontSurface&) = delete;
    FontSurface& operator=(const FontSurface&) = delete;

    bool ready() const override;
    bool fontsAvailable() const override;
    float measureText(std::string_view text, const FontSpec& font) override;

    // Number of measurements answered by the estimate instead of a face.
    std::size_t fallbackMeasurements() const { return fallbackMeasurements_; }

private:
    FontManager& fonts_;
    hb_buffer_t* hbBuffer_ = nullptr;
    std::size_t fallbackMeasurements_ = 0;
};

// Advance sum of the UTF-8 code points times `perEm` of the size.
float estimateTextWidth(std::string_view text, float fontSize, float perEm = 0.55f);

} // namespace balloon::text

#endif // BALLOON_TEXT_FONT_SURFACE_H
