#ifndef BALLOON_RENDER_DRAW_SURFACE_H
#define BALLOON_RENDER_DRAW_SURFACE_H

#include "balloon/core/types.h"
#include "balloon/text/text_types.h"

#include <cstdint>
#include <string_view>
#include <vector>

namespace balloon {

/**
 * DrawSurface: abstract 2D sink the renderer and the text layout draw into.
 *
 * Colors are packed 0xRRGGBBAA. fillText anchors the run at its left edge
 * and its vertical middle. translate/save/restore affect later calls only.
 */
class DrawSurface {
public:
    virtual ~DrawSurface() = default;

    // False when the surface has no backing to draw into.
    virtual bool ready() const { return true; }
    // False when text can only be measured by estimate.
    virtual bool fontsAvailable() const { return true; }

    virtual float measureText(std::string_view text, const text::FontSpec& font) = 0;

    virtual void setFont(const text::FontSpec& font) = 0;
    virtual void setFillColor(std::uint32_t rgba) = 0;
    virtual void setStrokeStyle(std::uint32_t rgba, float width, const std::vector<float>& dash) = 0;

    virtual void fillText(std::string_view text, float x, float y) = 0;
    virtual void strokeLine(float x0, float y0, float x1, float y1) = 0;
    virtual void fillPolygon(const std::vector<Point2>& points) = 0;
    virtual void strokePolyline(const std::vector<Point2>& points, bool closed) = 0;

    virtual void save() = 0;
    virtual void restore() = 0;
    virtual void translate(float dx, float dy) = 0;
};

} // namespace balloon

#endif // BALLOON_RENDER_DRAW_SURFACE_H
