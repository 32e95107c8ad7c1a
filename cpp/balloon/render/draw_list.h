#ifndef BALLOON_RENDER_DRAW_LIST_H
#define BALLOON_RENDER_DRAW_LIST_H

#include "balloon/render/draw_surface.h"

#include <cstdint>
#include <string>
#include <vector>

namespace balloon {

enum class DrawCommandKind : std::uint8_t {
    FillText = 0,
    StrokeLine = 1,
    FillPolygon = 2,
    StrokePolyline = 3,
};

// One recorded draw call with the state it was issued under. Coordinates
// are already translated into the surface's root space.
struct DrawCommand {
    DrawCommandKind kind{DrawCommandKind::FillText};
    std::string text;
    std::vector<Point2> points;     // line endpoints, polygon or polyline
    bool closed{false};
    text::FontSpec font;
    std::uint32_t fillRGBA{0x000000FFu};
    std::uint32_t strokeRGBA{0x000000FFu};
    float strokeWidth{1.0f};
    std::vector<float> dash;
};

using DrawList = std::vector<DrawCommand>;

/**
 * DrawListSurface: records every draw call into a DrawList that a raster
 * encoder replays. Measurement is left to subclasses.
 */
class DrawListSurface : public DrawSurface {
public:
    DrawListSurface();

    void setFont(const text::FontSpec& font) override { state_.font = font; }
    void setFillColor(std::uint32_t rgba) override { state_.fillRGBA = rgba; }
    void setStrokeStyle(std::uint32_t rgba, float width, const std::vector<float>& dash) override;

    void fillText(std::string_view text, float x, float y) override;
    void strokeLine(float x0, float y0, float x1, float y1) override;
    void fillPolygon(const std::vector<Point2>& points) override;
    void strokePolyline(const std::vector<Point2>& points, bool closed) override;

    void save() override;
    void restore() override;
    void translate(float dx, float dy) override;

    const DrawList& commands() const { return commands_; }
    DrawList takeCommands();
    void clear();

private:
    struct State {
        text::FontSpec font;
        std::uint32_t fillRGBA{0x000000FFu};
        std::uint32_t strokeRGBA{0x000000FFu};
        float strokeWidth{1.0f};
        std::vector<float> dash;
        float offsetX{0.0f};
        float offsetY{0.0f};
    };

    DrawCommand makeCommand(DrawCommandKind kind) const;
    std::vector<Point2> transformed(const std::vector<Point2>& points) const;

    State state_;
    std::vector<State> stack_;
    DrawList commands_;
};

} // namespace balloon

#endif // BALLOON_RENDER_DRAW_LIST_H
