#include "balloon/render/draw_list.h"
#include "balloon/core/logging.h"

#include <utility>

namespace balloon {

DrawListSurface::DrawListSurface() = default;

void DrawListSurface::setStrokeStyle(std::uint32_t rgba, float width, const std::vector<float>& dash) {
    state_.strokeRGBA = rgba;
    state_.strokeWidth = width;
    state_.dash = dash;
}

DrawCommand DrawListSurface::makeCommand(DrawCommandKind kind) const {
    DrawCommand cmd;
    cmd.kind = kind;
    cmd.font = state_.font;
    cmd.fillRGBA = state_.fillRGBA;
    cmd.strokeRGBA = state_.strokeRGBA;
    cmd.strokeWidth = state_.strokeWidth;
    cmd.dash = state_.dash;
    return cmd;
}

std::vector<Point2> DrawListSurface::transformed(const std::vector<Point2>& points) const {
    std::vector<Point2> out;
    out.reserve(points.size());
    for (const Point2& p : points) {
        out.push_back(Point2{p.x + state_.offsetX, p.y + state_.offsetY});
    }
    return out;
}

void DrawListSurface::fillText(std::string_view text, float x, float y) {
    DrawCommand cmd = makeCommand(DrawCommandKind::FillText);
    cmd.text.assign(text.data(), text.size());
    cmd.points.push_back(Point2{x + state_.offsetX, y + state_.offsetY});
    commands_.push_back(std::move(cmd));
}

void DrawListSurface::strokeLine(float x0, float y0, float x1, float y1) {
    DrawCommand cmd = makeCommand(DrawCommandKind::StrokeLine);
    cmd.points = transformed({Point2{x0, y0}, Point2{x1, y1}});
    commands_.push_back(std::move(cmd));
}

void DrawListSurface::fillPolygon(const std::vector<Point2>& points) {
    if (points.size() < 3) return;
    DrawCommand cmd = makeCommand(DrawCommandKind::FillPolygon);
    cmd.points = transformed(points);
    cmd.closed = true;
    commands_.push_back(std::move(cmd));
}

void DrawListSurface::strokePolyline(const std::vector<Point2>& points, bool closed) {
    if (points.size() < 2) return;
    DrawCommand cmd = makeCommand(DrawCommandKind::StrokePolyline);
    cmd.points = transformed(points);
    cmd.closed = closed;
    commands_.push_back(std::move(cmd));
}

void DrawListSurface::save() {
    stack_.push_back(state_);
}

void DrawListSurface::restore() {
    if (stack_.empty()) {
        BALLOON_LOG_WARN("DrawListSurface::restore without matching save");
        return;
    }
    state_ = std::move(stack_.back());
    stack_.pop_back();
}

void DrawListSurface::translate(float dx, float dy) {
    state_.offsetX += dx;
    state_.offsetY += dy;
}

DrawList DrawListSurface::takeCommands() {
    DrawList out;
    out.swap(commands_);
    return out;
}

void DrawListSurface::clear() {
    commands_.clear();
    stack_.clear();
    state_ = State{};
}

} // namespace balloon
