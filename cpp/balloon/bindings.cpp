#ifdef EMSCRIPTEN
#include <emscripten/bind.h>
#include <emscripten/emscripten.h>
#include <emscripten/val.h>
#endif

#include "balloon/engine.h"
#include "balloon/render/path_flatten.h"
#include "balloon/shape/shape_generator.h"
#include "balloon/text/font_manager.h"
#include "balloon/text/font_surface.h"

#ifdef EMSCRIPTEN
using namespace balloon;

namespace {

std::vector<Bubble> getBubbles(const BalloonEngine& engine) {
    return engine.bubbles();
}

Bubble getBubble(const BalloonEngine& engine, std::uint32_t id) {
    const Bubble* b = engine.findBubble(id);
    return b ? *b : Bubble{};
}

bool loadProjectBytes(BalloonEngine& engine, const std::vector<std::uint8_t>& bytes) {
    return engine.loadProject(bytes.data(), static_cast<std::uint32_t>(bytes.size())) == BalloonError::Ok;
}

CanvasSize getCanvasSize(const BalloonEngine& engine) {
    return engine.canvasSize();
}

ToolSettings getToolSettings(const BalloonEngine& engine) {
    return engine.toolSettings();
}

bool autoFitTextWith(BalloonEngine& engine, std::uint32_t id, text::FontSurface& surface) {
    return engine.autoFitText(id, surface);
}

std::uint32_t lastErrorCode(const BalloonEngine& engine) {
    return static_cast<std::uint32_t>(engine.lastError());
}

std::uint32_t exportSceneTo(BalloonEngine& engine, text::FontSurface& surface) {
    surface.clear();
    return static_cast<std::uint32_t>(engine.exportScene(surface));
}

// Font bytes are written into the module heap by the caller.
std::uint32_t loadFontFromPtr(
    text::FontManager& fonts,
    std::uintptr_t ptr,
    std::uint32_t size,
    const std::string& family,
    bool bold,
    bool italic
) {
    return fonts.loadFontFromMemory(reinterpret_cast<const std::uint8_t*>(ptr), size, family, bold, italic);
}

std::vector<DrawCommand> drawCommands(const text::FontSurface& surface) {
    return surface.commands();
}

// SVG path data of a bubble's outline for the live editing view.
std::string outlinePathData(const Bubble& bubble) {
    return vector::toSvgPathData(shape::generateShape(bubble).outline);
}

// Parts cross to JS as {id, type, tail, dot}; only the record matching
// `type` is read back. `type` is registered first so it is applied first.
PartType getPartType(const Part& p) { return p.type(); }

void setPartType(Part& p, PartType type) {
    if (type == p.type()) return;
    if (type == PartType::SpeechTail) {
        p.data = SpeechTailPart{};
    } else {
        p.data = ThoughtDotPart{};
    }
}

SpeechTailPart getPartTail(const Part& p) { return p.isTail() ? p.tail() : SpeechTailPart{}; }

void setPartTail(Part& p, SpeechTailPart tail) {
    if (p.isTail()) p.tail() = tail;
}

ThoughtDotPart getPartDot(const Part& p) { return p.isDot() ? p.dot() : ThoughtDotPart{}; }

void setPartDot(Part& p, ThoughtDotPart dot) {
    if (p.isDot()) p.dot() = dot;
}

} // namespace

EMSCRIPTEN_BINDINGS(balloon_engine_module) {
    emscripten::enum_<BubbleType>("BubbleType")
        .value("SpeechDown", BubbleType::SpeechDown)
        .value("SpeechUp", BubbleType::SpeechUp)
        .value("Thought", BubbleType::Thought)
        .value("Shout", BubbleType::Shout)
        .value("Descriptive", BubbleType::Descriptive)
        .value("Whisper", BubbleType::Whisper)
        .value("TextOnly", BubbleType::TextOnly);

    emscripten::enum_<FontName>("FontName")
        .value("Comic", FontName::Comic)
        .value("Bangers", FontName::Bangers)
        .value("Indie", FontName::Indie)
        .value("Marker", FontName::Marker)
        .value("Arial", FontName::Arial);

    emscripten::enum_<PartType>("PartType")
        .value("SpeechTail", PartType::SpeechTail)
        .value("ThoughtDot", PartType::ThoughtDot);

    emscripten::enum_<PickSubTarget>("PickSubTarget")
        .value("None", PickSubTarget::None)
        .value("Body", PickSubTarget::Body)
        .value("ResizeHandle", PickSubTarget::ResizeHandle)
        .value("Dot", PickSubTarget::Dot)
        .value("TailTip", PickSubTarget::TailTip)
        .value("TailBase", PickSubTarget::TailBase);

    emscripten::enum_<ResizeHandle>("ResizeHandle")
        .value("None", ResizeHandle::None)
        .value("TopLeft", ResizeHandle::TopLeft)
        .value("TopCenter", ResizeHandle::TopCenter)
        .value("TopRight", ResizeHandle::TopRight)
        .value("MiddleLeft", ResizeHandle::MiddleLeft)
        .value("MiddleRight", ResizeHandle::MiddleRight)
        .value("BottomLeft", ResizeHandle::BottomLeft)
        .value("BottomCenter", ResizeHandle::BottomCenter)
        .value("BottomRight", ResizeHandle::BottomRight);

    emscripten::enum_<GestureMode>("GestureMode")
        .value("Idle", GestureMode::Idle)
        .value("Moving", GestureMode::Moving)
        .value("Resizing", GestureMode::Resizing)
        .value("MovingPart", GestureMode::MovingPart)
        .value("MovingTailTip", GestureMode::MovingTailTip)
        .value("MovingTailBase", GestureMode::MovingTailBase);

    emscripten::enum_<DrawCommandKind>("DrawCommandKind")
        .value("FillText", DrawCommandKind::FillText)
        .value("StrokeLine", DrawCommandKind::StrokeLine)
        .value("FillPolygon", DrawCommandKind::FillPolygon)
        .value("StrokePolyline", DrawCommandKind::StrokePolyline);

    emscripten::value_object<Point2>("Point2")
        .field("x", &Point2::x)
        .field("y", &Point2::y);

    emscripten::value_object<SpeechTailPart>("SpeechTailPart")
        .field("baseCX", &SpeechTailPart::baseCX)
        .field("baseCY", &SpeechTailPart::baseCY)
        .field("baseWidth", &SpeechTailPart::baseWidth)
        .field("tipX", &SpeechTailPart::tipX)
        .field("tipY", &SpeechTailPart::tipY)
        .field("initialLength", &SpeechTailPart::initialLength)
        .field("initialBaseWidth", &SpeechTailPart::initialBaseWidth);

    emscripten::value_object<ThoughtDotPart>("ThoughtDotPart")
        .field("offsetX", &ThoughtDotPart::offsetX)
        .field("offsetY", &ThoughtDotPart::offsetY)
        .field("size", &ThoughtDotPart::size);

    emscripten::value_object<Part>("Part")
        .field("id", &Part::id)
        .field("type", &getPartType, &setPartType)
        .field("tail", &getPartTail, &setPartTail)
        .field("dot", &getPartDot, &setPartDot);

    emscripten::value_object<Bubble>("Bubble")
        .field("id", &Bubble::id)
        .field("type", &Bubble::type)
        .field("text", &Bubble::text)
        .field("x", &Bubble::x)
        .field("y", &Bubble::y)
        .field("width", &Bubble::width)
        .field("height", &Bubble::height)
        .field("fontFamily", &Bubble::fontFamily)
        .field("fontSize", &Bubble::fontSize)
        .field("textColor", &Bubble::textColor)
        .field("borderColor", &Bubble::borderColor)
        .field("zIndex", &Bubble::zIndex)
        .field("parts", &Bubble::parts)
        .field("shapeVariant", &Bubble::shapeVariant);

    emscripten::value_object<ToolSettings>("ToolSettings")
        .field("type", &ToolSettings::type)
        .field("fontFamily", &ToolSettings::fontFamily)
        .field("fontSize", &ToolSettings::fontSize)
        .field("textColor", &ToolSettings::textColor)
        .field("borderColor", &ToolSettings::borderColor)
        .field("tailLength", &ToolSettings::tailLength)
        .field("tailBaseWidth", &ToolSettings::tailBaseWidth)
        .field("dotCount", &ToolSettings::dotCount)
        .field("dotSize", &ToolSettings::dotSize);

    emscripten::value_object<ImageRef>("ImageRef")
        .field("uri", &ImageRef::uri)
        .field("width", &ImageRef::width)
        .field("height", &ImageRef::height);

    emscripten::value_object<CanvasSize>("CanvasSize")
        .field("width", &CanvasSize::width)
        .field("height", &CanvasSize::height);

    emscripten::value_object<GestureTarget>("GestureTarget")
        .field("bubbleId", &GestureTarget::bubbleId)
        .field("subTarget", &GestureTarget::subTarget)
        .field("handle", &GestureTarget::handle)
        .field("partId", &GestureTarget::partId);

    emscripten::value_object<PickResult>("PickResult")
        .field("target", &PickResult::target)
        .field("distance", &PickResult::distance);

    emscripten::value_object<text::FontSpec>("FontSpec")
        .field("family", &text::FontSpec::family)
        .field("size", &text::FontSpec::size)
        .field("bold", &text::FontSpec::bold)
        .field("italic", &text::FontSpec::italic);

    emscripten::value_object<DrawCommand>("DrawCommand")
        .field("kind", &DrawCommand::kind)
        .field("text", &DrawCommand::text)
        .field("points", &DrawCommand::points)
        .field("closed", &DrawCommand::closed)
        .field("font", &DrawCommand::font)
        .field("fillRGBA", &DrawCommand::fillRGBA)
        .field("strokeRGBA", &DrawCommand::strokeRGBA)
        .field("strokeWidth", &DrawCommand::strokeWidth)
        .field("dash", &DrawCommand::dash);

    emscripten::register_vector<Part>("PartVector");
    emscripten::register_vector<Bubble>("BubbleVector");
    emscripten::register_vector<Point2>("Point2Vector");
    emscripten::register_vector<float>("FloatVector");
    emscripten::register_vector<std::uint8_t>("ByteVector");
    emscripten::register_vector<DrawCommand>("DrawCommandVector");

    emscripten::class_<text::FontManager>("FontManager")
        .constructor<>()
        .function("initialize", &text::FontManager::initialize)
        .function("loadFontFromPtr", &loadFontFromPtr)
        .function("unloadFont", &text::FontManager::unloadFont)
        .function("hasAnyFont", &text::FontManager::hasAnyFont);

    emscripten::class_<text::FontSurface>("FontSurface")
        .constructor<text::FontManager&>()
        .function("fontsAvailable", &text::FontSurface::fontsAvailable)
        .function("drawCommands", &drawCommands);

    emscripten::class_<BalloonEngine>("BalloonEngine")
        .constructor<>()
        .function("setImage", &BalloonEngine::setImage)
        .function("hasImage", &BalloonEngine::hasImage)
        .function("canvasSize", &getCanvasSize)
        .function("addBubble", &BalloonEngine::addBubble)
        .function("selectBubble", &BalloonEngine::selectBubble)
        .function("updateBubble", &BalloonEngine::updateBubble)
        .function("deleteBubble", &BalloonEngine::deleteBubble)
        .function("clearAll", &BalloonEngine::clearAll)
        .function("commitText", &BalloonEngine::commitText)
        .function("autoFitText", &autoFitTextWith)
        .function("getBubbles", &getBubbles)
        .function("getBubble", &getBubble)
        .function("selectedId", &BalloonEngine::selectedId)
        .function("toolSettings", &getToolSettings)
        .function("applyToolSettings", &BalloonEngine::applyToolSettings)
        .function("cycleShapeVariant", &BalloonEngine::cycleShapeVariant)
        .function("adjustFontSize", &BalloonEngine::adjustFontSize)
        .function("pointerDown", &BalloonEngine::pointerDown)
        .function("pointerMove", &BalloonEngine::pointerMove)
        .function("pointerUp", &BalloonEngine::pointerUp)
        .function("cancelGesture", &BalloonEngine::cancelGesture)
        .function("gestureMode", &BalloonEngine::gestureMode)
        .function("exportScene", &exportSceneTo)
        .function("saveProject", &BalloonEngine::saveProject)
        .function("loadProject", &loadProjectBytes)
        .function("lastError", &lastErrorCode);

    emscripten::function("outlinePathData", &outlinePathData);
}
#endif
