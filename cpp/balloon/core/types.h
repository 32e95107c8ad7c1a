#ifndef BALLOON_CORE_TYPES_H
#define BALLOON_CORE_TYPES_H

#include <cstdint>
#include <cstddef>
#include <string>
#include <variant>
#include <vector>

namespace balloon {

// Geometry limits
static constexpr float kMinBubbleWidth = 50.0f;
static constexpr float kMinBubbleHeight = 30.0f;
static constexpr float kMinTailLength = 10.0f;
static constexpr float kMinTailBaseWidth = 10.0f;
static constexpr float kMinDotSize = 5.0f;
static constexpr float kMaxDotSize = 100.0f;
static constexpr std::uint32_t kMinDotCount = 1;
static constexpr std::uint32_t kMaxDotCount = 10;
static constexpr float kMinFontSize = 5.0f;
static constexpr float kMaxFontSize = 40.0f;

// New bubbles
static constexpr float kDefaultBubbleWidth = 150.0f;
static constexpr float kDefaultBubbleHeight = 90.0f;
static constexpr std::uint32_t kInitialZIndex = 10;

// Tail base points closer than this to an edge count as pinned to it.
static constexpr float kEdgeEpsilon = 1e-3f;

// Snapshot format constants
static constexpr std::uint32_t snapshotMagicBlnp = 0x504E4C42; // "BLNP"
static constexpr std::uint32_t snapshotVersionBlnp = 1;
static constexpr std::size_t snapshotHeaderBytes = 4 * 4;       // magic + version + sectionCount + reserved
static constexpr std::size_t snapshotSectionEntryBytes = 4 * 4; // tag + offset + size + crc32

struct Point2 { float x; float y; };

enum class BubbleType : std::uint8_t {
    SpeechDown = 0,
    SpeechUp = 1,
    Thought = 2,
    Shout = 3,
    Descriptive = 4,
    Whisper = 5,
    TextOnly = 6,
};

enum class FontName : std::uint8_t {
    Comic = 0,
    Bangers = 1,
    Indie = 2,
    Marker = 3,
    Arial = 4,
};

enum class PartType : std::uint8_t {
    SpeechTail = 1,
    ThoughtDot = 2,
};

// All positions are in bubble-local space (0..width, 0..height).
struct SpeechTailPart {
    float baseCX{0.0f};
    float baseCY{0.0f};
    float baseWidth{20.0f};
    float tipX{0.0f};
    float tipY{0.0f};
    float initialLength{30.0f};
    float initialBaseWidth{20.0f};
};

struct ThoughtDotPart {
    float offsetX{0.0f};
    float offsetY{0.0f};
    float size{15.0f}; // diameter
};

// A bubble part is either a speech tail or a thought dot, never both.
struct Part {
    std::uint32_t id{0};
    std::variant<SpeechTailPart, ThoughtDotPart> data{ThoughtDotPart{}};

    static Part makeTail(std::uint32_t id, const SpeechTailPart& tail) {
        Part p;
        p.id = id;
        p.data = tail;
        return p;
    }

    static Part makeDot(std::uint32_t id, const ThoughtDotPart& dot) {
        Part p;
        p.id = id;
        p.data = dot;
        return p;
    }

    PartType type() const { return isTail() ? PartType::SpeechTail : PartType::ThoughtDot; }
    bool isTail() const { return std::holds_alternative<SpeechTailPart>(data); }
    bool isDot() const { return std::holds_alternative<ThoughtDotPart>(data); }

    // Throw std::bad_variant_access when the part is of the other kind.
    SpeechTailPart& tail() { return std::get<SpeechTailPart>(data); }
    const SpeechTailPart& tail() const { return std::get<SpeechTailPart>(data); }
    ThoughtDotPart& dot() { return std::get<ThoughtDotPart>(data); }
    const ThoughtDotPart& dot() const { return std::get<ThoughtDotPart>(data); }
};

struct Bubble {
    std::uint32_t id{0};
    BubbleType type{BubbleType::SpeechDown};
    std::string text;                 // styled markup
    float x{0.0f};
    float y{0.0f};
    float width{kDefaultBubbleWidth};
    float height{kDefaultBubbleHeight};
    FontName fontFamily{FontName::Comic};
    float fontSize{12.0f};
    std::string textColor{"#000000"};
    std::string borderColor{"#000000"};
    std::uint32_t zIndex{0};
    std::vector<Part> parts;
    std::int32_t shapeVariant{0};
};

struct ToolSettings {
    BubbleType type{BubbleType::SpeechDown};
    FontName fontFamily{FontName::Comic};
    float fontSize{12.0f};
    std::string textColor{"#000000"};
    std::string borderColor{"#000000"};
    float tailLength{30.0f};
    float tailBaseWidth{20.0f};
    std::uint32_t dotCount{4};
    float dotSize{15.0f};
};

// Reference to the background image owned by the host.
struct ImageRef {
    std::string uri;
    float width{0.0f};
    float height{0.0f};
};

struct CanvasSize {
    float width{0.0f};
    float height{0.0f};
};

enum class BalloonError : std::uint32_t {
    Ok = 0,
    InvalidMagic = 1,
    UnsupportedVersion = 2,
    BufferTruncated = 3,
    InvalidPayloadSize = 4,
    UnknownBubble = 5,
    InvalidOperation = 6,
    SurfaceUnavailable = 7,
    FontUnavailable = 8,
};

} // namespace balloon

#endif // BALLOON_CORE_TYPES_H
