#ifndef BALLOON_TEXT_TEXT_TYPES_H
#define BALLOON_TEXT_TEXT_TYPES_H

#include "balloon/core/types.h"

#include <cstdint>
#include <string>
#include <vector>

namespace balloon::text {

// Resolved font request handed to a surface.
struct FontSpec {
    std::string family;
    float size{12.0f};
    bool bold{false};
    bool italic{false};
};

// Inherited style of a run. fontFamily holds a font key or a family name;
// the layout engine resolves it before measuring.
struct TextStyle {
    std::string fontFamily;
    float fontSize{12.0f};
    std::string color{"#000000"};
    bool bold{false};
    bool italic{false};
    bool underline{false};
    bool strikethrough{false};
};

// Contiguous run sharing one style. A break segment carries no text and
// forces a new line.
struct TextSegment {
    std::string text;
    TextStyle style;
    bool isBreak{false};

    // Filled lazily by the layout engine.
    bool measured{false};
    float width{0.0f};
    float height{0.0f};
};

struct TextLine {
    std::vector<TextSegment> segments;
    float width{0.0f};
    float height{0.0f};   // tallest segment line height
};

struct FontMetrics {
    float unitsPerEM;
    float ascender;             // Positive, above baseline
    float descender;            // Negative, below baseline
    float lineGap;
    float underlinePosition;
    float underlineThickness;
};

} // namespace balloon::text

#endif // BALLOON_TEXT_TEXT_TYPES_H
