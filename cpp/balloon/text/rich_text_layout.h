#ifndef BALLOON_TEXT_RICH_TEXT_LAYOUT_H
#define BALLOON_TEXT_RICH_TEXT_LAYOUT_H

#include "balloon/render/draw_surface.h"
#include "balloon/text/markup_parser.h"
#include "balloon/text/text_types.h"

#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace balloon::text {

// Maps a style's fontFamily (font key or family name) to a family name.
using FontFamilyResolver = std::function<std::string(const std::string&)>;

// Usable width at a y measured from the top of the layout box.
using ExtentFunction = std::function<float(float)>;

// Resolves the toolbar font keys; other names pass through, empty -> Arial.
FontFamilyResolver defaultFontFamilyResolver();

// Spacing added to (or removed from) the font size to get the line height.
// Piecewise linear and non-decreasing over 5..40px, held constant outside,
// and never removes more than 80% of the size.
float lineGapOffset(float fontSize);

float lineHeightFor(float fontSize);

struct LayoutBox {
    float x{0.0f};
    float y{0.0f};
    float width{0.0f};
    float height{0.0f};
};

struct TextBlockLayout {
    std::vector<TextLine> lines;
    float totalHeight{0.0f};
    float top{0.0f};   // y of the first line; never above the usable rows
};

/**
 * RichTextLayoutEngine: wraps styled segments into lines that fit the box
 * (or the per-row extent), centers the block, and draws it.
 *
 * Wrapping is greedy over whitespace-preserving tokens. A token wider than
 * the whole row is broken by code points. With an extent function, rows are
 * queried at each line's vertical middle; the block is re-wrapped until its
 * centered position settles. The block is centered between the first and
 * last rows the extent reports room on; a row without room takes the width of
 * the nearest row with room. If no row has room the box width is used.
 */
class RichTextLayoutEngine {
public:
    explicit RichTextLayoutEngine(DrawSurface& surface, FontFamilyResolver resolver = defaultFontFamilyResolver());

    TextBlockLayout layout(
        const RichTextDocument& doc,
        const LayoutBox& box,
        const TextStyle& defaultStyle,
        const ExtentFunction& extent = nullptr
    );

    // Issues fill and decoration calls for a computed layout.
    void draw(const TextBlockLayout& block, const LayoutBox& box);

    FontSpec fontFor(const TextStyle& style) const;

private:
    std::vector<TextLine> wrap(
        const std::vector<TextSegment>& segments,
        const TextStyle& defaultStyle,
        const LayoutBox& box,
        const ExtentFunction& extent,
        float blockOffset
    );

    float measure(std::string_view text, const TextStyle& style);

    DrawSurface& surface_;
    FontFamilyResolver resolver_;
};

void layoutAndDraw(
    DrawSurface& surface,
    std::string_view markup,
    const LayoutBox& box,
    const TextStyle& defaultStyle,
    const FontFamilyResolver& resolver,
    const ExtentFunction& extent = nullptr
);

} // namespace balloon::text

#endif // BALLOON_TEXT_RICH_TEXT_LAYOUT_H
