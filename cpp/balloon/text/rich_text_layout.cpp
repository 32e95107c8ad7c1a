#include "balloon/text/rich_text_layout.h"
#include "balloon/core/bubble.h"
#include "balloon/core/color.h"
#include "balloon/text/utf8.h"

#include <algorithm>
#include <cmath>
#include <utility>

namespace balloon::text {

namespace {

static constexpr int kMaxCenteringPasses = 3;
static constexpr int kBandSamples = 64;

struct GapPoint {
    float size;
    float offset;
};

constexpr GapPoint kGapCurve[] = {
    {5.0f, -2.0f},
    {8.0f, -1.0f},
    {12.0f, 0.0f},
    {16.0f, 2.0f},
    {24.0f, 5.0f},
    {32.0f, 8.0f},
    {40.0f, 11.0f},
};

bool isSpaceByte(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

bool isWhitespaceToken(std::string_view token) {
    return !token.empty() && isSpaceByte(token.front());
}

// Alternating runs of whitespace and non-whitespace, separators kept.
std::vector<std::string_view> splitTokens(std::string_view text) {
    std::vector<std::string_view> tokens;
    std::size_t start = 0;
    while (start < text.size()) {
        const bool space = isSpaceByte(text[start]);
        std::size_t end = start + 1;
        while (end < text.size() && isSpaceByte(text[end]) == space) ++end;
        tokens.push_back(text.substr(start, end - start));
        start = end;
    }
    return tokens;
}

void trimTrailingWhitespace(TextLine& line) {
    while (!line.segments.empty() && isWhitespaceToken(line.segments.back().text)) {
        line.width -= line.segments.back().width;
        line.segments.pop_back();
    }
    line.width = std::max(0.0f, line.width);
}

// Rows of an extent function sampled down the box. Text is kept within the
// first and last rows that have room.
struct ExtentBand {
    std::vector<float> ys;
    std::vector<float> widths;
    float top{0.0f};
    float height{0.0f};
    bool usable{false};

    // Width of the closest sampled row with room; the narrower one on ties.
    float nearestWidth(float y) const {
        float best = 0.0f;
        float bestDistance = 0.0f;
        for (std::size_t i = 0; i < ys.size(); ++i) {
            if (!(widths[i] > 0.0f)) continue;
            const float d = std::fabs(ys[i] - y);
            if (best == 0.0f || d < bestDistance || (d == bestDistance && widths[i] < best)) {
                best = widths[i];
                bestDistance = d;
            }
        }
        return best;
    }
};

ExtentBand sampleBand(const ExtentFunction& extent, float height) {
    ExtentBand band;
    band.height = height;
    if (!extent || !(height > 0.0f)) return band;

    band.ys.reserve(kBandSamples);
    band.widths.reserve(kBandSamples);
    float first = 0.0f;
    float last = 0.0f;
    for (int i = 0; i < kBandSamples; ++i) {
        const float y = height * static_cast<float>(i) / static_cast<float>(kBandSamples - 1);
        const float w = extent(y);
        band.ys.push_back(y);
        band.widths.push_back(w);
        if (w > 0.0f) {
            if (!band.usable) first = y;
            last = y;
            band.usable = true;
        }
    }
    if (band.usable) {
        band.top = first;
        band.height = last - first;
    }
    return band;
}

} // namespace

FontFamilyResolver defaultFontFamilyResolver() {
    return [](const std::string& family) -> std::string {
        FontName font;
        if (parseFontKey(family, font)) return defaultFontFamily(font);
        if (family.empty()) return "Arial";
        return family;
    };
}

float lineGapOffset(float fontSize) {
    constexpr std::size_t count = sizeof(kGapCurve) / sizeof(kGapCurve[0]);
    float offset = 0.0f;
    if (!(fontSize > kGapCurve[0].size)) {
        offset = kGapCurve[0].offset;
    } else if (fontSize >= kGapCurve[count - 1].size) {
        offset = kGapCurve[count - 1].offset;
    } else {
        for (std::size_t i = 1; i < count; ++i) {
            if (fontSize <= kGapCurve[i].size) {
                const GapPoint& a = kGapCurve[i - 1];
                const GapPoint& b = kGapCurve[i];
                const float t = (fontSize - a.size) / (b.size - a.size);
                offset = a.offset + (b.offset - a.offset) * t;
                break;
            }
        }
    }
    return std::max(offset, -0.8f * std::max(0.0f, fontSize));
}

float lineHeightFor(float fontSize) {
    return fontSize + lineGapOffset(fontSize);
}

RichTextLayoutEngine::RichTextLayoutEngine(DrawSurface& surface, FontFamilyResolver resolver)
    : surface_(surface), resolver_(resolver ? std::move(resolver) : defaultFontFamilyResolver()) {}

FontSpec RichTextLayoutEngine::fontFor(const TextStyle& style) const {
    FontSpec font;
    font.family = resolver_(style.fontFamily);
    font.size = style.fontSize;
    font.bold = style.bold;
    font.italic = style.italic;
    return font;
}

float RichTextLayoutEngine::measure(std::string_view text, const TextStyle& style) {
    return surface_.measureText(text, fontFor(style));
}

std::vector<TextLine> RichTextLayoutEngine::wrap(
    const std::vector<TextSegment>& segments,
    const TextStyle& defaultStyle,
    const LayoutBox& box,
    const ExtentFunction& extent,
    float blockOffset
) {
    const float defaultLineHeight = lineHeightFor(defaultStyle.fontSize);
    const float maxWidth = std::max(0.0f, box.width);

    std::vector<TextLine> lines;
    TextLine line;
    float currentY = 0.0f;
    bool wrapped = false;

    const auto available = [&]() -> float {
        if (!extent) return maxWidth;
        const float rowHeight = line.height > 0.0f ? line.height : defaultLineHeight;
        const float w = extent(blockOffset + currentY + rowHeight * 0.5f);
        return (w > 0.0f) ? std::min(w, maxWidth) : maxWidth;
    };

    const auto closeLine = [&](bool fromWrap) {
        trimTrailingWhitespace(line);
        if (!(line.height > 0.0f)) line.height = defaultLineHeight;
        currentY += line.height;
        lines.push_back(std::move(line));
        line = TextLine{};
        wrapped = fromWrap;
    };

    const auto append = [&](std::string_view text, const TextStyle& style, float width) {
        TextSegment seg;
        seg.text.assign(text.data(), text.size());
        seg.style = style;
        seg.width = width;
        seg.height = lineHeightFor(style.fontSize);
        seg.measured = true;
        line.width += width;
        line.height = std::max(line.height, seg.height);
        line.segments.push_back(std::move(seg));
    };

    // Greedy code point split: grow the chunk while it fits the row.
    const auto breakToken = [&](std::string_view rest, const TextStyle& style) {
        while (!rest.empty()) {
            const float maxW = available();
            std::size_t fitBytes = 0;
            float fitWidth = 0.0f;
            for (std::size_t pos = 0; pos < rest.size();) {
                const std::size_t next = pos + utf8SequenceLength(rest, pos);
                const float w = measure(rest.substr(0, next), style);
                if (line.width + w > maxW) break;
                fitBytes = next;
                fitWidth = w;
                pos = next;
            }
            if (fitBytes == 0) {
                if (!line.segments.empty()) {
                    closeLine(true);
                    continue;
                }
                // Nothing fits an empty row: place one code point anyway.
                fitBytes = utf8SequenceLength(rest, 0);
                fitWidth = measure(rest.substr(0, fitBytes), style);
            }
            append(rest.substr(0, fitBytes), style, fitWidth);
            rest.remove_prefix(fitBytes);
            if (!rest.empty()) closeLine(true);
        }
    };

    for (const TextSegment& seg : segments) {
        if (seg.isBreak) {
            closeLine(false);
            continue;
        }
        for (std::string_view token : splitTokens(seg.text)) {
            const bool blank = isWhitespaceToken(token);
            if (blank && line.segments.empty() && wrapped) continue;

            const float w = measure(token, seg.style);
            float maxW = available();
            if (!blank && w > maxW) {
                breakToken(token, seg.style);
                continue;
            }
            if (line.width + w > maxW && line.width > 0.0f) {
                closeLine(true);
                if (blank) continue;
                maxW = available();
                if (w > maxW) {
                    breakToken(token, seg.style);
                    continue;
                }
            }
            if (blank && w > maxW) continue;
            append(token, seg.style, w);
        }
    }
    if (!line.segments.empty()) closeLine(false);
    return lines;
}

TextBlockLayout RichTextLayoutEngine::layout(
    const RichTextDocument& doc,
    const LayoutBox& box,
    const TextStyle& defaultStyle,
    const ExtentFunction& extent
) {
    const std::vector<TextSegment> segments = flattenDocument(doc, defaultStyle);

    // A row with no room takes the width of the nearest row that has some.
    const ExtentBand band = sampleBand(extent, box.height);
    ExtentFunction rowExtent = extent;
    if (band.usable) {
        rowExtent = [&extent, &band](float y) {
            const float w = extent(y);
            return w > 0.0f ? w : band.nearestWidth(y);
        };
    }

    TextBlockLayout block;
    float offset = band.top + std::max(0.0f, (band.height - lineHeightFor(defaultStyle.fontSize)) * 0.5f);
    for (int pass = 0;; ++pass) {
        block.lines = wrap(segments, defaultStyle, box, rowExtent, offset);
        block.totalHeight = 0.0f;
        for (const TextLine& line : block.lines) block.totalHeight += line.height;

        // Overflowing text starts at the top of the band.
        const float centered = band.top + std::max(0.0f, (band.height - block.totalHeight) * 0.5f);
        if (!extent) {
            offset = centered;
            break;
        }
        if (std::fabs(centered - offset) < 0.5f || pass + 1 >= kMaxCenteringPasses) break;
        offset = centered;
    }
    block.top = box.y + offset;
    return block;
}

void RichTextLayoutEngine::draw(const TextBlockLayout& block, const LayoutBox& box) {
    surface_.save();
    float drawY = block.top;
    for (const TextLine& line : block.lines) {
        float x = std::max(box.x, box.x + (box.width - line.width) * 0.5f);
        // Shared middle line for every run on the row.
        const float midY = drawY + line.height * 0.5f;

        for (const TextSegment& seg : line.segments) {
            if (seg.text.empty()) continue;
            const std::uint32_t color = parseColorOr(seg.style.color, kColorBlack);
            surface_.setFont(fontFor(seg.style));
            surface_.setFillColor(color);
            surface_.fillText(seg.text, x, midY);

            if (seg.style.underline || seg.style.strikethrough) {
                surface_.setStrokeStyle(color, seg.style.fontSize / 15.0f, {});
                if (seg.style.underline) {
                    const float y = midY + seg.style.fontSize * 0.5f + 1.0f;
                    surface_.strokeLine(x, y, x + seg.width, y);
                }
                if (seg.style.strikethrough) {
                    surface_.strokeLine(x, midY, x + seg.width, midY);
                }
            }
            x += seg.width;
        }
        drawY += line.height;
    }
    surface_.restore();
}

void layoutAndDraw(
    DrawSurface& surface,
    std::string_view markup,
    const LayoutBox& box,
    const TextStyle& defaultStyle,
    const FontFamilyResolver& resolver,
    const ExtentFunction& extent
) {
    RichTextLayoutEngine engine(surface, resolver);
    const TextBlockLayout block = engine.layout(parseRichText(markup), box, defaultStyle, extent);
    engine.draw(block, box);
}

} // namespace balloon::text
