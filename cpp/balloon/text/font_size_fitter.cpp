#include "balloon/text/font_size_fitter.h"
#include "balloon/core/logging.h"
#include "balloon/shape/safe_zone.h"
#include "balloon/text/markup_parser.h"

#include <algorithm>
#include <cctype>
#include <vector>

namespace balloon::text {

namespace {

std::vector<std::string_view> splitWords(std::string_view text) {
    std::vector<std::string_view> words;
    std::size_t pos = 0;
    while (pos < text.size()) {
        while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos]))) ++pos;
        const std::size_t start = pos;
        while (pos < text.size() && !std::isspace(static_cast<unsigned char>(text[pos]))) ++pos;
        if (pos > start) words.push_back(text.substr(start, pos - start));
    }
    return words;
}

FontSpec fontAt(const std::string& family, float size) {
    FontSpec font;
    font.family = family;
    font.size = size;
    return font;
}

bool fitsZone(const TextBlockMetrics& m, const shape::SafeZone& zone) {
    return m.height <= zone.height && m.width <= zone.width;
}

} // namespace

TextBlockMetrics measureWrappedText(
    DrawSurface& surface,
    std::string_view plain,
    const FontSpec& font,
    float maxWidth,
    float lineHeightFactor
) {
    TextBlockMetrics metrics;
    std::string current;
    std::vector<std::string> lines;
    for (std::string_view word : splitWords(plain)) {
        std::string candidate = current;
        if (!candidate.empty()) candidate.push_back(' ');
        candidate.append(word.data(), word.size());
        if (!current.empty() && surface.measureText(candidate, font) > maxWidth) {
            lines.push_back(std::move(current));
            current.assign(word.data(), word.size());
        } else {
            current = std::move(candidate);
        }
    }
    if (!current.empty()) lines.push_back(std::move(current));

    for (const std::string& line : lines) {
        metrics.width = std::max(metrics.width, surface.measureText(line, font));
    }
    metrics.lines = static_cast<std::uint32_t>(lines.size());
    metrics.height = static_cast<float>(lines.size()) * font.size * lineHeightFactor;
    return metrics;
}

FitResult fitFontSize(
    DrawSurface& surface,
    std::string_view text,
    const Bubble& bubble,
    const std::string& fontFamily,
    const FitOptions& options
) {
    const shape::SafeZone zone = shape::computeSafeZone(bubble);
    const std::string plain = plainText(parseRichText(text));
    const float target = bubble.fontSize > 0.0f ? bubble.fontSize : options.minFontSize;
    const auto scaleOf = [&](float size) { return target > 0.0f ? size / target : 1.0f; };

    float size = std::min(target, options.maxFontSize);
    for (int iteration = 0; size >= options.minFontSize && iteration < options.maxIterations; ++iteration) {
        const TextBlockMetrics m = measureWrappedText(surface, plain, fontAt(fontFamily, size), zone.width, options.lineHeightFactor);
        if (fitsZone(m, zone)) {
            return FitResult{size, true, m.width, m.height, scaleOf(size)};
        }
        size -= 1.0f;
    }

    const TextBlockMetrics m = measureWrappedText(
        surface, plain, fontAt(fontFamily, options.minFontSize), zone.width, options.lineHeightFactor);
    const bool fits = fitsZone(m, zone);
    BALLOON_LOG_DEBUG("fit exhausted for bubble %u, min size %s", bubble.id, fits ? "fits" : "overflows");
    return FitResult{options.minFontSize, fits, m.width, m.height, scaleOf(options.minFontSize)};
}

bool detectTextOverflow(
    DrawSurface& surface,
    std::string_view text,
    const Bubble& bubble,
    const std::string& fontFamily,
    float lineHeightFactor
) {
    const shape::SafeZone zone = shape::computeSafeZone(bubble);
    const std::string plain = plainText(parseRichText(text));
    const TextBlockMetrics m = measureWrappedText(surface, plain, fontAt(fontFamily, bubble.fontSize), zone.width, lineHeightFactor);
    return !fitsZone(m, zone);
}

Bubble autoFitBubbleText(
    DrawSurface& surface,
    const Bubble& bubble,
    const std::string& fontFamily,
    const FitOptions& options
) {
    if (bubble.type == BubbleType::TextOnly || bubble.text.empty() || bubble.text == kPlaceholderText) {
        return bubble;
    }
    const FitResult result = fitFontSize(surface, bubble.text, bubble, fontFamily, options);
    Bubble fitted = bubble;
    fitted.fontSize = result.fontSize;
    return fitted;
}

} // namespace balloon::text
