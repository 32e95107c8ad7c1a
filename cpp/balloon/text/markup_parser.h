#ifndef BALLOON_TEXT_MARKUP_PARSER_H
#define BALLOON_TEXT_MARKUP_PARSER_H

#include "balloon/text/text_types.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace balloon::text {

enum class MarkupNodeKind : std::uint8_t {
    Root = 0,
    Block = 1,   // div, p: starts and ends on its own line
    Inline = 2,  // styling containers and unknown tags
    Text = 3,
    Break = 4,   // br
};

// Style introduced by one node. Flags only ever switch a decoration on;
// the optionals replace the inherited value when present.
struct StyleOverrides {
    bool bold{false};
    bool italic{false};
    bool underline{false};
    bool strikethrough{false};
    std::optional<float> fontSize;
    std::optional<std::string> fontFamily;
    std::optional<std::string> color;

    void applyTo(TextStyle& style) const;
};

struct MarkupNode {
    MarkupNodeKind kind{MarkupNodeKind::Root};
    std::string tag;        // lowercased element name, empty for text/root
    std::string text;       // decoded text for Text nodes
    StyleOverrides style;
    std::vector<MarkupNode> children;
};

// Structured rich-text fragment handed from the editing surface to layout.
struct RichTextDocument {
    MarkupNode root;
    bool plainFallback{false};  // markup could not be parsed
};

// Elements nested deeper than this make the markup malformed.
static constexpr std::size_t kMaxMarkupDepth = 64;

/**
 * Parse the persisted markup subset into `out`.
 * Returns false on mismatched or unterminated tags, or nesting deeper than
 * kMaxMarkupDepth; `out` is then unspecified.
 */
bool parseMarkup(std::string_view markup, RichTextDocument& out);

// Parses markup, falling back to one plain-text run of the whole input.
RichTextDocument parseRichText(std::string_view markup);

// Document holding `text` verbatim as a single run.
RichTextDocument plainDocument(std::string_view text);

// Text content with breaks and block boundaries as single spaces.
std::string plainText(const RichTextDocument& doc);

/**
 * Flatten the tree into styled segments and break markers.
 * Entering or leaving a block starts a new line unless the current line is
 * still empty; <br> always breaks.
 */
std::vector<TextSegment> flattenDocument(const RichTextDocument& doc, const TextStyle& defaultStyle);

// Decodes the supported character references (&amp; &#39; &#x2014; ...).
std::string decodeEntities(std::string_view text);

} // namespace balloon::text

#endif // BALLOON_TEXT_MARKUP_PARSER_H
