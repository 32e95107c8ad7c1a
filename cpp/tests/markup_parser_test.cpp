#include <gtest/gtest.h>
#include "balloon/text/markup_parser.h"

using namespace balloon::text;

namespace {

std::vector<TextSegment> segmentsOf(const char* markup) {
    TextStyle base;
    base.fontFamily = "font-comic";
    base.fontSize = 12.0f;
    return flattenDocument(parseRichText(markup), base);
}

} // namespace

TEST(MarkupParserTest, InlineStylesNest) {
    const std::vector<TextSegment> segs = segmentsOf("<b>Hi <i>there</i></b> you");
    ASSERT_EQ(segs.size(), 3u);
    EXPECT_EQ(segs[0].text, "Hi ");
    EXPECT_TRUE(segs[0].style.bold);
    EXPECT_FALSE(segs[0].style.italic);
    EXPECT_EQ(segs[1].text, "there");
    EXPECT_TRUE(segs[1].style.bold);
    EXPECT_TRUE(segs[1].style.italic);
    EXPECT_EQ(segs[2].text, " you");
    EXPECT_FALSE(segs[2].style.bold);
}

TEST(MarkupParserTest, DecorationTags) {
    const std::vector<TextSegment> segs = segmentsOf("<u>a</u><s>b</s><strong>c</strong><em>d</em>");
    ASSERT_EQ(segs.size(), 4u);
    EXPECT_TRUE(segs[0].style.underline);
    EXPECT_TRUE(segs[1].style.strikethrough);
    EXPECT_TRUE(segs[2].style.bold);
    EXPECT_TRUE(segs[3].style.italic);
}

TEST(MarkupParserTest, InlineCssOverridesInheritedStyle) {
    const std::vector<TextSegment> segs =
        segmentsOf("<span style=\"font-size: 20px; color: red; font-weight: 700; font-family: 'Bangers', cursive\">x</span>");
    ASSERT_EQ(segs.size(), 1u);
    EXPECT_FLOAT_EQ(segs[0].style.fontSize, 20.0f);
    EXPECT_EQ(segs[0].style.color, "red");
    EXPECT_TRUE(segs[0].style.bold);
    EXPECT_EQ(segs[0].style.fontFamily, "Bangers");
}

TEST(MarkupParserTest, PointSizesConvertToPixels) {
    const std::vector<TextSegment> segs = segmentsOf("<span style=\"font-size:15pt\">x</span><span style=\"font-size:2em\">y</span>");
    ASSERT_EQ(segs.size(), 2u);
    EXPECT_FLOAT_EQ(segs[0].style.fontSize, 20.0f);
    // Relative units are ignored.
    EXPECT_FLOAT_EQ(segs[1].style.fontSize, 12.0f);
}

TEST(MarkupParserTest, LegacyFontAttributesLoseToInlineStyle) {
    const std::vector<TextSegment> segs =
        segmentsOf("<font face=\"Indie Flower\" color=\"#00ff00\" style=\"color:#0000ff\">x</font>");
    ASSERT_EQ(segs.size(), 1u);
    EXPECT_EQ(segs[0].style.fontFamily, "Indie Flower");
    EXPECT_EQ(segs[0].style.color, "#0000ff");
}

TEST(MarkupParserTest, BreaksAndBlocks) {
    std::vector<TextSegment> segs = segmentsOf("a<br>b<br/>c");
    ASSERT_EQ(segs.size(), 5u);
    EXPECT_TRUE(segs[1].isBreak);
    EXPECT_TRUE(segs[3].isBreak);

    // Blocks start and end their own line; no leading break on an empty line.
    segs = segmentsOf("<div>one</div><div>two</div>");
    ASSERT_EQ(segs.size(), 4u);
    EXPECT_EQ(segs[0].text, "one");
    EXPECT_TRUE(segs[1].isBreak);
    EXPECT_EQ(segs[2].text, "two");
    EXPECT_TRUE(segs[3].isBreak);

    segs = segmentsOf("lead<p>para</p>");
    ASSERT_EQ(segs.size(), 4u);
    EXPECT_EQ(segs[0].text, "lead");
    EXPECT_TRUE(segs[1].isBreak);
    EXPECT_EQ(segs[2].text, "para");
}

TEST(MarkupParserTest, TagNamesAreCaseInsensitive) {
    RichTextDocument doc;
    ASSERT_TRUE(parseMarkup("<B>x</B><BR>", doc));
    const std::vector<TextSegment> segs = flattenDocument(doc, TextStyle{});
    ASSERT_EQ(segs.size(), 2u);
    EXPECT_TRUE(segs[0].style.bold);
    EXPECT_TRUE(segs[1].isBreak);
}

TEST(MarkupParserTest, CommentsAndDeclarationsAreSkipped) {
    RichTextDocument doc;
    ASSERT_TRUE(parseMarkup("<!DOCTYPE html>a<!-- note <b> -->b", doc));
    EXPECT_EQ(plainText(doc), "ab");
}

TEST(MarkupParserTest, MalformedMarkupFallsBackToPlainText) {
    RichTextDocument doc;
    EXPECT_FALSE(parseMarkup("<b>unclosed", doc));
    EXPECT_FALSE(parseMarkup("<b>x</i>", doc));
    EXPECT_FALSE(parseMarkup("a < b", doc));
    EXPECT_FALSE(parseMarkup("stray</b>", doc));

    const RichTextDocument fallback = parseRichText("<b>unclosed");
    EXPECT_TRUE(fallback.plainFallback);
    EXPECT_EQ(plainText(fallback), "<b>unclosed");
    const std::vector<TextSegment> segs = flattenDocument(fallback, TextStyle{});
    ASSERT_EQ(segs.size(), 1u);
    EXPECT_FALSE(segs[0].style.bold);
}

TEST(MarkupParserTest, NestingIsCapped) {
    const auto nested = [](std::size_t depth) {
        std::string markup;
        for (std::size_t i = 0; i < depth; ++i) markup += "<i>";
        markup += "deep";
        for (std::size_t i = 0; i < depth; ++i) markup += "</i>";
        return markup;
    };

    RichTextDocument doc;
    ASSERT_TRUE(parseMarkup(nested(kMaxMarkupDepth), doc));
    const std::vector<TextSegment> segs = flattenDocument(doc, TextStyle{});
    ASSERT_EQ(segs.size(), 1u);
    EXPECT_TRUE(segs[0].style.italic);

    EXPECT_FALSE(parseMarkup(nested(kMaxMarkupDepth + 1), doc));

    const std::string hostile = nested(100000);
    const RichTextDocument fallback = parseRichText(hostile);
    EXPECT_TRUE(fallback.plainFallback);
    EXPECT_EQ(plainText(fallback), hostile);
}

TEST(MarkupParserTest, EntitiesAreDecoded) {
    EXPECT_EQ(decodeEntities("Tom &amp; Jerry &#39;hi&#39; &#x41;"), "Tom & Jerry 'hi' A");
    EXPECT_EQ(decodeEntities("&lt;b&gt;&nbsp;&quot;"), "<b> \"");
    EXPECT_EQ(decodeEntities("&#x2014;"), "\xE2\x80\x94");
    // Unknown or unterminated references stay literal.
    EXPECT_EQ(decodeEntities("&foo; & &amp"), "&foo; & &amp");

    RichTextDocument doc;
    ASSERT_TRUE(parseMarkup("<i>R&amp;D</i>", doc));
    EXPECT_EQ(plainText(doc), "R&D");
}

TEST(MarkupParserTest, PlainTextJoinsLinesWithSpaces) {
    EXPECT_EQ(plainText(parseRichText("Hello<br>world")), "Hello world");
    EXPECT_EQ(plainText(parseRichText("<b>Bold</b> move")), "Bold move");
    EXPECT_EQ(plainText(plainDocument("")), "");
}
