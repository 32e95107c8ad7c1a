#include <gtest/gtest.h>
#include "balloon/text/font_size_fitter.h"
#include "tests/test_common.h"

using namespace balloon;
using namespace balloon::text;
using namespace balloon_test;

class FontSizeFitterTest : public ::testing::Test {
protected:
    FixedAdvanceSurface surface;
};

TEST_F(FontSizeFitterTest, WrapsWholeWords) {
    FontSpec font;
    font.family = "Arial";
    font.size = 10.0f;
    const TextBlockMetrics m = measureWrappedText(surface, "aa bb cc", font, 25.0f, 1.4f);
    EXPECT_EQ(m.lines, 2u);
    EXPECT_FLOAT_EQ(m.width, 25.0f);
    EXPECT_FLOAT_EQ(m.height, 2.0f * 10.0f * 1.4f);

    // A word wider than the row is kept whole.
    const TextBlockMetrics wide = measureWrappedText(surface, "abcdefghij", font, 20.0f, 1.4f);
    EXPECT_EQ(wide.lines, 1u);
    EXPECT_FLOAT_EQ(wide.width, 50.0f);

    EXPECT_EQ(measureWrappedText(surface, "   ", font, 20.0f, 1.4f).lines, 0u);
}

TEST_F(FontSizeFitterTest, LongThoughtShrinksUntilItFits) {
    Bubble b = makeBubble(BubbleType::Thought, 100.0f, 80.0f);
    b.fontSize = 40.0f;
    const FitResult r = fitFontSize(surface, "Hello world this is a long thought", b, "Arial");
    EXPECT_GE(r.fontSize, 8.0f);
    if (!r.fits) {
        EXPECT_FLOAT_EQ(r.fontSize, 8.0f);
    }
    EXPECT_FLOAT_EQ(r.scaleFactor, r.fontSize / 40.0f);
}

TEST_F(FontSizeFitterTest, FindsTheLargestFittingSize) {
    Bubble b = makeBubble(BubbleType::Thought, 100.0f, 80.0f);
    b.fontSize = 40.0f;
    FitOptions options;
    options.maxIterations = 40;
    // Safe zone 50 x 52: four lines of 9px text fit, 10px needs 56px of height.
    const FitResult r = fitFontSize(surface, "Hello world this is a long thought", b, "Arial", options);
    EXPECT_TRUE(r.fits);
    EXPECT_FLOAT_EQ(r.fontSize, 9.0f);
    EXPECT_FLOAT_EQ(r.textWidth, 49.5f);
    EXPECT_LE(r.textHeight, 52.0f);
}

TEST_F(FontSizeFitterTest, IterationCapFallsBackToMinimum) {
    Bubble b = makeBubble(BubbleType::Thought, 100.0f, 80.0f);
    b.fontSize = 40.0f;
    // Sizes 40 down to 21 are tried, then the minimum is measured.
    const FitResult r = fitFontSize(surface, "Hello world this is a long thought", b, "Arial");
    EXPECT_FLOAT_EQ(r.fontSize, 8.0f);
    EXPECT_TRUE(r.fits);
}

TEST_F(FontSizeFitterTest, ShortTextKeepsItsSize) {
    Bubble b = makeBubble(BubbleType::SpeechDown, 150.0f, 90.0f);
    b.fontSize = 14.0f;
    const FitResult r = fitFontSize(surface, "Hi!", b, "Arial");
    EXPECT_TRUE(r.fits);
    EXPECT_FLOAT_EQ(r.fontSize, 14.0f);
    EXPECT_FLOAT_EQ(r.scaleFactor, 1.0f);
}

TEST_F(FontSizeFitterTest, NeverGrowsPastTheMaximum) {
    Bubble b = makeBubble(BubbleType::Descriptive, 400.0f, 300.0f);
    b.fontSize = 60.0f;
    const FitResult r = fitFontSize(surface, "Hi", b, "Arial");
    EXPECT_FLOAT_EQ(r.fontSize, 40.0f);
}

TEST_F(FontSizeFitterTest, ExhaustedFitReportsOverflowAtMinimum) {
    Bubble b = makeBubble(BubbleType::Shout, 50.0f, 30.0f);
    b.fontSize = 20.0f;
    const FitResult r = fitFontSize(surface, "Supercalifragilisticexpialidocious", b, "Arial");
    EXPECT_FALSE(r.fits);
    EXPECT_FLOAT_EQ(r.fontSize, 8.0f);
    EXPECT_GT(r.textWidth, 25.0f);
}

TEST_F(FontSizeFitterTest, LargerBubbleNeverGetsASmallerSize) {
    const char* text = "Comics need room for long sentences sometimes";
    float previous = 0.0f;
    for (float width = 80.0f; width <= 320.0f; width += 40.0f) {
        Bubble b = makeBubble(BubbleType::SpeechDown, width, width * 0.6f);
        b.fontSize = 30.0f;
        const FitResult r = fitFontSize(surface, text, b, "Arial");
        EXPECT_GE(r.fontSize, previous) << "width " << width;
        previous = r.fontSize;
    }
}

TEST_F(FontSizeFitterTest, MarkupIsStrippedBeforeMeasuring) {
    Bubble b = makeBubble(BubbleType::Descriptive, 200.0f, 100.0f);
    b.fontSize = 12.0f;
    const FitResult plain = fitFontSize(surface, "Hello there", b, "Arial");
    const FitResult styled = fitFontSize(surface, "<b>Hello</b> <i>there</i>", b, "Arial");
    EXPECT_FLOAT_EQ(styled.fontSize, plain.fontSize);
    EXPECT_FLOAT_EQ(styled.textWidth, plain.textWidth);
}

TEST_F(FontSizeFitterTest, OverflowDetection) {
    Bubble b = makeBubble(BubbleType::Thought, 100.0f, 80.0f);
    b.fontSize = 40.0f;
    EXPECT_TRUE(detectTextOverflow(surface, "Hello world this is a long thought", b, "Arial"));

    Bubble roomy = makeBubble(BubbleType::SpeechDown, 150.0f, 90.0f);
    roomy.fontSize = 12.0f;
    EXPECT_FALSE(detectTextOverflow(surface, "Hi", roomy, "Arial"));
}

TEST_F(FontSizeFitterTest, AutoFitSkipsPlaceholderAndTextOnly) {
    Bubble b = makeBubble(BubbleType::Thought, 100.0f, 80.0f);
    b.fontSize = 40.0f;
    b.text = kPlaceholderText;
    EXPECT_FLOAT_EQ(autoFitBubbleText(surface, b, "Arial").fontSize, 40.0f);

    b.text = "Hello world this is a long thought";
    EXPECT_LT(autoFitBubbleText(surface, b, "Arial").fontSize, 40.0f);

    b.type = BubbleType::TextOnly;
    EXPECT_FLOAT_EQ(autoFitBubbleText(surface, b, "Arial").fontSize, 40.0f);
}
