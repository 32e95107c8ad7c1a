#include <gtest/gtest.h>
#include "balloon/engine.h"
#include "balloon/text/font_manager.h"
#include "balloon/text/font_surface.h"
#include "tests/test_common.h"

#include <cmath>

using namespace balloon;
using namespace balloon::text;
using namespace balloon_test;

class FontSurfaceTest : public ::testing::Test {
protected:
    FontManager fontManager;
    bool fontLoaded = false;
    std::uint32_t testFontId = 0;

    void SetUp() override {
        ASSERT_TRUE(fontManager.initialize());
        for (const std::string& path : systemFontPaths()) {
            testFontId = fontManager.loadFontFromFile(path, "Comic Neue");
            if (testFontId != 0) {
                fontLoaded = true;
                break;
            }
        }
    }

    static FontSpec spec(const char* family, float size) {
        FontSpec f;
        f.family = family;
        f.size = size;
        return f;
    }
};

TEST_F(FontSurfaceTest, ShapedWidthScalesWithText) {
    if (!fontLoaded) {
        GTEST_SKIP() << "No system font available for testing";
    }

    FontSurface surface(fontManager);
    EXPECT_TRUE(surface.ready());
    EXPECT_TRUE(surface.fontsAvailable());

    const float one = surface.measureText("Hello", spec("Comic Neue", 16.0f));
    const float two = surface.measureText("HelloHello", spec("Comic Neue", 16.0f));
    EXPECT_GT(one, 0.0f);
    EXPECT_NEAR(two, 2.0f * one, 1.0f);

    const float larger = surface.measureText("Hello", spec("Comic Neue", 32.0f));
    EXPECT_NEAR(larger, 2.0f * one, 1.0f);
    EXPECT_FLOAT_EQ(surface.measureText("", spec("Comic Neue", 16.0f)), 0.0f);
    EXPECT_EQ(surface.fallbackMeasurements(), 0u);
}

TEST_F(FontSurfaceTest, UnknownFamilyUsesTheDefaultFace) {
    if (!fontLoaded) {
        GTEST_SKIP() << "No system font available for testing";
    }

    FontSurface surface(fontManager);
    EXPECT_EQ(fontManager.findFont("Bangers", false, false), testFontId);
    EXPECT_EQ(fontManager.findFont("comic neue", true, false), testFontId);

    const float known = surface.measureText("Pow", spec("Comic Neue", 20.0f));
    const float unknown = surface.measureText("Pow", spec("Bangers", 20.0f));
    EXPECT_FLOAT_EQ(known, unknown);
    EXPECT_EQ(surface.fallbackMeasurements(), 0u);
}

TEST_F(FontSurfaceTest, LayoutWithRealFontStaysInsideTheBubble) {
    if (!fontLoaded) {
        GTEST_SKIP() << "No system font available for testing";
    }

    FontSurface surface(fontManager);
    Bubble b = makeBubble(BubbleType::SpeechDown, 150.0f, 90.0f);
    b.text = "Hello there, <b>friend</b>!";
    b.fontSize = 14.0f;
    const FitResult fit = fitFontSize(surface, b.text, b, "Comic Neue");
    EXPECT_TRUE(fit.fits);
    EXPECT_GT(fit.textWidth, 0.0f);
    EXPECT_LE(fit.textWidth, 150.0f);
}

TEST(FontSurfaceNoFontTest, EstimatesWithoutFaces) {
    FontManager fontManager;
    ASSERT_TRUE(fontManager.initialize());
    FontSurface surface(fontManager);

    EXPECT_TRUE(surface.ready());
    EXPECT_FALSE(surface.fontsAvailable());

    FontSpec f;
    f.family = "Arial";
    f.size = 10.0f;
    EXPECT_FLOAT_EQ(surface.measureText("abc", f), 16.5f);
    EXPECT_EQ(surface.fallbackMeasurements(), 1u);
    // Code points, not bytes.
    EXPECT_FLOAT_EQ(estimateTextWidth("\xC3\xA9t\xC3\xA9", 10.0f), 16.5f);
}

TEST(FontSurfaceNoFontTest, ExportWithoutFontsFails) {
    FontManager fontManager;
    ASSERT_TRUE(fontManager.initialize());
    FontSurface surface(fontManager);

    BalloonEngine engine;
    ASSERT_TRUE(engine.setImage(ImageRef{"page.png", 800.0f, 600.0f}, 1600.0f, 1200.0f));
    engine.addBubble(200.0f, 200.0f);
    EXPECT_EQ(engine.exportScene(surface), BalloonError::FontUnavailable);
    EXPECT_TRUE(surface.commands().empty());
}

TEST(FontManagerTest, RejectsBadInput) {
    FontManager fontManager;
    // Not initialized yet.
    EXPECT_EQ(fontManager.loadFontFromFile("/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf"), 0u);

    ASSERT_TRUE(fontManager.initialize());
    const std::uint8_t junk[16] = {0};
    EXPECT_EQ(fontManager.loadFontFromMemory(junk, sizeof(junk), "Junk"), 0u);
    EXPECT_EQ(fontManager.loadFontFromFile("/nonexistent/font.ttf"), 0u);
    EXPECT_FALSE(fontManager.hasAnyFont());
    EXPECT_EQ(fontManager.findFont("anything", false, false), 0u);
    EXPECT_FALSE(fontManager.unloadFont(7));
}

TEST_F(FontSurfaceTest, UnloadMovesTheDefault) {
    if (!fontLoaded) {
        GTEST_SKIP() << "No system font available for testing";
    }

    EXPECT_EQ(fontManager.getDefaultFontId(), testFontId);
    ASSERT_TRUE(fontManager.unloadFont(testFontId));
    EXPECT_FALSE(fontManager.hasAnyFont());
    EXPECT_EQ(fontManager.getDefaultFontId(), 0u);

    FontSurface surface(fontManager);
    EXPECT_FALSE(surface.fontsAvailable());
}
