#pragma once

#include <gtest/gtest.h>
#include "balloon/core/types.h"
#include "balloon/render/draw_list.h"
#include "balloon/text/utf8.h"

#include <cstddef>
#include <string>
#include <vector>

namespace balloon_test {

// Every code point advances half the font size.
inline constexpr float kAdvancePerEm = 0.5f;

// Recording surface with deterministic measurement, so wrap points can be
// worked out by hand.
class FixedAdvanceSurface : public balloon::DrawListSurface {
public:
    float measureText(std::string_view text, const balloon::text::FontSpec& font) override {
        ++measureCalls;
        return static_cast<float>(balloon::text::utf8Length(text)) * font.size * kAdvancePerEm;
    }

    bool ready() const override { return readyFlag; }
    bool fontsAvailable() const override { return fontsFlag; }

    bool readyFlag = true;
    bool fontsFlag = true;
    std::size_t measureCalls = 0;

    std::vector<const balloon::DrawCommand*> commandsOf(balloon::DrawCommandKind kind) const {
        std::vector<const balloon::DrawCommand*> out;
        for (const balloon::DrawCommand& cmd : commands()) {
            if (cmd.kind == kind) out.push_back(&cmd);
        }
        return out;
    }
};

inline balloon::Part bottomTail(std::uint32_t id, float baseX, float baseY, float tipX, float tipY) {
    balloon::SpeechTailPart tail;
    tail.baseCX = baseX;
    tail.baseCY = baseY;
    tail.baseWidth = 20.0f;
    tail.tipX = tipX;
    tail.tipY = tipY;
    tail.initialLength = tipY - baseY;
    tail.initialBaseWidth = 20.0f;
    return balloon::Part::makeTail(id, tail);
}

inline balloon::Bubble makeBubble(
    balloon::BubbleType type,
    float width = 150.0f,
    float height = 90.0f,
    std::uint32_t id = 1
) {
    balloon::Bubble b;
    b.id = id;
    b.type = type;
    b.width = width;
    b.height = height;
    b.text = "Hello";
    return b;
}

// 150 x 90 SpeechDown at the origin with its tail centered on the bottom edge.
inline balloon::Bubble speechDownWithTail(std::uint32_t id = 1, std::uint32_t tailId = 2) {
    balloon::Bubble b = makeBubble(balloon::BubbleType::SpeechDown, 150.0f, 90.0f, id);
    b.parts.push_back(bottomTail(tailId, 75.0f, 90.0f, 75.0f, 120.0f));
    return b;
}

inline balloon::Bubble thoughtWithDots(std::uint32_t id, std::uint32_t dotCount) {
    balloon::Bubble b = makeBubble(balloon::BubbleType::Thought, 150.0f, 90.0f, id);
    for (std::uint32_t i = 0; i < dotCount; ++i) {
        balloon::ThoughtDotPart dot;
        dot.offsetX = 60.0f + 10.0f * static_cast<float>(i);
        dot.offsetY = 100.0f + 12.0f * static_cast<float>(i);
        dot.size = 12.0f - 2.0f * static_cast<float>(i);
        b.parts.push_back(balloon::Part::makeDot(id + 1 + i, dot));
    }
    return b;
}

inline const std::vector<std::string>& systemFontPaths() {
    static const std::vector<std::string> paths = {
        "/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf",
        "/usr/share/fonts/TTF/DejaVuSans.ttf",
        "/usr/share/fonts/truetype/liberation/LiberationSans-Regular.ttf",
        "/usr/share/fonts/liberation-sans/LiberationSans-Regular.ttf",
        "/usr/share/fonts/truetype/freefont/FreeSans.ttf",
        "/System/Library/Fonts/Helvetica.ttc",
    };
    return paths;
}

} // namespace balloon_test
