#ifndef BALLOON_CORE_BUBBLE_H
#define BALLOON_CORE_BUBBLE_H

#include "balloon/core/types.h"

#include <string>
#include <string_view>

namespace balloon {

// Which rectangle edges a local point lies on (within kEdgeEpsilon).
struct EdgeAnchor {
    bool left{false};
    bool right{false};
    bool top{false};
    bool bottom{false};

    bool onHorizontalEdge() const { return top || bottom; }
    bool onVerticalEdge() const { return left || right; }
    bool any() const { return left || right || top || bottom; }
};

EdgeAnchor edgeAnchorOf(float localX, float localY, float width, float height);

bool typeAllowsTail(BubbleType type);
bool typeAllowsDots(BubbleType type);
// Thought and Shout silhouettes depend on shapeVariant.
bool typeHasRandomSilhouette(BubbleType type);

const Part* findTail(const Bubble& bubble);
Part* findTail(Bubble& bubble);

// Clamps size to the minimums and drops parts the type may not carry
// (keeping only the first tail). Returns the number of parts dropped.
std::size_t sanitizeBubble(Bubble& bubble);

// Brings font size, dot count and dot size into their allowed ranges.
void sanitizeToolSettings(ToolSettings& settings);

// Font keys as stored by the toolbar ("font-comic" ...).
const char* fontKey(FontName font);
bool parseFontKey(std::string_view key, FontName& out);
// Family names the keys resolve to by default.
const char* defaultFontFamily(FontName font);

const char* bubbleTypeName(BubbleType type);

} // namespace balloon

#endif // BALLOON_CORE_BUBBLE_H
