#ifndef BALLOON_CORE_COLOR_H
#define BALLOON_CORE_COLOR_H

#include <cstdint>
#include <string_view>

namespace balloon {

static constexpr std::uint32_t kColorBlack = 0x000000FFu;
static constexpr std::uint32_t kColorWhite = 0xFFFFFFFFu;

// Parses a CSS color (#rgb, #rrggbb, #rrggbbaa, rgb(), rgba() or a basic
// named color) into packed 0xRRGGBBAA. Returns false and leaves `out`
// untouched when the value is not understood.
bool parseColor(std::string_view css, std::uint32_t& out);

std::uint32_t parseColorOr(std::string_view css, std::uint32_t fallback);

} // namespace balloon

#endif // BALLOON_CORE_COLOR_H
