#include "balloon/core/color.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <string>

namespace balloon {

namespace {

int hexDigit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::uint32_t pack(std::uint32_t r, std::uint32_t g, std::uint32_t b, std::uint32_t a) {
    return (r << 24) | (g << 16) | (b << 8) | a;
}

bool parseHex(std::string_view hex, std::uint32_t& out) {
    for (char c : hex) {
        if (hexDigit(c) < 0) return false;
    }
    auto byteAt = [&](std::size_t i) {
        return static_cast<std::uint32_t>(hexDigit(hex[i]) * 16 + hexDigit(hex[i + 1]));
    };
    auto nibbleAt = [&](std::size_t i) {
        return static_cast<std::uint32_t>(hexDigit(hex[i]) * 17);
    };
    switch (hex.size()) {
        case 3: out = pack(nibbleAt(0), nibbleAt(1), nibbleAt(2), 0xFF); return true;
        case 4: out = pack(nibbleAt(0), nibbleAt(1), nibbleAt(2), nibbleAt(3)); return true;
        case 6: out = pack(byteAt(0), byteAt(2), byteAt(4), 0xFF); return true;
        case 8: out = pack(byteAt(0), byteAt(2), byteAt(4), byteAt(6)); return true;
        default: return false;
    }
}

bool parseFunctional(std::string_view body, bool withAlpha, std::uint32_t& out) {
    std::string args(body);
    std::replace(args.begin(), args.end(), ',', ' ');
    std::replace(args.begin(), args.end(), '/', ' ');
    const char* cursor = args.c_str();
    float channels[4] = {0.0f, 0.0f, 0.0f, 1.0f};
    int count = 0;
    while (count < 4) {
        char* end = nullptr;
        const float v = std::strtof(cursor, &end);
        if (end == cursor) break;
        channels[count] = (*end == '%') ? v * (count < 3 ? 2.55f : 0.01f) : v;
        cursor = (*end == '%') ? end + 1 : end;
        ++count;
    }
    if (count < 3 || (withAlpha && count < 4)) return false;
    auto channel = [](float v) {
        return static_cast<std::uint32_t>(std::lround(std::max(0.0f, std::min(255.0f, v))));
    };
    const float alpha = std::max(0.0f, std::min(1.0f, channels[3]));
    out = pack(channel(channels[0]), channel(channels[1]), channel(channels[2]),
        static_cast<std::uint32_t>(std::lround(alpha * 255.0f)));
    return true;
}

struct NamedColor { const char* name; std::uint32_t rgba; };

constexpr NamedColor kNamed[] = {
    {"black", 0x000000FFu},
    {"white", 0xFFFFFFFFu},
    {"red", 0xFF0000FFu},
    {"green", 0x008000FFu},
    {"blue", 0x0000FFFFu},
    {"yellow", 0xFFFF00FFu},
    {"orange", 0xFFA500FFu},
    {"purple", 0x800080FFu},
    {"gray", 0x808080FFu},
    {"grey", 0x808080FFu},
    {"transparent", 0x00000000u},
};

} // namespace

bool parseColor(std::string_view css, std::uint32_t& out) {
    while (!css.empty() && std::isspace(static_cast<unsigned char>(css.front()))) css.remove_prefix(1);
    while (!css.empty() && std::isspace(static_cast<unsigned char>(css.back()))) css.remove_suffix(1);
    if (css.empty()) return false;

    if (css.front() == '#') {
        return parseHex(css.substr(1), out);
    }

    std::string lower(css);
    std::transform(lower.begin(), lower.end(), lower.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    const std::size_t open = lower.find('(');
    if (open != std::string::npos && lower.back() == ')') {
        const std::string fn = lower.substr(0, open);
        const std::string_view body = std::string_view(lower).substr(open + 1, lower.size() - open - 2);
        if (fn == "rgb") return parseFunctional(body, false, out);
        if (fn == "rgba") return parseFunctional(body, true, out);
        return false;
    }

    for (const NamedColor& named : kNamed) {
        if (lower == named.name) {
            out = named.rgba;
            return true;
        }
    }
    return false;
}

std::uint32_t parseColorOr(std::string_view css, std::uint32_t fallback) {
    std::uint32_t v = fallback;
    return parseColor(css, v) ? v : fallback;
}

} // namespace balloon
