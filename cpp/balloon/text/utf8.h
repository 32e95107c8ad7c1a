#ifndef BALLOON_TEXT_UTF8_H
#define BALLOON_TEXT_UTF8_H

#include <cstddef>
#include <string_view>

namespace balloon::text {

// Byte length of the UTF-8 sequence starting at text[pos]. Invalid lead
// bytes and truncated sequences count as one byte.
inline std::size_t utf8SequenceLength(std::string_view text, std::size_t pos) {
    const auto lead = static_cast<unsigned char>(text[pos]);
    std::size_t len = 1;
    if ((lead & 0xE0) == 0xC0) len = 2;
    else if ((lead & 0xF0) == 0xE0) len = 3;
    else if ((lead & 0xF8) == 0xF0) len = 4;
    if (pos + len > text.size()) return 1;
    for (std::size_t i = 1; i < len; ++i) {
        if ((static_cast<unsigned char>(text[pos + i]) & 0xC0) != 0x80) return 1;
    }
    return len;
}

inline std::size_t utf8Length(std::string_view text) {
    std::size_t count = 0;
    for (std::size_t pos = 0; pos < text.size(); pos += utf8SequenceLength(text, pos)) {
        ++count;
    }
    return count;
}

} // namespace balloon::text

#endif // BALLOON_TEXT_UTF8_H
