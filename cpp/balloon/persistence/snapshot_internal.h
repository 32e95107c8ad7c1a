#pragma once

#include "balloon/core/util.h"

#include <cstddef>
#include <cstdint>
#include <limits>
#include <string>
#include <vector>

namespace balloon::snapshot::detail {

constexpr std::uint32_t fourCC(char a, char b, char c, char d) {
    return static_cast<std::uint32_t>(a)
        | (static_cast<std::uint32_t>(b) << 8)
        | (static_cast<std::uint32_t>(c) << 16)
        | (static_cast<std::uint32_t>(d) << 24);
}

constexpr std::uint32_t TAG_IMAG = fourCC('I', 'M', 'A', 'G');
constexpr std::uint32_t TAG_BUBL = fourCC('B', 'U', 'B', 'L');
constexpr std::uint32_t TAG_TOOL = fourCC('T', 'O', 'O', 'L');
constexpr std::uint32_t TAG_NIDX = fourCC('N', 'I', 'D', 'X');
constexpr std::uint32_t TAG_CANV = fourCC('C', 'A', 'N', 'V');

// id, type|font, x, y, w, h, fontSize, zIndex, shapeVariant, partCount
constexpr std::size_t bubbleRecordBytes = 10 * 4;
// id, type, then the part's floats
constexpr std::size_t tailRecordBytes = 2 * 4 + 7 * 4;
constexpr std::size_t dotRecordBytes = 2 * 4 + 3 * 4;
constexpr std::size_t nidxSectionBytes = 2 * 4;
constexpr std::size_t canvSectionBytes = 2 * 4;

inline std::uint32_t crc32(const std::uint8_t* bytes, std::size_t len) {
    static std::uint32_t table[256];
    static bool tableReady = false;
    if (!tableReady) {
        for (std::uint32_t i = 0; i < 256; ++i) {
            std::uint32_t c = i;
            for (int k = 0; k < 8; ++k) {
                c = (c & 1) ? (0xEDB88320u ^ (c >> 1)) : (c >> 1);
            }
            table[i] = c;
        }
        tableReady = true;
    }

    std::uint32_t crc = 0xFFFFFFFFu;
    for (std::size_t i = 0; i < len; ++i) {
        crc = table[(crc ^ bytes[i]) & 0xFF] ^ (crc >> 8);
    }
    return (crc ^ 0xFFFFFFFFu);
}

inline bool tryAdd(std::size_t a, std::size_t b, std::size_t& out) {
    if (a > (std::numeric_limits<std::size_t>::max() - b)) return false;
    out = a + b;
    return true;
}

inline bool tryMul(std::size_t a, std::size_t b, std::size_t& out) {
    if (a == 0 || b == 0) {
        out = 0;
        return true;
    }
    if (a > (std::numeric_limits<std::size_t>::max() / b)) return false;
    out = a * b;
    return true;
}

inline bool requireBytes(std::size_t offset, std::size_t size, std::size_t total) {
    if (offset > total) return false;
    return size <= (total - offset);
}

// Appends little-endian fields to a section payload.
struct SectionWriter {
    std::vector<std::uint8_t>& out;

    void u32(std::uint32_t v) {
        const std::size_t o = out.size();
        out.resize(o + 4);
        writeU32LE(out.data(), o, v);
    }
    void i32(std::int32_t v) {
        const std::size_t o = out.size();
        out.resize(o + 4);
        writeI32LE(out.data(), o, v);
    }
    void f32(float v) {
        const std::size_t o = out.size();
        out.resize(o + 4);
        writeF32LE(out.data(), o, v);
    }
    // u32 byte length, then the bytes.
    void str(const std::string& s) {
        u32(static_cast<std::uint32_t>(s.size()));
        out.insert(out.end(), s.begin(), s.end());
    }
};

// Bounds-checked cursor over a section payload. Every read fails once the
// payload is exhausted and leaves `ok` false.
struct SectionReader {
    const std::uint8_t* data;
    std::size_t size;
    std::size_t o{0};
    bool ok{true};

    bool has(std::size_t n) {
        if (!ok || !requireBytes(o, n, size)) ok = false;
        return ok;
    }
    std::uint32_t u32() {
        if (!has(4)) return 0;
        const std::uint32_t v = readU32(data, o);
        o += 4;
        return v;
    }
    std::int32_t i32() {
        if (!has(4)) return 0;
        const std::int32_t v = readI32(data, o);
        o += 4;
        return v;
    }
    float f32() {
        if (!has(4)) return 0.0f;
        const float v = readF32(data, o);
        o += 4;
        return v;
    }
    std::string str() {
        const std::uint32_t len = u32();
        if (!has(len)) return std::string();
        std::string s(reinterpret_cast<const char*>(data + o), len);
        o += len;
        return s;
    }
};

} // namespace balloon::snapshot::detail
