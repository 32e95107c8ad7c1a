#ifndef BALLOON_CORE_UTIL_H
#define BALLOON_CORE_UTIL_H

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstddef>
#include <cstring>

namespace balloon {

// Little-endian byte access for the snapshot codec. Callers bounds-check first.
static inline std::uint32_t readU32(const std::uint8_t* src, std::size_t offset) noexcept {
    std::uint32_t v;
    std::memcpy(&v, src + offset, sizeof(v));
    return v;
}

static inline std::int32_t readI32(const std::uint8_t* src, std::size_t offset) noexcept {
    std::int32_t v;
    std::memcpy(&v, src + offset, sizeof(v));
    return v;
}

static inline float readF32(const std::uint8_t* src, std::size_t offset) noexcept {
    float v;
    std::memcpy(&v, src + offset, sizeof(v));
    return v;
}

static inline void writeU32LE(std::uint8_t* dst, std::size_t offset, std::uint32_t v) noexcept {
    std::memcpy(dst + offset, &v, sizeof(v));
}

static inline void writeI32LE(std::uint8_t* dst, std::size_t offset, std::int32_t v) noexcept {
    std::memcpy(dst + offset, &v, sizeof(v));
}

static inline void writeF32LE(std::uint8_t* dst, std::size_t offset, float v) noexcept {
    std::memcpy(dst + offset, &v, sizeof(v));
}

static inline float clampf(float v, float lo, float hi) noexcept {
    return std::max(lo, std::min(hi, v));
}

// Non-finite input collapses to the fallback.
static inline float finiteOr(float v, float fallback) noexcept {
    return std::isfinite(v) ? v : fallback;
}

} // namespace balloon

#endif // BALLOON_CORE_UTIL_H
