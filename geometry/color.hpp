#ifndef PAGECURL_GEOMETRY_COLOR_HPP
#define PAGECURL_GEOMETRY_COLOR_HPP

#include <array>
#include <cstdint>

namespace pagecurl {

// Packed 0xAARRGGBB color, as supplied by page providers.
using Argb = uint32_t;

// RGBA in [0, 1], used for shadow gradients.
using ShadowColor = std::array<float, 4>;

namespace color {

constexpr Argb WHITE = 0xFFFFFFFFu;
constexpr Argb BLACK = 0xFF000000u;
constexpr Argb TRANSPARENT = 0x00000000u;

constexpr uint32_t alpha(Argb c) { return (c >> 24) & 0xFFu; }
constexpr uint32_t red(Argb c) { return (c >> 16) & 0xFFu; }
constexpr uint32_t green(Argb c) { return (c >> 8) & 0xFFu; }
constexpr uint32_t blue(Argb c) { return c & 0xFFu; }

constexpr Argb argb(uint32_t a, uint32_t r, uint32_t g, uint32_t b) {
    return ((a & 0xFFu) << 24) | ((r & 0xFFu) << 16) | ((g & 0xFFu) << 8) | (b & 0xFFu);
}

constexpr Argb rgb(uint32_t r, uint32_t g, uint32_t b) {
    return argb(0xFFu, r, g, b);
}

// True when every channel lies in [0, 1]
constexpr bool in_unit_range(const ShadowColor& c) {
    for (float v : c) {
        if (!(v >= 0.0f && v <= 1.0f)) {
            return false;
        }
    }
    return true;
}

}  // namespace color
}  // namespace pagecurl

#endif // PAGECURL_GEOMETRY_COLOR_HPP
