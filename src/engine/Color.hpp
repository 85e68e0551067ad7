#pragma once

#include <cstdint>

namespace skyraid {

/// RGBA colour for debug overlays
struct Color {
    uint8_t r = 255;
    uint8_t g = 255;
    uint8_t b = 255;
    uint8_t a = 255;

    constexpr Color() = default;
    constexpr Color(uint8_t r, uint8_t g, uint8_t b, uint8_t a = 255)
        : r(r), g(g), b(b), a(a) {}

    static constexpr Color White() { return {255, 255, 255, 255}; }
    static constexpr Color Red()   { return {255, 0, 0, 255}; }
    static constexpr Color Green() { return {0, 255, 0, 255}; }

    bool operator==(const Color& other) const {
        return r == other.r && g == other.g && b == other.b && a == other.a;
    }
    bool operator!=(const Color& other) const { return !(*this == other); }
};

} // namespace skyraid
