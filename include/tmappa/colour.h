#pragma once

#include <tmappa/result.hpp>
#include <cstdint>
#include <string>

namespace tmappa {

//=============================================================================
// Colour - opaque RGB triple, each channel in [0,255]
//=============================================================================
struct Colour {
    uint8_t r = 0, g = 0, b = 0;

    Colour() = default;
    Colour(uint8_t red, uint8_t green, uint8_t blue) : r(red), g(green), b(blue) {}

    /// Convert hue/saturation/brightness (each nominally 0..1) to RGB.
    /// Hue wraps, so 1.0 and 0.0 are the same colour.
    static Colour fromHsb(float hue, float saturation, float brightness);

    // 0x00RRGGBB
    uint32_t toRgb24() const {
        return (uint32_t(r) << 16) | (uint32_t(g) << 8) | uint32_t(b);
    }

    /// "#rrggbb", always 7 characters, lowercase.
    std::string toHex() const;

    bool operator==(const Colour& other) const {
        return r == other.r && g == other.g && b == other.b;
    }
    bool operator!=(const Colour& other) const { return !(*this == other); }
};

/// Parse "#rrggbb" or "#rgb" (the '#' is optional).
Result<Colour> parseHexColour(const std::string& text);

} // namespace tmappa
