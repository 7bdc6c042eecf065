#include <tmappa/colour.h>
#include <cctype>
#include <cmath>
#include <sstream>

namespace tmappa {

namespace {

uint8_t toChannel(float c) {
    return static_cast<uint8_t>(static_cast<int>(c * 255.0f + 0.5f));
}

} // namespace

Colour Colour::fromHsb(float hue, float saturation, float brightness) {
    if (saturation == 0.0f) {
        uint8_t v = toChannel(brightness);
        return {v, v, v};
    }

    float h = (hue - std::floor(hue)) * 6.0f;
    float f = h - std::floor(h);
    float p = brightness * (1.0f - saturation);
    float q = brightness * (1.0f - saturation * f);
    float t = brightness * (1.0f - (saturation * (1.0f - f)));

    switch (static_cast<int>(h)) {
    case 0: return {toChannel(brightness), toChannel(t), toChannel(p)};
    case 1: return {toChannel(q), toChannel(brightness), toChannel(p)};
    case 2: return {toChannel(p), toChannel(brightness), toChannel(t)};
    case 3: return {toChannel(p), toChannel(q), toChannel(brightness)};
    case 4: return {toChannel(t), toChannel(p), toChannel(brightness)};
    case 5: return {toChannel(brightness), toChannel(p), toChannel(q)};
    }
    return {};
}

std::string Colour::toHex() const {
    // Marker bit above the 24 colour bits forces six digits; drop it after.
    std::ostringstream ss;
    ss << std::hex << ((toRgb24() & 0xFFFFFFu) | 0x1000000u);
    return "#" + ss.str().substr(1);
}

Result<Colour> parseHexColour(const std::string& text) {
    std::string hex = text;
    if (!hex.empty() && hex[0] == '#') hex = hex.substr(1);
    if (hex.size() == 3) {
        hex = std::string{hex[0], hex[0], hex[1], hex[1], hex[2], hex[2]};
    }
    if (hex.size() != 6) {
        return Err<Colour>("invalid colour '" + text + "': expected #rrggbb or #rgb");
    }
    for (char c : hex) {
        if (!std::isxdigit(static_cast<unsigned char>(c))) {
            return Err<Colour>("invalid colour '" + text + "': bad hex digit");
        }
    }
    uint32_t rgb = std::stoul(hex, nullptr, 16);
    return Ok(Colour(static_cast<uint8_t>((rgb >> 16) & 0xFF),
                     static_cast<uint8_t>((rgb >> 8) & 0xFF),
                     static_cast<uint8_t>(rgb & 0xFF)));
}

} // namespace tmappa
