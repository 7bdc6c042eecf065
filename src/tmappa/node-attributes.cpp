#include <tmappa/node-attributes.h>
#include <algorithm>
#include <utility>

namespace tmappa {

namespace {

uint8_t perturbChannel(uint8_t channel, float colourVar, RenderContext& ctx) {
    double value = channel + (static_cast<double>(ctx.random()) - 0.5) * colourVar;
    // Clamp, then truncate toward zero: same as truncate-then-clamp
    return static_cast<uint8_t>(std::clamp(value, 0.0, 255.0));
}

} // namespace

Colour perturbColour(const Colour& parent, float colourVar, RenderContext& ctx) {
    // Separate statements: the draws must happen in red, green, blue order
    uint8_t r = perturbChannel(parent.r, colourVar, ctx);
    uint8_t g = perturbChannel(parent.g, colourVar, ctx);
    uint8_t b = perturbChannel(parent.b, colourVar, ctx);
    return {r, g, b};
}

std::optional<Colour> resolveColour(const std::optional<Colour>& explicitColour,
                                    const std::optional<Colour>& parentColour,
                                    std::optional<float> hue,
                                    float colourVar, RenderContext& ctx) {
    if (explicitColour) {
        return explicitColour;
    }
    if (parentColour) {
        return perturbColour(*parentColour, colourVar, ctx);
    }
    if (hue) {
        return Colour::fromHsb(*hue, ROOT_SATURATION, ROOT_BRIGHTNESS);
    }
    return std::nullopt;
}

NodeAttributes::NodeAttributes(RenderContext& ctx, std::string label, const Rect& footprint,
                               const Point& geoCentre, bool isLeaf, bool isDummy,
                               std::optional<float> hue,
                               std::optional<Colour> explicitColour,
                               std::optional<Colour> parentColour,
                               uint32_t level)
    : _footprint(footprint)
    , _geoCentre(geoCentre)
    , _label(std::move(label))
    , _isLeaf(isLeaf)
    , _isDummy(isDummy)
    , _level(level) {
    float colourVar = ctx.mutationMagnitude() * COLOUR_VARIATION_SCALE;
    ctx.registerBounds(footprint.outerBounds());
    _colour = resolveColour(explicitColour, parentColour, hue, colourVar, ctx);
}

std::optional<std::string> NodeAttributes::getHexColour() const {
    if (!_colour) return std::nullopt;
    return _colour->toHex();
}

} // namespace tmappa
