#pragma once

#include <tmappa/colour.h>
#include <tmappa/geometry.h>
#include <tmappa/render-context.h>
#include <cstdint>
#include <optional>
#include <string>

namespace tmappa {

// Saturation and brightness of colours derived from a hue
constexpr float ROOT_SATURATION = 0.4f;
constexpr float ROOT_BRIGHTNESS = 0.8f;

// Mutation magnitude 1.0 maps to this per-channel perturbation range
constexpr float COLOUR_VARIATION_SCALE = 127.0f;

/// Perturb each channel of `parent` by (random() - 0.5) * colourVar,
/// truncated toward zero and clamped to [0,255]. Draws red, green, blue.
Colour perturbColour(const Colour& parent, float colourVar, RenderContext& ctx);

/// Resolve a node colour. Priority: explicit colour, then perturbed parent
/// colour, then the hue at fixed saturation/brightness. Absent when none of
/// the three is available.
std::optional<Colour> resolveColour(const std::optional<Colour>& explicitColour,
                                    const std::optional<Colour>& parentColour,
                                    std::optional<float> hue,
                                    float colourVar, RenderContext& ctx);

//=============================================================================
// NodeAttributes - immutable visual representation of one treemap node
//=============================================================================
class NodeAttributes {
public:
    /// Resolves the colour and registers the node's outer bounds with `ctx`.
    NodeAttributes(RenderContext& ctx, std::string label, const Rect& footprint,
                   const Point& geoCentre, bool isLeaf, bool isDummy,
                   std::optional<float> hue,
                   std::optional<Colour> explicitColour,
                   std::optional<Colour> parentColour,
                   uint32_t level);

    // Footprint in pixel coordinates
    const Rect& getBounds() const { return _footprint; }

    // Transformed geographic centre of the node
    const Point& getGeoBounds() const { return _geoCentre; }

    const std::string& getLabel() const { return _label; }

    std::optional<Colour> getColour() const { return _colour; }

    /// "#rrggbb", or nullopt for a node without colour.
    std::optional<std::string> getHexColour() const;

    // 0 is the root, 1 a child of the root, ...
    uint32_t getLevel() const { return _level; }

    bool isLeaf() const { return _isLeaf; }

    // Blank spacer node
    bool isDummy() const { return _isDummy; }

private:
    Rect _footprint;
    Point _geoCentre;
    std::string _label;
    std::optional<Colour> _colour;
    bool _isLeaf;
    bool _isDummy;
    uint32_t _level;
};

} // namespace tmappa
