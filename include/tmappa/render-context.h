#pragma once

#include <tmappa/geometry.h>

namespace tmappa {

//=============================================================================
// RenderContext - capability consumed while building node attributes
//
// Supplies the colour mutation magnitude and the random source used to
// perturb inherited colours, and collects the bounds of every node so the
// owner can track the overall canvas extent.
//=============================================================================
class RenderContext {
public:
    virtual ~RenderContext() = default;

    /// Colour mutation magnitude, nominally in [0,1].
    virtual float mutationMagnitude() const = 0;

    /// Uniform random number in [0,1).
    virtual float random() = 0;

    /// Called once for every node constructed against this context.
    virtual void registerBounds(const IntRect& bounds) = 0;
};

} // namespace tmappa
