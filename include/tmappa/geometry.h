#pragma once

#include <algorithm>
#include <cmath>
#include <cstdint>

namespace tmappa {

struct Point {
    float x = 0, y = 0;

    bool operator==(const Point& other) const { return x == other.x && y == other.y; }
    bool operator!=(const Point& other) const { return !(*this == other); }
};

//=============================================================================
// IntRect - integer rectangle on the render surface
//=============================================================================
struct IntRect {
    int32_t x = 0, y = 0, w = 0, h = 0;

    int32_t right() const { return x + w; }
    int32_t bottom() const { return y + h; }
    bool isEmpty() const { return w <= 0 || h <= 0; }

    // Smallest rectangle containing both
    IntRect united(const IntRect& other) const {
        int32_t x0 = std::min(x, other.x);
        int32_t y0 = std::min(y, other.y);
        int32_t x1 = std::max(right(), other.right());
        int32_t y1 = std::max(bottom(), other.bottom());
        return {x0, y0, x1 - x0, y1 - y0};
    }

    bool operator==(const IntRect& other) const {
        return x == other.x && y == other.y && w == other.w && h == other.h;
    }
    bool operator!=(const IntRect& other) const { return !(*this == other); }
};

//=============================================================================
// Rect - node footprint in render-surface coordinates
//=============================================================================
struct Rect {
    float x = 0, y = 0, w = 0, h = 0;

    float right() const { return x + w; }
    float bottom() const { return y + h; }
    Point centre() const { return {x + w / 2.0f, y + h / 2.0f}; }

    /// Smallest integer rectangle that fully encloses this one.
    /// A rectangle with a negative dimension has empty bounds at the origin.
    IntRect outerBounds() const {
        if (w < 0 || h < 0) return {};
        double x0 = std::floor(static_cast<double>(x));
        double y0 = std::floor(static_cast<double>(y));
        double x1 = std::ceil(static_cast<double>(x) + w);
        double y1 = std::ceil(static_cast<double>(y) + h);
        return {static_cast<int32_t>(x0), static_cast<int32_t>(y0),
                static_cast<int32_t>(x1 - x0), static_cast<int32_t>(y1 - y0)};
    }

    bool operator==(const Rect& other) const {
        return x == other.x && y == other.y && w == other.w && h == other.h;
    }
    bool operator!=(const Rect& other) const { return !(*this == other); }
};

} // namespace tmappa
