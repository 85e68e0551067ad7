#pragma once

#include "engine/Vec2.hpp"

#include <algorithm>

namespace skyraid {

/// Axis-aligned rectangle, (x, y) is the top-left corner
struct Rect {
    float x = 0.0f;
    float y = 0.0f;
    float width = 0.0f;
    float height = 0.0f;

    constexpr Rect() = default;
    constexpr Rect(float x, float y, float w, float h)
        : x(x), y(y), width(w), height(h) {}

    float right() const { return x + width; }
    float bottom() const { return y + height; }
    Vec2 center() const { return {x + width * 0.5f, y + height * 0.5f}; }

    /// Strict overlap test: rectangles that only share an edge do not intersect
    bool intersects(const Rect& other) const {
        return x < other.x + other.width && x + width > other.x &&
               y < other.y + other.height && y + height > other.y;
    }

    /// Overlapping region of two rectangles. Width and height are clamped to
    /// zero when the rectangles are disjoint.
    static Rect intersection(const Rect& a, const Rect& b) {
        float left = std::max(a.x, b.x);
        float top = std::max(a.y, b.y);
        float right = std::min(a.right(), b.right());
        float bottom = std::min(a.bottom(), b.bottom());
        return Rect(left, top, std::max(0.0f, right - left), std::max(0.0f, bottom - top));
    }

    bool operator==(const Rect& other) const {
        return x == other.x && y == other.y && width == other.width && height == other.height;
    }
    bool operator!=(const Rect& other) const { return !(*this == other); }
};

} // namespace skyraid
