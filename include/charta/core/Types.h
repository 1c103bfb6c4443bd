#pragma once

#include <algorithm>
#include <cstdint>
#include <string>

namespace charta {

using NodeId = uint32_t;
using EdgeId = uint32_t;

constexpr NodeId INVALID_NODE = UINT32_MAX;
constexpr EdgeId INVALID_EDGE = UINT32_MAX;

/// Cell coordinate on the character grid
struct GridPoint {
    int x = 0;
    int y = 0;

    constexpr GridPoint() = default;
    constexpr GridPoint(int x_, int y_) : x(x_), y(y_) {}

    constexpr GridPoint operator+(const GridPoint& o) const { return {x + o.x, y + o.y}; }
    constexpr GridPoint operator-(const GridPoint& o) const { return {x - o.x, y - o.y}; }

    /// Manhattan distance, the length of a rectilinear segment
    constexpr int manhattan(const GridPoint& o) const {
        return (x > o.x ? x - o.x : o.x - x) + (y > o.y ? y - o.y : o.y - y);
    }

    constexpr bool operator==(const GridPoint& o) const { return x == o.x && y == o.y; }
    constexpr bool operator!=(const GridPoint& o) const { return !(*this == o); }
};

/// Extent in cells
struct Size {
    int width = 0;
    int height = 0;

    constexpr Size() = default;
    constexpr Size(int w, int h) : width(w), height(h) {}

    constexpr bool operator==(const Size& o) const {
        return width == o.width && height == o.height;
    }
    constexpr bool operator!=(const Size& o) const { return !(*this == o); }
};

/// Cell rectangle; right() and bottom() are exclusive
struct Rect {
    int x = 0;
    int y = 0;
    int width = 0;
    int height = 0;

    constexpr Rect() = default;
    constexpr Rect(int x_, int y_, int w, int h)
        : x(x_), y(y_), width(w), height(h) {}
    constexpr Rect(GridPoint pos, Size size)
        : x(pos.x), y(pos.y), width(size.width), height(size.height) {}

    constexpr GridPoint position() const { return {x, y}; }
    constexpr Size size() const { return {width, height}; }
    constexpr GridPoint center() const { return {x + width / 2, y + height / 2}; }

    constexpr int left() const { return x; }
    constexpr int top() const { return y; }
    constexpr int right() const { return x + width; }
    constexpr int bottom() const { return y + height; }

    constexpr bool empty() const { return width <= 0 || height <= 0; }

    constexpr bool contains(const GridPoint& p) const {
        return p.x >= x && p.x < right() && p.y >= y && p.y < bottom();
    }

    constexpr bool intersects(const Rect& o) const {
        return x < o.right() && o.x < right() && y < o.bottom() && o.y < bottom();
    }

    Rect united(const Rect& other) const {
        if (empty()) return other;
        if (other.empty()) return *this;

        int minX = std::min(x, other.x);
        int minY = std::min(y, other.y);
        int maxX = std::max(right(), other.right());
        int maxY = std::max(bottom(), other.bottom());

        return {minX, minY, maxX - minX, maxY - minY};
    }

    Rect expanded(int margin) const {
        return {x - margin, y - margin, width + 2 * margin, height + 2 * margin};
    }

    constexpr bool operator==(const Rect& o) const {
        return x == o.x && y == o.y && width == o.width && height == o.height;
    }
    constexpr bool operator!=(const Rect& o) const { return !(*this == o); }
};

}  // namespace charta
