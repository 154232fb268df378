#pragma once

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <functional>

namespace puttcraft {

/// World-space position in editor pixels
struct Point {
    float x = 0.0f;
    float y = 0.0f;

    constexpr Point() = default;
    constexpr Point(float x_, float y_) : x(x_), y(y_) {}

    constexpr Point operator+(const Point& o) const { return {x + o.x, y + o.y}; }
    constexpr Point operator-(const Point& o) const { return {x - o.x, y - o.y}; }
    constexpr Point operator*(float s) const { return {x * s, y * s}; }
    constexpr Point operator/(float s) const { return {x / s, y / s}; }

    constexpr float dot(const Point& o) const { return x * o.x + y * o.y; }
    float length() const { return std::sqrt(x * x + y * y); }
    float distanceTo(const Point& o) const { return (*this - o).length(); }

    Point normalized() const {
        float len = length();
        return len > 0.0f ? *this / len : Point{0.0f, 0.0f};
    }

    constexpr bool operator==(const Point& o) const { return x == o.x && y == o.y; }
    constexpr bool operator!=(const Point& o) const { return !(*this == o); }
};

/// Grid cell coordinate (x = column, y = row)
struct GridPoint {
    int x = 0;
    int y = 0;

    constexpr GridPoint() = default;
    constexpr GridPoint(int x_, int y_) : x(x_), y(y_) {}

    constexpr GridPoint operator+(const GridPoint& o) const { return {x + o.x, y + o.y}; }
    constexpr GridPoint operator-(const GridPoint& o) const { return {x - o.x, y - o.y}; }

    /// True when the two cells touch orthogonally or diagonally
    constexpr bool isAdjacentTo(const GridPoint& o) const {
        int dx = x > o.x ? x - o.x : o.x - x;
        int dy = y > o.y ? y - o.y : o.y - y;
        return (dx | dy) != 0 && dx <= 1 && dy <= 1;
    }

    constexpr bool operator==(const GridPoint& o) const { return x == o.x && y == o.y; }
    constexpr bool operator!=(const GridPoint& o) const { return !(*this == o); }
    constexpr bool operator<(const GridPoint& o) const {
        return y < o.y || (y == o.y && x < o.x);
    }
};

/// Hash for GridPoint in unordered containers (membership tests only)
struct GridPointHash {
    std::size_t operator()(const GridPoint& p) const {
        return std::hash<int>()(p.x) ^ (std::hash<int>()(p.y) << 16);
    }
};

struct Rect {
    float x = 0.0f;
    float y = 0.0f;
    float width = 0.0f;
    float height = 0.0f;

    constexpr Rect() = default;
    constexpr Rect(float x_, float y_, float w, float h)
        : x(x_), y(y_), width(w), height(h) {}

    constexpr Point position() const { return {x, y}; }
    constexpr Point center() const { return {x + width / 2, y + height / 2}; }

    constexpr float left() const { return x; }
    constexpr float top() const { return y; }
    constexpr float right() const { return x + width; }
    constexpr float bottom() const { return y + height; }

    /// Edge-inclusive containment
    constexpr bool contains(const Point& p) const {
        return p.x >= x && p.x <= right() && p.y >= y && p.y <= bottom();
    }

    Rect expanded(float padding) const {
        return {x - padding, y - padding, width + 2 * padding, height + 2 * padding};
    }

    constexpr bool operator==(const Rect& o) const {
        return x == o.x && y == o.y && width == o.width && height == o.height;
    }
    constexpr bool operator!=(const Rect& o) const { return !(*this == o); }
};

}  // namespace puttcraft
