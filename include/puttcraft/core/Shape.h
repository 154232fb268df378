#pragma once

#include "Types.h"

#include <variant>
#include <vector>

namespace puttcraft {

/// Closed polygon; the last vertex connects back to the first
struct Polygon {
    std::vector<Point> vertices;

    Polygon() = default;
    explicit Polygon(std::vector<Point> pts) : vertices(std::move(pts)) {}

    /// Build from a flat [x0, y0, x1, y1, ...] coordinate list
    /// A trailing odd coordinate is ignored.
    static Polygon fromFlat(const std::vector<float>& coords);

    bool isDegenerate() const { return vertices.size() < 3; }
};

struct Circle {
    Point center;
    float radius = 0.0f;

    constexpr Circle() = default;
    constexpr Circle(Point c, float r) : center(c), radius(r) {}
};

/// Authored terrain shape
using Shape = std::variant<Rect, Polygon, Circle>;

/// Single containment dispatch used by every terrain classification step
bool shapeContains(const Shape& shape, const Point& p);

/// True when any shape of the collection contains the point
bool anyShapeContains(const std::vector<Shape>& shapes, const Point& p);

}  // namespace puttcraft
