#pragma once

#include "Types.h"

#include <cmath>
#include <vector>

namespace puttcraft {

/// Point containment tests shared by terrain classification
namespace geometry {

/// Edge-inclusive point-in-rectangle test
bool pointInRect(const Point& p, const Rect& rect);

/// Ray-casting point-in-polygon test (even-odd rule)
/// The polygon is treated as closed; fewer than 3 vertices never contains.
bool pointInPolygon(const Point& p, const std::vector<Point>& vertices);

/// True when p lies within radius + margin of center (boundary inclusive)
bool pointInCircle(const Point& p, const Point& center, float radius, float margin = 0.0f);

/// Distance from p to the nearest fairway boundary (negative when outside)
float distanceToRectEdge(const Point& p, const Rect& rect);

}  // namespace geometry

namespace constants {

/// Floating-point comparison tolerance
constexpr float EPSILON = 1e-6f;

constexpr float SQRT2 = 1.41421356237f;
constexpr float SQRT1_2 = 0.70710678118f;

/// Cell size used when the caller supplies an invalid one
constexpr float DEFAULT_CELL_SIZE = 20.0f;

/// Resolve a caller-supplied cell size (0, negative, or NaN = default)
inline float effectiveCellSize(float cellSize) noexcept {
    return (cellSize > 0.0f && std::isfinite(cellSize)) ? cellSize : DEFAULT_CELL_SIZE;
}

}  // namespace constants

}  // namespace puttcraft
