#include "puttcraft/core/Shape.h"
#include "puttcraft/core/GeometryUtils.h"

#include <algorithm>
#include <type_traits>

namespace puttcraft {

Polygon Polygon::fromFlat(const std::vector<float>& coords) {
    Polygon poly;
    poly.vertices.reserve(coords.size() / 2);
    for (size_t i = 0; i + 1 < coords.size(); i += 2) {
        poly.vertices.emplace_back(coords[i], coords[i + 1]);
    }
    return poly;
}

bool shapeContains(const Shape& shape, const Point& p) {
    return std::visit([&p](const auto& s) -> bool {
        using T = std::decay_t<decltype(s)>;
        if constexpr (std::is_same_v<T, Rect>) {
            return geometry::pointInRect(p, s);
        } else if constexpr (std::is_same_v<T, Polygon>) {
            return geometry::pointInPolygon(p, s.vertices);
        } else {
            return geometry::pointInCircle(p, s.center, s.radius);
        }
    }, shape);
}

bool anyShapeContains(const std::vector<Shape>& shapes, const Point& p) {
    return std::any_of(shapes.begin(), shapes.end(),
                       [&p](const Shape& s) { return shapeContains(s, p); });
}

}  // namespace puttcraft
