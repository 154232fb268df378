#include "puttcraft/core/GeometryUtils.h"

#include <algorithm>
#include <cmath>

namespace puttcraft::geometry {

bool pointInRect(const Point& p, const Rect& rect) {
    return rect.contains(p);
}

bool pointInPolygon(const Point& p, const std::vector<Point>& vertices) {
    if (vertices.size() < 3) {
        return false;
    }

    bool inside = false;
    const size_t n = vertices.size();
    for (size_t i = 0, j = n - 1; i < n; j = i++) {
        const Point& a = vertices[i];
        const Point& b = vertices[j];
        if ((a.y > p.y) != (b.y > p.y)) {
            float dy = b.y - a.y;
            if (dy == 0.0f) {
                dy = constants::EPSILON;
            }
            float crossX = (b.x - a.x) * (p.y - a.y) / dy + a.x;
            if (p.x < crossX) {
                inside = !inside;
            }
        }
    }
    return inside;
}

bool pointInCircle(const Point& p, const Point& center, float radius, float margin) {
    return p.distanceTo(center) <= radius + margin;
}

float distanceToRectEdge(const Point& p, const Rect& rect) {
    return std::min({p.x - rect.left(), rect.right() - p.x,
                     p.y - rect.top(), rect.bottom() - p.y});
}

}  // namespace puttcraft::geometry
