#pragma once

#include "Shape.h"
#include "Types.h"

#include <optional>
#include <string_view>
#include <vector>

namespace puttcraft {

/// Downhill direction of a slope field
enum class CompassDirection {
    None,
    N,
    NE,
    E,
    SE,
    S,
    SW,
    W,
    NW
};

/// Parse "N", "se", ... (case-insensitive); unknown text yields None
CompassDirection parseCompassDirection(std::string_view text);

/// Unit downhill vector in screen space (+y points down, so N is (0,-1))
/// Diagonals are (+-1/sqrt2, +-1/sqrt2); None is the zero vector.
Point compassVector(CompassDirection dir);

/// Rectangular slope ("hill") field
struct SlopeField {
    static constexpr float MIN_STRENGTH = 0.2f;
    static constexpr float MAX_STRENGTH = 2.0f;

    Rect area;
    CompassDirection direction = CompassDirection::None;
    float strength = 1.0f;

    /// Strength clamped into [MIN_STRENGTH, MAX_STRENGTH]
    float clampedStrength() const;
};

/// Circular post obstacle
struct Post {
    static constexpr float DEFAULT_RADIUS = 8.0f;

    Point center;
    float radius = DEFAULT_RADIUS;

    /// Radius used for blocking (non-positive radius falls back to the default)
    float effectiveRadius() const { return radius > 0.0f ? radius : DEFAULT_RADIUS; }
};

struct Cup {
    Point position;
    std::optional<float> radius;
};

/// Resolved hole geometry handed over by the editor
///
/// All collections are optional; an empty vector means "none authored".
struct Level {
    Point tee;
    Cup cup;

    std::vector<Shape> walls;       ///< Solid obstacles
    std::vector<Shape> water;       ///< Hazards, impassable for routing
    std::vector<Shape> sand;        ///< Passable at higher cost
    std::vector<SlopeField> slopes;
    std::vector<Rect> bridges;      ///< Restore passability over walls/water
    std::vector<Post> posts;

    /// Number of authored wall and water shapes
    size_t obstacleCount() const { return walls.size() + water.size(); }
};

}  // namespace puttcraft
