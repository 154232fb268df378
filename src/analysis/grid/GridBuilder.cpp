#include "GridBuilder.h"
#include "puttcraft/common/Logger.h"
#include "puttcraft/core/GeometryUtils.h"

#include <algorithm>
#include <cmath>

namespace puttcraft {

int GridBuilder::cellCount(float extent, float cellSize) {
    if (!std::isfinite(extent) || extent <= 0.0f) {
        return 1;
    }
    return std::max(1, static_cast<int>(std::ceil(extent / cellSize)));
}

float GridBuilder::postClearance(float cellSize) {
    return std::max(6.0f, std::round(cellSize * 0.4f));
}

TerrainGrid GridBuilder::build(const Level& level, const Rect& fairway, float cellSize) {
    const float size = constants::effectiveCellSize(cellSize);
    if (size != cellSize) {
        LOG_WARN("invalid cell size {}, using {}", cellSize, size);
    }

    const int cols = cellCount(fairway.width, size);
    const int rows = cellCount(fairway.height, size);
    const float clearance = postClearance(size);

    std::vector<GridCell> cells;
    cells.reserve(static_cast<size_t>(cols) * rows);

    for (int y = 0; y < rows; ++y) {
        for (int x = 0; x < cols; ++x) {
            const Point center{fairway.x + x * size + size / 2,
                               fairway.y + y * size + size / 2};
            cells.push_back(classifyCell(level, center, clearance));
        }
    }

    TerrainGrid grid(fairway, size, cols, rows, std::move(cells));
    LOG_DEBUG("grid {}x{} cellSize={} blocked={}", cols, rows, size, grid.blockedCellCount());
    return grid;
}

GridCell GridBuilder::classifyCell(const Level& level, const Point& center, float clearance) {
    GridCell cell;

    cell.blocked = anyShapeContains(level.walls, center) ||
                   anyShapeContains(level.water, center) ||
                   std::any_of(level.posts.begin(), level.posts.end(), [&](const Post& post) {
                       return geometry::pointInCircle(center, post.center,
                                                      post.effectiveRadius(), clearance);
                   });

    if (cell.blocked) {
        cell.blocked = std::none_of(level.bridges.begin(), level.bridges.end(),
                                    [&](const Rect& bridge) { return bridge.contains(center); });
    }

    if (cell.blocked) {
        return cell;
    }

    if (anyShapeContains(level.sand, center)) {
        cell.cost = std::max(cell.cost, GridCell::SAND_COST);
        cell.sand = true;
    }

    Point downhill;
    float strength = 0.0f;
    for (const auto& field : level.slopes) {
        if (!field.area.contains(center)) continue;
        const float s = field.clampedStrength();
        downhill = downhill + compassVector(field.direction) * s;
        strength = std::max(strength, s);
    }

    // Opposing fields may cancel out entirely; such cells carry no slope
    if (downhill.x != 0.0f || downhill.y != 0.0f) {
        cell.slope = SlopeVector{downhill.normalized(),
                                 std::min(GridCell::MAX_SLOPE_STRENGTH, strength)};
        if (cell.cost <= GridCell::BASE_COST) {
            cell.cost = GridCell::SLOPE_COST;
        }
    }

    return cell;
}

}  // namespace puttcraft
