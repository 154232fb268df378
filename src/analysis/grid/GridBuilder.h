#pragma once

#include "puttcraft/analysis/TerrainGrid.h"
#include "puttcraft/core/Level.h"

namespace puttcraft {

/// Rasterizes level geometry into a TerrainGrid
///
/// Each cell is classified at its center with fixed precedence:
/// 1. blocked by walls, water, or posts (radius + clearance)
/// 2. bridges un-block whatever lies beneath them
/// 3. sand raises the cost of unblocked cells to GridCell::SAND_COST
/// 4. overlapping slope fields are summed into one unit downhill vector
class GridBuilder {
public:
    /// Build the grid for a fairway
    /// @param level Resolved hole geometry
    /// @param fairway Region to rasterize
    /// @param cellSize Cell edge length in pixels (invalid values use the default)
    /// @return Grid of max(1, ceil(w/cellSize)) x max(1, ceil(h/cellSize)) cells
    static TerrainGrid build(const Level& level, const Rect& fairway, float cellSize);

    /// Extra blocking margin around posts: max(6, round(cellSize * 0.4))
    static float postClearance(float cellSize);

    /// Grid dimension along one axis
    static int cellCount(float extent, float cellSize);

private:
    static GridCell classifyCell(const Level& level, const Point& center, float clearance);
};

}  // namespace puttcraft
