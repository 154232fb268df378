#pragma once

#include "puttcraft/core/Types.h"

#include <optional>
#include <vector>

namespace puttcraft {

/// Aggregated downhill direction of a cell
struct SlopeVector {
    Point direction;         ///< Unit downhill direction
    float strength = 0.0f;   ///< Capped at GridCell::MAX_SLOPE_STRENGTH
};

/// One rasterized unit of the fairway
struct GridCell {
    static constexpr float BASE_COST = 1.0f;
    static constexpr float SLOPE_COST = 1.25f;
    static constexpr float SAND_COST = 3.0f;
    static constexpr float MAX_SLOPE_STRENGTH = 1.5f;

    float cost = BASE_COST;
    bool blocked = false;
    bool sand = false;
    std::optional<SlopeVector> slope;

    bool hasSlope() const { return slope.has_value() && slope->strength > 0.0f; }
};

/// Immutable traversability grid over a fairway rectangle
///
/// Cell (x, y) covers [fairway.x + x*cellSize, fairway.x + (x+1)*cellSize)
/// horizontally and likewise vertically; its classification is taken at
/// the cell center. Built by GridBuilder, consumed by the path finder and
/// the estimators.
class TerrainGrid {
public:
    TerrainGrid(const Rect& fairway, float cellSize, int cols, int rows,
                std::vector<GridCell> cells);

    int width() const { return cols_; }
    int height() const { return rows_; }
    float cellSize() const { return cellSize_; }
    const Rect& fairway() const { return fairway_; }

    bool inBounds(int x, int y) const {
        return x >= 0 && y >= 0 && x < cols_ && y < rows_;
    }
    bool inBounds(const GridPoint& p) const { return inBounds(p.x, p.y); }

    /// Cell at grid coordinates (caller guarantees inBounds)
    const GridCell& at(int x, int y) const { return cells_[toIndex(x, y)]; }
    const GridCell& at(const GridPoint& p) const { return at(p.x, p.y); }

    /// Out-of-bounds coordinates are reported as not blocked
    bool isBlocked(int x, int y) const;

    /// Map a world point to its cell, clamped into the grid
    GridPoint worldToCell(const Point& p) const;

    /// World-space center of a cell
    Point cellCenter(int x, int y) const;
    Point cellCenter(const GridPoint& p) const { return cellCenter(p.x, p.y); }

    /// Number of blocked in-bounds cells among the 8 neighbors
    int blockedNeighborCount(int x, int y) const;

    /// Total number of blocked cells
    int blockedCellCount() const;

private:
    int toIndex(int x, int y) const { return y * cols_ + x; }

    Rect fairway_;
    float cellSize_;
    int cols_;
    int rows_;
    std::vector<GridCell> cells_;
};

}  // namespace puttcraft
