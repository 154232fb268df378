#include "puttcraft/analysis/TerrainGrid.h"

#include <algorithm>
#include <cmath>

namespace puttcraft {

TerrainGrid::TerrainGrid(const Rect& fairway, float cellSize, int cols, int rows,
                         std::vector<GridCell> cells)
    : fairway_(fairway),
      cellSize_(cellSize),
      cols_(cols),
      rows_(rows),
      cells_(std::move(cells)) {
    cells_.resize(static_cast<size_t>(cols_) * rows_);
}

bool TerrainGrid::isBlocked(int x, int y) const {
    if (!inBounds(x, y)) {
        return false;
    }
    return cells_[toIndex(x, y)].blocked;
}

namespace {

/// Clamp a fractional cell coordinate into [0, count - 1] before the int
/// conversion; NaN maps to 0
int clampToIndex(float v, int count) {
    if (std::isnan(v)) {
        return 0;
    }
    return static_cast<int>(std::clamp(std::floor(v), 0.0f, static_cast<float>(count - 1)));
}

}  // namespace

GridPoint TerrainGrid::worldToCell(const Point& p) const {
    return {clampToIndex((p.x - fairway_.x) / cellSize_, cols_),
            clampToIndex((p.y - fairway_.y) / cellSize_, rows_)};
}

Point TerrainGrid::cellCenter(int x, int y) const {
    return {fairway_.x + x * cellSize_ + cellSize_ / 2,
            fairway_.y + y * cellSize_ + cellSize_ / 2};
}

int TerrainGrid::blockedNeighborCount(int x, int y) const {
    int count = 0;
    for (int dy = -1; dy <= 1; ++dy) {
        for (int dx = -1; dx <= 1; ++dx) {
            if (dx == 0 && dy == 0) continue;
            if (inBounds(x + dx, y + dy) && at(x + dx, y + dy).blocked) {
                ++count;
            }
        }
    }
    return count;
}

int TerrainGrid::blockedCellCount() const {
    return static_cast<int>(std::count_if(cells_.begin(), cells_.end(),
                                          [](const GridCell& c) { return c.blocked; }));
}

}  // namespace puttcraft
