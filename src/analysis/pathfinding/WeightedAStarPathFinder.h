#pragma once

#include "puttcraft/analysis/IPathFinder.h"

#include <array>

namespace puttcraft {

/// A* pathfinder over an 8-connected terrain grid
///
/// Step weight is 1 (orthogonal) or sqrt2 (diagonal) times the mean cost of
/// the two cells. Diagonal steps are rejected when either flanking
/// orthogonal cell is blocked. Slope fields bias the search priority only:
/// moving uphill costs up to 1.6x, downhill down to 0.75x. The reported
/// pathCost is recomputed from raw terrain cost without that bias.
class WeightedAStarPathFinder : public IPathFinder {
public:
    static constexpr float UPHILL_WEIGHT = 0.5f;
    static constexpr float DOWNHILL_WEIGHT = 0.15f;
    static constexpr float MIN_SLOPE_FACTOR = 0.75f;
    static constexpr float MAX_SLOPE_FACTOR = 1.6f;

    /// Single move on the grid
    struct Step {
        int dx;
        int dy;
        float weight;

        bool isDiagonal() const { return dx != 0 && dy != 0; }
    };

    /// Neighbor order: E, W, S, N, SE, NE, SW, NW
    static const std::array<Step, 8>& steps();

    WeightedAStarPathFinder() = default;

    const char* algorithmName() const override { return "Weighted A*"; }

    PathResult findPath(
        const TerrainGrid& grid,
        const GridPoint& start,
        const GridPoint& goal,
        const SearchConstraints& constraints = {}) const override;

    /// Octile distance between two cells
    static float octileDistance(const GridPoint& a, const GridPoint& b);

    /// True when a move from `from` by `step` stays in bounds, lands on an
    /// unblocked cell, and does not cut a blocked corner
    static bool canStep(const TerrainGrid& grid, const GridPoint& from, const Step& step);

    /// Search-only slope multiplier for moving between two adjacent cells
    static float slopeFactor(const GridCell& from, const GridCell& to, const Step& step);

    /// Sum of step_weight * arrival_cell.cost along a path
    static float rawPathCost(const TerrainGrid& grid, const std::vector<GridPoint>& path);
};

}  // namespace puttcraft
