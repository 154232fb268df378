#pragma once

#include "TerrainGrid.h"
#include "puttcraft/core/Types.h"

#include <memory>
#include <unordered_set>
#include <vector>

namespace puttcraft {

/// Optional restrictions applied to a single search
struct SearchConstraints {
    /// Cells discarded when popped for expansion
    /// Routes through them are forbidden; a banned goal is unreachable.
    std::unordered_set<GridPoint, GridPointHash> bannedCells;

    bool empty() const { return bannedCells.empty(); }
};

/// Result of pathfinding operation
struct PathResult {
    bool found = false;
    std::vector<GridPoint> path;  ///< Start cell to goal cell, inclusive
    float pathCost = 0.0f;        ///< Raw terrain cost in cell units (no slope bias)
};

/// Abstract interface for grid pathfinding over a TerrainGrid
///
/// The default implementation is WeightedAStarPathFinder. Alternative
/// strategies can be injected into HoleAnalyzer for experimentation.
class IPathFinder {
public:
    virtual ~IPathFinder() = default;

    /// Find a minimum-cost 8-connected path
    /// @param grid Terrain grid to search
    /// @param start Start cell (must be in bounds)
    /// @param goal Goal cell (must be in bounds)
    /// @param constraints Optional banned cells
    /// @return PathResult; found == false when the goal cannot be reached
    virtual PathResult findPath(
        const TerrainGrid& grid,
        const GridPoint& start,
        const GridPoint& goal,
        const SearchConstraints& constraints = {}) const = 0;

    /// Get algorithm name for debugging/logging
    virtual const char* algorithmName() const = 0;
};

}  // namespace puttcraft
