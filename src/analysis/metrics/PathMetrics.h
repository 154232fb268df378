#pragma once

#include "puttcraft/analysis/TerrainGrid.h"

#include <vector>

namespace puttcraft {

/// Shape and terrain measurements of a fixed grid path
struct PathSummary {
    float rawCost = 0.0f;         ///< Sum of step weight * arrival cell cost
    float lengthPx = 0.0f;        ///< rawCost * cellSize
    int turns = 0;
    int corridorSum = 0;          ///< Total blocked neighbors over path cells
    float corridorContact = 0.0f; ///< corridorSum / cell count
    int sandCells = 0;
    int slopeCells = 0;
    int cellCount = 0;
};

/// Slope interaction along a fixed path
struct TraversalAnalysis {
    float rawCost = 0.0f;
    float downhillMomentum = 0.0f;   ///< Sum of alignment * strength * step length (with the slope)
    float uphillResistance = 0.0f;   ///< Same, against the slope
    int autoAssistSegments = 0;      ///< Steps whose downhill contribution alone is large
};

/// Path measurements shared by the par estimator, the diversifier and the cup advisor
namespace metrics {

/// Alignment magnitude below which a step is treated as across the slope
constexpr float SLOPE_ALIGNMENT_DEADBAND = 0.05f;

/// Number of direction changes between consecutive steps
int countTurns(const std::vector<GridPoint>& path);

/// Total blocked-neighbor count over all path cells
int corridorSum(const TerrainGrid& grid, const std::vector<GridPoint>& path);

/// Measure a path on a grid
PathSummary summarize(const TerrainGrid& grid, const std::vector<GridPoint>& path);

/// Walk a path step by step and accumulate slope momentum
/// @param autoAssistMomentum Per-step downhill contribution counted as auto-assist
TraversalAnalysis analyzeTraversal(const TerrainGrid& grid,
                                   const std::vector<GridPoint>& path,
                                   float autoAssistMomentum);

}  // namespace metrics

}  // namespace puttcraft
