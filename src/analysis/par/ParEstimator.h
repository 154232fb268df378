#pragma once

#include "../metrics/StrokeModel.h"
#include "puttcraft/analysis/IPathFinder.h"
#include "puttcraft/analysis/config/AnalysisResult.h"
#include "puttcraft/core/Level.h"

#include <memory>

namespace puttcraft {

/// Single-path par estimate for a hole
///
/// Builds the terrain grid, searches tee -> cup and converts the path
/// into strokes through StrokeModel. When the cup cannot be reached the
/// estimate falls back to the straight-line distance plus a per-obstacle
/// allowance.
class ParEstimator {
public:
    /// @param config Stroke model tunables
    /// @param pathFinder Search strategy (nullptr for WeightedAStarPathFinder)
    explicit ParEstimator(const ParModelConfig& config = {},
                          std::shared_ptr<IPathFinder> pathFinder = nullptr);

    ParEstimate estimate(const Level& level, const Rect& fairway, float cellSize) const;

    /// Estimate on a grid already built for this level
    ParEstimate estimate(const Level& level, const TerrainGrid& grid) const;

    /// Straight-line fallback par for an unreachable cup
    int fallbackPar(const Level& level) const;

private:
    StrokeModel model_;
    std::shared_ptr<IPathFinder> pathFinder_;
};

}  // namespace puttcraft
