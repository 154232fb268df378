#include "PathMetrics.h"
#include "../pathfinding/WeightedAStarPathFinder.h"
#include "puttcraft/core/GeometryUtils.h"

#include <algorithm>

namespace puttcraft::metrics {

int countTurns(const std::vector<GridPoint>& path) {
    int turns = 0;
    for (size_t i = 2; i < path.size(); ++i) {
        if (path[i - 1] - path[i - 2] != path[i] - path[i - 1]) {
            ++turns;
        }
    }
    return turns;
}

int corridorSum(const TerrainGrid& grid, const std::vector<GridPoint>& path) {
    int sum = 0;
    for (const auto& p : path) {
        sum += grid.blockedNeighborCount(p.x, p.y);
    }
    return sum;
}

PathSummary summarize(const TerrainGrid& grid, const std::vector<GridPoint>& path) {
    PathSummary summary;
    summary.cellCount = static_cast<int>(path.size());
    summary.rawCost = WeightedAStarPathFinder::rawPathCost(grid, path);
    summary.lengthPx = summary.rawCost * grid.cellSize();
    summary.turns = countTurns(path);
    summary.corridorSum = corridorSum(grid, path);
    summary.corridorContact =
        static_cast<float>(summary.corridorSum) / static_cast<float>(std::max(1, summary.cellCount));

    for (const auto& p : path) {
        const GridCell& cell = grid.at(p);
        if (!cell.blocked && cell.sand) ++summary.sandCells;
        if (cell.hasSlope()) ++summary.slopeCells;
    }
    return summary;
}

TraversalAnalysis analyzeTraversal(const TerrainGrid& grid,
                                   const std::vector<GridPoint>& path,
                                   float autoAssistMomentum) {
    TraversalAnalysis analysis;
    for (size_t i = 1; i < path.size(); ++i) {
        const GridPoint& a = path[i - 1];
        const GridPoint& b = path[i];
        const int dx = b.x - a.x;
        const int dy = b.y - a.y;
        const float stepLength = (dx != 0 && dy != 0) ? constants::SQRT2 : 1.0f;

        const GridCell& from = grid.at(a);
        const GridCell& to = grid.at(b);
        analysis.rawCost += stepLength * to.cost;

        Point downhill;
        float strength = 0.0f;
        if (from.slope) {
            downhill = downhill + from.slope->direction;
            strength += from.slope->strength;
        }
        if (to.slope) {
            downhill = downhill + to.slope->direction;
            strength += to.slope->strength;
        }
        downhill = downhill * 0.5f;
        strength *= 0.5f;
        if (strength <= 0.0f || (downhill.x == 0.0f && downhill.y == 0.0f)) {
            continue;
        }

        const float alignment = downhill.dot({dx / stepLength, dy / stepLength});
        if (alignment > SLOPE_ALIGNMENT_DEADBAND) {
            const float boost = alignment * strength * stepLength;
            analysis.downhillMomentum += boost;
            if (boost >= autoAssistMomentum) {
                ++analysis.autoAssistSegments;
            }
        } else if (alignment < -SLOPE_ALIGNMENT_DEADBAND) {
            analysis.uphillResistance += -alignment * strength * stepLength;
        }
    }
    return analysis;
}

}  // namespace puttcraft::metrics
