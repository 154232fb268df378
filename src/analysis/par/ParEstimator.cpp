#include "ParEstimator.h"
#include "../grid/GridBuilder.h"
#include "../pathfinding/WeightedAStarPathFinder.h"
#include "puttcraft/common/Logger.h"

#include <format>

namespace puttcraft {

ParEstimator::ParEstimator(const ParModelConfig& config, std::shared_ptr<IPathFinder> pathFinder)
    : model_(config)
    , pathFinder_(pathFinder ? std::move(pathFinder) : std::make_shared<WeightedAStarPathFinder>()) {
}

ParEstimate ParEstimator::estimate(const Level& level, const Rect& fairway, float cellSize) const {
    return estimate(level, GridBuilder::build(level, fairway, cellSize));
}

int ParEstimator::fallbackPar(const Level& level) const {
    return model_.fallbackPar(level.tee.distanceTo(level.cup.position), level.obstacleCount());
}

ParEstimate ParEstimator::estimate(const Level& level, const TerrainGrid& grid) const {
    ParEstimate result;

    const GridPoint start = grid.worldToCell(level.tee);
    const GridPoint goal = grid.worldToCell(level.cup.position);
    const PathResult search = pathFinder_->findPath(grid, start, goal);

    if (!search.found) {
        result.reachable = false;
        result.pathLengthPx = level.tee.distanceTo(level.cup.position);
        result.suggestedPar = fallbackPar(level);
        result.notes.push_back("no path, fallback used");
        LOG_DEBUG("cup unreachable, fallback par {} (straight {:.1f}px, {} obstacles)",
                  result.suggestedPar, result.pathLengthPx, level.obstacleCount());
        return result;
    }

    const PathSummary summary = metrics::summarize(grid, search.path);
    const float strokes = model_.baseStrokes(summary);

    result.reachable = true;
    result.pathLengthPx = summary.lengthPx;
    result.suggestedPar = model_.parForStrokes(strokes);

    if (summary.sandCells > 0) {
        result.notes.push_back(std::format("sand cells ~{}", summary.sandCells));
    }
    if (summary.slopeCells > 0) {
        result.notes.push_back(std::format("hills on path ~{}", summary.slopeCells));
    }
    if (summary.turns > 0) {
        result.notes.push_back(std::format("turns ~{}", summary.turns));
    }
    if (summary.corridorContact > 0.0f) {
        result.notes.push_back(std::format("corridor contact ~{:.2f}", summary.corridorContact));
    }

    LOG_DEBUG("par {} via {}: {} cells, {:.1f}px, strokes {:.2f}",
              result.suggestedPar, pathFinder_->algorithmName(), summary.cellCount,
              summary.lengthPx, strokes);
    return result;
}

}  // namespace puttcraft
