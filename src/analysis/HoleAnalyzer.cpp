#include "puttcraft/analysis/HoleAnalyzer.h"
#include "grid/GridBuilder.h"
#include "par/ParEstimator.h"
#include "par/PathDiversifier.h"
#include "pathfinding/WeightedAStarPathFinder.h"
#include "placement/CupPlacementAdvisor.h"
#include "puttcraft/common/Logger.h"

namespace puttcraft {

HoleAnalyzer::HoleAnalyzer(AnalysisConfig config, std::shared_ptr<IPathFinder> pathFinder)
    : config_(std::move(config))
    , pathFinder_(pathFinder ? std::move(pathFinder) : std::make_shared<WeightedAStarPathFinder>()) {
}

TerrainGrid HoleAnalyzer::buildGrid(const Level& level, const Rect& fairway, float cellSize) const {
    return GridBuilder::build(level, fairway, cellSize);
}

PathResult HoleAnalyzer::findPath(const Level& level, const TerrainGrid& grid) const {
    return pathFinder_->findPath(grid, grid.worldToCell(level.tee),
                                 grid.worldToCell(level.cup.position));
}

ParEstimate HoleAnalyzer::estimatePar(const Level& level, const Rect& fairway, float cellSize) const {
    return ParEstimator(config_.par, pathFinder_).estimate(level, fairway, cellSize);
}

ParSuggestions HoleAnalyzer::suggestParCandidates(const Level& level, const Rect& fairway,
                                                  float cellSize, int count) const {
    return PathDiversifier(config_.par, pathFinder_).suggest(level, fairway, cellSize, count);
}

std::vector<CupCandidate> HoleAnalyzer::suggestCupPositions(const Level& level, const Rect& fairway,
                                                            float cellSize, int count) const {
    return CupPlacementAdvisor(pathFinder_).suggest(level, fairway, cellSize, count, config_.cups);
}

std::vector<std::string> HoleAnalyzer::lintCup(const Level& level, const Rect& fairway,
                                               float cellSize) const {
    return CupPlacementAdvisor(pathFinder_).lint(level, fairway, cellSize);
}

PathPreview HoleAnalyzer::computePathPreview(const Level& level, const Rect& fairway,
                                             float cellSize) const {
    const TerrainGrid grid = buildGrid(level, fairway, cellSize);

    PathPreview preview;
    preview.cellSize = grid.cellSize();
    preview.cols = grid.width();
    preview.rows = grid.height();

    const PathResult search = findPath(level, grid);
    if (!search.found) {
        LOG_DEBUG("path preview: cup unreachable on {}x{} grid", preview.cols, preview.rows);
        return preview;
    }

    preview.found = true;
    preview.pathCells = search.path;
    preview.worldPoints.reserve(search.path.size());
    preview.sandAt.reserve(search.path.size());
    preview.slopeAt.reserve(search.path.size());
    for (const auto& cell : search.path) {
        const GridCell& terrain = grid.at(cell);
        preview.worldPoints.push_back(grid.cellCenter(cell));
        preview.sandAt.push_back(terrain.sand);
        preview.slopeAt.push_back(terrain.hasSlope());
    }
    return preview;
}

}  // namespace puttcraft
