#include "CupPlacementAdvisor.h"
#include "../grid/GridBuilder.h"
#include "../metrics/PathMetrics.h"
#include "../pathfinding/WeightedAStarPathFinder.h"
#include "puttcraft/common/Logger.h"
#include "puttcraft/core/GeometryUtils.h"

#include <algorithm>
#include <cmath>

namespace puttcraft {

namespace {

struct ScoredCell {
    GridPoint cell;
    float score;
    float lengthPx;
    int turns;
};

}  // namespace

CupPlacementAdvisor::CupPlacementAdvisor(std::shared_ptr<IPathFinder> pathFinder)
    : pathFinder_(pathFinder ? std::move(pathFinder) : std::make_shared<WeightedAStarPathFinder>()) {
}

float CupPlacementAdvisor::defaultEdgeMargin(float cellSize) {
    return std::max(20.0f, std::round(cellSize * 2.0f));
}

bool CupPlacementAdvisor::nearEdge(const Point& p, const Rect& fairway, float margin) {
    return geometry::distanceToRectEdge(p, fairway) < margin;
}

std::vector<CupCandidate> CupPlacementAdvisor::suggest(const Level& level, const Rect& fairway,
                                                       float cellSize, int count,
                                                       const CupSuggestionOptions& options) const {
    const TerrainGrid grid = GridBuilder::build(level, fairway, cellSize);
    const float size = grid.cellSize();

    const float edgeMargin = options.edgeMargin.value_or(defaultEdgeMargin(size));
    const float minDistance =
        options.minDistancePx.value_or(std::max(fairway.width, fairway.height) * 0.25f);
    const float bankWeight = options.bankWeight.value_or(size * 0.5f);
    const bool useRegion = !options.regionPolygon.empty();

    const GridPoint start = grid.worldToCell(level.tee);
    std::vector<ScoredCell> scored;
    int searched = 0;

    for (int y = 0; y < grid.height(); ++y) {
        for (int x = 0; x < grid.width(); ++x) {
            if (grid.at(x, y).blocked) {
                continue;
            }
            const Point center = grid.cellCenter(x, y);
            if (nearEdge(center, fairway, edgeMargin)) {
                continue;
            }
            const float straight = center.distanceTo(level.tee);
            if (straight < minDistance) {
                continue;
            }

            ++searched;
            const GridPoint cell{x, y};
            const PathResult search = pathFinder_->findPath(grid, start, cell);
            if (!search.found) {
                continue;
            }

            const float lengthPx = search.pathCost * size;
            const int turns = metrics::countTurns(search.path);
            if (lengthPx < straight * options.minStraightnessRatio || turns < options.minTurns) {
                continue;
            }
            if (useRegion && !geometry::pointInPolygon(center, options.regionPolygon)) {
                continue;
            }

            const float score = lengthPx + turns * (size * 2.0f) +
                                metrics::corridorSum(grid, search.path) * bankWeight;
            scored.push_back({cell, score, lengthPx, turns});
        }
    }

    std::stable_sort(scored.begin(), scored.end(),
                     [](const ScoredCell& a, const ScoredCell& b) { return a.score > b.score; });

    const float minSeparation = options.minSeparationCells * size;
    std::vector<CupCandidate> picked;
    for (const auto& candidate : scored) {
        if (static_cast<int>(picked.size()) >= count) {
            break;
        }
        const Point center = grid.cellCenter(candidate.cell);
        const bool crowded = std::any_of(picked.begin(), picked.end(), [&](const CupCandidate& p) {
            return p.position.distanceTo(center) < minSeparation;
        });
        if (crowded) {
            continue;
        }
        picked.push_back({center, candidate.score, candidate.lengthPx, candidate.turns});
    }

    LOG_DEBUG("cup suggestions: {} searched, {} qualified, {} picked",
              searched, scored.size(), picked.size());
    return picked;
}

std::vector<std::string> CupPlacementAdvisor::lint(const Level& level, const Rect& fairway,
                                                   float cellSize) const {
    std::vector<std::string> warnings;
    const TerrainGrid grid = GridBuilder::build(level, fairway, cellSize);

    const PathResult search = pathFinder_->findPath(
        grid, grid.worldToCell(level.tee), grid.worldToCell(level.cup.position));
    if (!search.found) {
        warnings.emplace_back(UNREACHABLE_WARNING);
        return warnings;
    }

    const PathSummary summary = metrics::summarize(grid, search.path);
    const float straight = level.tee.distanceTo(level.cup.position);

    if (level.obstacleCount() > 0 && summary.turns <= 1 &&
        summary.lengthPx < straight * LINT_STRAIGHTNESS_RATIO &&
        summary.corridorContact < LINT_MIN_CORRIDOR_CONTACT) {
        warnings.emplace_back(BYPASS_WARNING);
    }

    if (nearEdge(level.cup.position, fairway, std::max(2.0f * grid.cellSize(), 20.0f))) {
        warnings.emplace_back(EDGE_WARNING);
    }

    for (const auto& warning : warnings) {
        LOG_DEBUG("cup lint: {}", warning);
    }
    return warnings;
}

}  // namespace puttcraft
