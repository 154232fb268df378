#include "PathDiversifier.h"
#include "ParEstimator.h"
#include "../grid/GridBuilder.h"
#include "../pathfinding/WeightedAStarPathFinder.h"
#include "puttcraft/common/Logger.h"

#include <algorithm>
#include <cmath>
#include <deque>

namespace puttcraft {

namespace {

struct QueuedPath {
    std::vector<GridPoint> path;
    int depth;
};

std::vector<size_t> sampleIndices(size_t pathLength, int sampleStep) {
    std::vector<size_t> indices;
    const size_t first = static_cast<size_t>(std::max(2, sampleStep / 2));
    for (size_t i = first; i + 1 < pathLength; i += static_cast<size_t>(sampleStep)) {
        indices.push_back(i);
    }
    return indices;
}

}  // namespace

// ============================================================================
// CandidatePool
// ============================================================================

bool CandidatePool::consider(const std::vector<GridPoint>& path) {
    if (path.empty() || !signatures_.insert(path).second) {
        return false;
    }

    Entry entry{owner_.evaluate(grid_, path), std::set<GridPoint>(path.begin(), path.end())};

    for (auto& existing : entries_) {
        if (PathDiversifier::overlapFraction(entry.cells, existing.cells) <
            PathDiversifier::SIMILARITY_THRESHOLD) {
            continue;
        }

        // Same corridor, but a different way of playing the slopes
        const float momentumGap =
            std::abs(entry.candidate.downhillMomentum - existing.candidate.downhillMomentum);
        const int autoGap =
            std::abs(entry.candidate.autoAssistSegments - existing.candidate.autoAssistSegments);
        if (momentumGap >= PathDiversifier::MOMENTUM_GAP ||
            autoGap >= PathDiversifier::AUTO_ASSIST_GAP) {
            continue;
        }

        if (entry.candidate.strokes + PathDiversifier::STROKE_IMPROVEMENT <
            existing.candidate.strokes) {
            existing = std::move(entry);
            ++replaced_;
            return true;
        }
        return false;
    }

    entries_.push_back(std::move(entry));
    return true;
}

std::vector<CandidatePath> CandidatePool::release() {
    std::vector<CandidatePath> out;
    out.reserve(entries_.size());
    for (auto& entry : entries_) {
        out.push_back(std::move(entry.candidate));
    }
    entries_.clear();
    return out;
}

// ============================================================================
// PathDiversifier
// ============================================================================

PathDiversifier::PathDiversifier(const ParModelConfig& config, std::shared_ptr<IPathFinder> pathFinder)
    : model_(config)
    , pathFinder_(pathFinder ? std::move(pathFinder) : std::make_shared<WeightedAStarPathFinder>()) {
}

int PathDiversifier::maxPoolSize(int count) {
    return std::max(count * 6, count + 4);
}

float PathDiversifier::overlapFraction(const std::set<GridPoint>& a, const std::set<GridPoint>& b) {
    if (a.empty() || b.empty()) {
        return 0.0f;
    }
    const std::set<GridPoint>& smaller = a.size() <= b.size() ? a : b;
    const std::set<GridPoint>& larger = a.size() <= b.size() ? b : a;
    size_t shared = 0;
    for (const auto& cell : smaller) {
        if (larger.count(cell) > 0) ++shared;
    }
    return static_cast<float>(shared) / static_cast<float>(smaller.size());
}

CandidatePath PathDiversifier::evaluate(const TerrainGrid& grid,
                                        const std::vector<GridPoint>& path) const {
    const PathSummary summary = metrics::summarize(grid, path);
    const TraversalAnalysis traversal =
        metrics::analyzeTraversal(grid, path, model_.config().autoAssistSegmentMomentum);

    CandidatePath candidate;
    candidate.path = path;
    candidate.worldPoints.reserve(path.size());
    for (const auto& cell : path) {
        candidate.worldPoints.push_back(grid.cellCenter(cell));
    }
    candidate.lengthPx = summary.lengthPx;
    candidate.turns = summary.turns;
    candidate.corridorContact = summary.corridorContact;
    candidate.sandCells = summary.sandCells;
    candidate.slopeCells = summary.slopeCells;
    candidate.downhillMomentum = traversal.downhillMomentum;
    candidate.uphillResistance = traversal.uphillResistance;
    candidate.autoAssistSegments = traversal.autoAssistSegments;
    candidate.strokes = model_.applySlopeAssist(model_.baseStrokes(summary), traversal);
    candidate.par = model_.parForStrokes(candidate.strokes);
    return candidate;
}

ParSuggestions PathDiversifier::suggest(const Level& level, const Rect& fairway,
                                        float cellSize, int count) const {
    return suggest(level, GridBuilder::build(level, fairway, cellSize), count);
}

ParSuggestions PathDiversifier::suggest(const Level& level, const TerrainGrid& grid, int count) const {
    ParSuggestions result;

    const GridPoint start = grid.worldToCell(level.tee);
    const GridPoint goal = grid.worldToCell(level.cup.position);
    const PathResult base = pathFinder_->findPath(grid, start, goal);

    if (!base.found) {
        result.par = ParEstimator(model_.config(), pathFinder_).fallbackPar(level);
        LOG_DEBUG("no base route, fallback par {}", result.par);
        return result;
    }

    const size_t maxPool = static_cast<size_t>(maxPoolSize(count));
    CandidatePool pool(*this, grid);
    std::deque<QueuedPath> queue;

    if (pool.consider(base.path)) {
        queue.push_back({base.path, 0});
    }

    // One forced route per first step out of the tee cell
    for (const auto& step : WeightedAStarPathFinder::steps()) {
        if (!WeightedAStarPathFinder::canStep(grid, start, step)) {
            continue;
        }
        const GridPoint neighbor{start.x + step.dx, start.y + step.dy};
        const PathResult forced = pathFinder_->findPath(grid, neighbor, goal);
        if (!forced.found) {
            continue;
        }
        std::vector<GridPoint> seeded;
        seeded.reserve(forced.path.size() + 1);
        seeded.push_back(start);
        seeded.insert(seeded.end(), forced.path.begin(), forced.path.end());
        pool.consider(seeded);
        if (pool.size() >= maxPool) break;
    }

    int searches = 0;
    auto tryBanned = [&](SearchConstraints constraints, int depth) {
        ++searches;
        const PathResult alt = pathFinder_->findPath(grid, start, goal, constraints);
        if (!alt.found) {
            return;
        }
        if (pool.consider(alt.path) && depth < MAX_DEPTH && queue.size() < maxPool) {
            queue.push_back({alt.path, depth + 1});
        }
    };

    // The queue only grows at its tail, so index iteration keeps BFS order
    for (size_t q = 0; q < queue.size() && pool.size() < maxPool; ++q) {
        const std::vector<GridPoint> path = queue[q].path;
        const int depth = queue[q].depth;
        if (path.size() < 4) {
            continue;
        }

        const int len = static_cast<int>(path.size());
        const int sampleStep = std::max(
            2, static_cast<int>(std::lround(static_cast<float>(len) / std::max(4, count * 3))));
        const std::vector<size_t> indices = sampleIndices(path.size(), sampleStep);

        for (size_t i : indices) {
            SearchConstraints constraints;
            constraints.bannedCells.insert(path[i]);
            tryBanned(std::move(constraints), depth);
        }

        if (pool.size() >= maxPool) break;

        if (path.size() >= 6) {
            const size_t offset = static_cast<size_t>(std::max(1, sampleStep / 2));
            for (size_t i : indices) {
                SearchConstraints constraints;
                constraints.bannedCells.insert(path[i]);
                constraints.bannedCells.insert(path[std::min(path.size() - 2, i + offset)]);
                tryBanned(std::move(constraints), depth);
            }
        }
    }

    std::vector<CandidatePath> candidates = pool.release();
    std::stable_sort(candidates.begin(), candidates.end(),
                     [](const CandidatePath& a, const CandidatePath& b) {
                         if (a.strokes != b.strokes) return a.strokes < b.strokes;
                         return a.lengthPx < b.lengthPx;
                     });
    if (candidates.size() > static_cast<size_t>(std::max(0, count))) {
        candidates.resize(static_cast<size_t>(std::max(0, count)));
    }

    if (candidates.empty()) {
        // No candidate survived truncation; fall back to the base route length
        const ParModelConfig& config = model_.config();
        const float strokes = base.pathCost * grid.cellSize() / config.baselineShotPx;
        result.par = config.parForStrokes(strokes);
    } else {
        result.bestIndex = 0;
        result.par = candidates.front().par;
    }
    result.candidates = std::move(candidates);

    LOG_DEBUG("{} candidates kept ({} constrained searches, {} replacements), par {}",
              result.candidates.size(), searches, pool.replacedCount(), result.par);
    return result;
}

}  // namespace puttcraft
