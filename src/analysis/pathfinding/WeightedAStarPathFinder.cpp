#include "WeightedAStarPathFinder.h"
#include "puttcraft/common/Logger.h"
#include "puttcraft/core/GeometryUtils.h"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>
#include <queue>

namespace puttcraft {

namespace {

/// Open-set entry; ties on f resolve to the cell that has been open longest.
/// A cell keeps its sequence number while it stays open, so lowering its
/// g does not move it behind cells opened after it.
struct OpenEntry {
    float f;
    uint64_t seq;
    float g;
    GridPoint pos;

    bool operator>(const OpenEntry& other) const {
        if (f != other.f) return f > other.f;
        return seq > other.seq;
    }
};

}  // namespace

const std::array<WeightedAStarPathFinder::Step, 8>& WeightedAStarPathFinder::steps() {
    using constants::SQRT2;
    static const std::array<Step, 8> kSteps = {{
        {1, 0, 1.0f}, {-1, 0, 1.0f}, {0, 1, 1.0f}, {0, -1, 1.0f},
        {1, 1, SQRT2}, {1, -1, SQRT2}, {-1, 1, SQRT2}, {-1, -1, SQRT2},
    }};
    return kSteps;
}

float WeightedAStarPathFinder::octileDistance(const GridPoint& a, const GridPoint& b) {
    const int dx = std::abs(a.x - b.x);
    const int dy = std::abs(a.y - b.y);
    const int diag = std::min(dx, dy);
    return static_cast<float>(std::max(dx, dy) - diag) + diag * constants::SQRT2;
}

bool WeightedAStarPathFinder::canStep(const TerrainGrid& grid, const GridPoint& from,
                                      const Step& step) {
    const int nx = from.x + step.dx;
    const int ny = from.y + step.dy;
    if (!grid.inBounds(nx, ny) || grid.at(nx, ny).blocked) {
        return false;
    }
    // No squeezing diagonally past a blocked corner
    if (step.isDiagonal() &&
        (grid.isBlocked(from.x + step.dx, from.y) || grid.isBlocked(from.x, from.y + step.dy))) {
        return false;
    }
    return true;
}

float WeightedAStarPathFinder::slopeFactor(const GridCell& from, const GridCell& to,
                                           const Step& step) {
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
        return 1.0f;
    }

    const Point dir{step.dx / step.weight, step.dy / step.weight};
    const float alignment = downhill.dot(dir);
    const float uphill = std::max(0.0f, -alignment);
    const float down = std::max(0.0f, alignment);
    return std::clamp(1.0f + UPHILL_WEIGHT * uphill * strength - DOWNHILL_WEIGHT * down * strength,
                      MIN_SLOPE_FACTOR, MAX_SLOPE_FACTOR);
}

float WeightedAStarPathFinder::rawPathCost(const TerrainGrid& grid,
                                           const std::vector<GridPoint>& path) {
    float cost = 0.0f;
    for (size_t i = 1; i < path.size(); ++i) {
        const bool diagonal = path[i].x != path[i - 1].x && path[i].y != path[i - 1].y;
        cost += (diagonal ? constants::SQRT2 : 1.0f) * grid.at(path[i]).cost;
    }
    return cost;
}

PathResult WeightedAStarPathFinder::findPath(
    const TerrainGrid& grid,
    const GridPoint& start,
    const GridPoint& goal,
    const SearchConstraints& constraints) const {

    PathResult result;
    if (!grid.inBounds(start) || !grid.inBounds(goal)) {
        LOG_WARN("start ({},{}) or goal ({},{}) outside {}x{} grid",
                 start.x, start.y, goal.x, goal.y, grid.width(), grid.height());
        return result;
    }

    const int cols = grid.width();
    const size_t cellCount = static_cast<size_t>(cols) * grid.height();
    auto indexOf = [cols](const GridPoint& p) { return static_cast<size_t>(p.y) * cols + p.x; };

    constexpr float INF = std::numeric_limits<float>::infinity();
    std::vector<float> gScore(cellCount, INF);
    std::vector<int> cameFrom(cellCount, -1);
    std::vector<uint64_t> openSeq(cellCount, 0);
    std::vector<bool> isOpen(cellCount, false);

    std::priority_queue<OpenEntry, std::vector<OpenEntry>, std::greater<OpenEntry>> openSet;
    uint64_t sequence = 0;

    const size_t startIdx = indexOf(start);
    gScore[startIdx] = 0.0f;
    openSeq[startIdx] = sequence++;
    isOpen[startIdx] = true;
    openSet.push({0.0f, openSeq[startIdx], 0.0f, start});

    while (!openSet.empty()) {
        OpenEntry current = openSet.top();
        openSet.pop();

        const size_t currentIdx = indexOf(current.pos);
        if (!isOpen[currentIdx] || current.g > gScore[currentIdx]) {
            continue;  // superseded by a cheaper entry
        }
        isOpen[currentIdx] = false;

        if (constraints.bannedCells.count(current.pos) > 0) {
            continue;
        }

        if (current.pos == goal) {
            std::vector<GridPoint> path;
            for (int idx = static_cast<int>(currentIdx); idx >= 0; idx = cameFrom[idx]) {
                path.emplace_back(idx % cols, idx / cols);
            }
            std::reverse(path.begin(), path.end());

            result.found = true;
            result.pathCost = rawPathCost(grid, path);
            result.path = std::move(path);
            return result;
        }

        const GridCell& currentCell = grid.at(current.pos);
        for (const Step& step : steps()) {
            if (!canStep(grid, current.pos, step)) {
                continue;
            }

            const GridPoint next{current.pos.x + step.dx, current.pos.y + step.dy};
            const GridCell& nextCell = grid.at(next);

            float moveCost = step.weight * (currentCell.cost + nextCell.cost) * 0.5f;
            moveCost *= slopeFactor(currentCell, nextCell, step);

            const float tentative = current.g + moveCost;
            const size_t nextIdx = indexOf(next);
            if (tentative < gScore[nextIdx]) {
                gScore[nextIdx] = tentative;
                cameFrom[nextIdx] = static_cast<int>(currentIdx);
                if (!isOpen[nextIdx]) {
                    openSeq[nextIdx] = sequence++;
                    isOpen[nextIdx] = true;
                }
                openSet.push({tentative + octileDistance(next, goal), openSeq[nextIdx], tentative, next});
            }
        }
    }

    LOG_TRACE("no path ({},{}) -> ({},{}), banned={}",
              start.x, start.y, goal.x, goal.y, constraints.bannedCells.size());
    return result;
}

}  // namespace puttcraft
