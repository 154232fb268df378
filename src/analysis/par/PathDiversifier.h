#pragma once

#include "../metrics/StrokeModel.h"
#include "puttcraft/analysis/IPathFinder.h"
#include "puttcraft/analysis/config/AnalysisResult.h"
#include "puttcraft/core/Level.h"

#include <memory>
#include <set>
#include <vector>

namespace puttcraft {

/// Proposes several structurally different tee -> cup routes
///
/// Alternates are surfaced by re-running the search with one or two cells
/// of a known route banned, breadth-first over the pool of accepted routes.
/// Each candidate is scored independently, including the stroke savings of
/// rolling with slopes, so a longer downhill route may rank first.
///
/// Pool size and recursion depth are bounded, which keeps the work per call
/// independent of level complexity.
class PathDiversifier {
public:
    /// Routes sharing at least this fraction of cells are the same route
    static constexpr float SIMILARITY_THRESHOLD = 0.6f;

    /// Same-route variants survive when their momentum differs by this much
    static constexpr float MOMENTUM_GAP = 0.6f;

    /// ... or their auto-assist segment counts differ by this much
    static constexpr int AUTO_ASSIST_GAP = 2;

    /// A same-route variant replaces the kept one only when cheaper by more than this
    static constexpr float STROKE_IMPROVEMENT = 0.05f;

    static constexpr int MAX_DEPTH = 2;

    explicit PathDiversifier(const ParModelConfig& config = {},
                             std::shared_ptr<IPathFinder> pathFinder = nullptr);

    /// Up to `count` candidates sorted by strokes, then length
    ParSuggestions suggest(const Level& level, const Rect& fairway, float cellSize, int count) const;

    ParSuggestions suggest(const Level& level, const TerrainGrid& grid, int count) const;

    /// Full metrics and stroke estimate for a fixed path
    CandidatePath evaluate(const TerrainGrid& grid, const std::vector<GridPoint>& path) const;

    /// Shared cells over the smaller of the two cell sets (0 when either is empty)
    static float overlapFraction(const std::set<GridPoint>& a, const std::set<GridPoint>& b);

    /// Candidate pool bound for a requested count
    static int maxPoolSize(int count);

private:
    StrokeModel model_;
    std::shared_ptr<IPathFinder> pathFinder_;
};

/// Routes accepted during one suggest() call
///
/// Exact cell sequences are considered once. A route sharing at least
/// SIMILARITY_THRESHOLD of its cells with a kept one is a near-duplicate
/// unless the two differ by MOMENTUM_GAP of downhill momentum or
/// AUTO_ASSIST_GAP auto-assist segments. A near-duplicate replaces the kept
/// route when it is cheaper by more than STROKE_IMPROVEMENT and is dropped
/// otherwise.
class CandidatePool {
public:
    CandidatePool(const PathDiversifier& owner, const TerrainGrid& grid)
        : owner_(owner), grid_(grid) {}

    /// @return true when the path was added or replaced a near-duplicate
    bool consider(const std::vector<GridPoint>& path);

    size_t size() const { return entries_.size(); }
    int replacedCount() const { return replaced_; }
    const CandidatePath& at(size_t index) const { return entries_[index].candidate; }

    /// Moves the kept candidates out in acceptance order
    std::vector<CandidatePath> release();

private:
    struct Entry {
        CandidatePath candidate;
        std::set<GridPoint> cells;
    };

    const PathDiversifier& owner_;
    const TerrainGrid& grid_;
    std::vector<Entry> entries_;
    std::set<std::vector<GridPoint>> signatures_;
    int replaced_ = 0;
};

}  // namespace puttcraft
