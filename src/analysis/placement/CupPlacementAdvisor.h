#pragma once

#include "puttcraft/analysis/IPathFinder.h"
#include "puttcraft/analysis/config/AnalysisConfig.h"
#include "puttcraft/analysis/config/AnalysisResult.h"
#include "puttcraft/core/Level.h"

#include <memory>
#include <string>
#include <vector>

namespace puttcraft {

/// Suggests alternate cup positions and lints the authored one
class CupPlacementAdvisor {
public:
    /// Routes shorter than straight distance times this count as "straight"
    static constexpr float LINT_STRAIGHTNESS_RATIO = 1.08f;

    /// Corridor contact below which a straight route is not hugging anything
    static constexpr float LINT_MIN_CORRIDOR_CONTACT = 1.0f;

    /// Lint warnings
    static constexpr const char* UNREACHABLE_WARNING = "Cup is not reachable by A* path";
    static constexpr const char* BYPASS_WARNING =
        "Cup path appears to bypass obstacles (nearly straight, low corridor contact)";
    static constexpr const char* EDGE_WARNING = "Cup is very close to fairway edge";

    explicit CupPlacementAdvisor(std::shared_ptr<IPathFinder> pathFinder = nullptr);

    /// Rank reachable cells as cup positions, hardest first
    ///
    /// Every unblocked cell inside the edge margin and far enough from the
    /// tee is searched once. Straight routes and cells outside the optional
    /// region are rejected; the rest are scored by
    /// length + turns * 2 * cellSize + corridorSum * bankWeight and picked
    /// greedily with a minimum spacing.
    std::vector<CupCandidate> suggest(const Level& level, const Rect& fairway, float cellSize,
                                      int count, const CupSuggestionOptions& options = {}) const;

    /// Warnings for the authored cup (empty when nothing looks wrong)
    std::vector<std::string> lint(const Level& level, const Rect& fairway, float cellSize) const;

    /// Default edge margin: max(20, round(2 * cellSize))
    static float defaultEdgeMargin(float cellSize);

    /// True when p lies closer than margin to any side of the fairway
    static bool nearEdge(const Point& p, const Rect& fairway, float margin);

private:
    std::shared_ptr<IPathFinder> pathFinder_;
};

}  // namespace puttcraft
