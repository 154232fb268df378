#pragma once

#include "IPathFinder.h"
#include "TerrainGrid.h"
#include "config/AnalysisConfig.h"
#include "config/AnalysisResult.h"
#include "puttcraft/core/Level.h"

#include <memory>
#include <string>
#include <vector>

namespace puttcraft {

/// Entry point for hole difficulty analysis
///
/// Every call is independent: it rasterizes the level, searches and
/// derives its result without caching anything, so the editor may simply
/// re-run the analysis after each geometry edit and discard stale results.
///
/// Usage:
/// @code
/// AnalysisConfig config;
/// config.par.frictionK = physics.friction;
///
/// HoleAnalyzer analyzer(config);
/// ParEstimate estimate = analyzer.estimatePar(level, fairway);
/// ParSuggestions routes = analyzer.suggestParCandidates(level, fairway);
/// for (const auto& warning : analyzer.lintCup(level, fairway)) { ... }
/// @endcode
class HoleAnalyzer {
public:
    /// @param config Model tunables and call defaults
    /// @param pathFinder Search strategy (nullptr for WeightedAStarPathFinder)
    explicit HoleAnalyzer(AnalysisConfig config = {},
                          std::shared_ptr<IPathFinder> pathFinder = nullptr);

    const AnalysisConfig& config() const { return config_; }
    const IPathFinder& pathFinder() const { return *pathFinder_; }

    /// Rasterize a level over a fairway
    TerrainGrid buildGrid(const Level& level, const Rect& fairway, float cellSize) const;

    /// Search tee -> cup on a grid built for this level
    PathResult findPath(const Level& level, const TerrainGrid& grid) const;

    ParEstimate estimatePar(const Level& level, const Rect& fairway, float cellSize) const;
    ParEstimate estimatePar(const Level& level, const Rect& fairway) const {
        return estimatePar(level, fairway, config_.cellSize);
    }

    /// Up to `count` diverse routes, best first
    ParSuggestions suggestParCandidates(const Level& level, const Rect& fairway,
                                        float cellSize, int count) const;
    ParSuggestions suggestParCandidates(const Level& level, const Rect& fairway) const {
        return suggestParCandidates(level, fairway, config_.cellSize, config_.candidateCount);
    }

    /// Alternate cup positions, using the configured CupSuggestionOptions
    std::vector<CupCandidate> suggestCupPositions(const Level& level, const Rect& fairway,
                                                  float cellSize, int count) const;
    std::vector<CupCandidate> suggestCupPositions(const Level& level, const Rect& fairway) const {
        return suggestCupPositions(level, fairway, config_.cellSize, config_.cupSuggestionCount);
    }

    /// Warnings about the authored cup placement
    std::vector<std::string> lintCup(const Level& level, const Rect& fairway, float cellSize) const;
    std::vector<std::string> lintCup(const Level& level, const Rect& fairway) const {
        return lintCup(level, fairway, config_.cellSize);
    }

    /// Tee -> cup route with per-cell terrain flags, for overlay rendering
    PathPreview computePathPreview(const Level& level, const Rect& fairway, float cellSize) const;
    PathPreview computePathPreview(const Level& level, const Rect& fairway) const {
        return computePathPreview(level, fairway, config_.cellSize);
    }

private:
    AnalysisConfig config_;
    std::shared_ptr<IPathFinder> pathFinder_;
};

}  // namespace puttcraft
