#pragma once

#include "PathMetrics.h"
#include "puttcraft/analysis/config/AnalysisConfig.h"

namespace puttcraft {

/// Converts path measurements into stroke estimates
///
/// strokes = lengthPx / D + sand + turn + corridor (+ slope bump)
/// where every penalty and cap comes from ParModelConfig.
class StrokeModel {
public:
    explicit StrokeModel(const ParModelConfig& config) : config_(config) {}

    /// Strokes for a path, before slope assistance
    float baseStrokes(const PathSummary& summary) const;

    /// Subtract downhill and auto-assist bonuses (floored at minStrokes)
    float applySlopeAssist(float strokes, const TraversalAnalysis& traversal) const;

    /// Straight-line estimate used when no path exists
    int fallbackPar(float straightDistancePx, size_t obstacleCount) const;

    int parForStrokes(float strokes) const { return config_.parForStrokes(strokes); }

    const ParModelConfig& config() const { return config_; }

private:
    ParModelConfig config_;
};

}  // namespace puttcraft
