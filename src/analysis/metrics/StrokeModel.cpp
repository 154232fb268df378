#include "StrokeModel.h"

#include <algorithm>
#include <cmath>

namespace puttcraft {

float StrokeModel::baseStrokes(const PathSummary& summary) const {
    float strokes = summary.lengthPx / config_.effectiveShotPx();

    const float sandPenalty = summary.sandCells * config_.sandPenaltyPerCell *
                              (config_.sandFrictionMultiplier / 6.0f);
    const float turnPenalty = std::min(config_.turnPenaltyMax,
                                       summary.turns * config_.turnPenaltyPerTurn);
    const float bankPenalty = std::min(config_.bankPenaltyMax,
                                       summary.corridorContact * config_.bankWeight);
    strokes += sandPenalty + turnPenalty + bankPenalty;

    if (summary.slopeCells > 0) {
        const int halfPath = std::max(1, summary.cellCount / 2);
        const float coverage = std::min(1.0f, static_cast<float>(summary.slopeCells) / halfPath);
        strokes += config_.hillBump * (0.5f + 0.5f * coverage);
    }
    return strokes;
}

float StrokeModel::applySlopeAssist(float strokes, const TraversalAnalysis& traversal) const {
    if (traversal.downhillMomentum <= 0.0f) {
        return strokes;
    }

    const float downhillBonus = std::min(config_.downhillBonusMax,
                                         traversal.downhillMomentum * config_.downhillBonusFactor);
    strokes = std::max(config_.minStrokes, strokes - downhillBonus);

    const float netMomentum = traversal.downhillMomentum - traversal.uphillResistance;
    if (traversal.autoAssistSegments >= config_.autoAssistSegmentThreshold ||
        netMomentum > config_.autoAssistMomentumThreshold) {
        strokes = std::max(config_.minStrokes, strokes - config_.autoAssistBonus);
    }
    return strokes;
}

int StrokeModel::fallbackPar(float straightDistancePx, size_t obstacleCount) const {
    const float strokes = straightDistancePx / config_.fallbackShotPx +
                          static_cast<float>(obstacleCount) * config_.fallbackObstacleWeight;
    if (std::isnan(strokes)) {
        return config_.maxPar;
    }
    const float clamped = std::clamp(strokes, static_cast<float>(config_.minPar),
                                     static_cast<float>(config_.maxPar));
    return std::clamp(static_cast<int>(std::lround(clamped)), config_.minPar, config_.maxPar);
}

}  // namespace puttcraft
