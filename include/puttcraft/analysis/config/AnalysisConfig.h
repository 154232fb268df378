#pragma once

#include "puttcraft/core/Types.h"

#include <optional>
#include <string>
#include <vector>

namespace puttcraft {

/// Stroke model tunables shared by the par estimator and the K-best diversifier
///
/// Base strokes are pathLengthPx / D with
/// D = baselineShotPx * (referenceFrictionK / frictionK), so a livelier green
/// (lower friction) carries each shot further. Terrain and shape penalties
/// are then added and slope assistance subtracted.
///
/// Usage:
/// @code
/// ParModelConfig par;
/// par.frictionK = physics.friction;   // live gameplay value
/// par.sandFrictionMultiplier = physics.sandMultiplier;
/// @endcode
struct ParModelConfig {
    // === Shot distance ===

    /// Effective pixels travelled per stroke at referenceFrictionK
    float baselineShotPx = 320.0f;

    /// Friction coefficient baselineShotPx was tuned for
    float referenceFrictionK = 1.2f;

    /// Live friction coefficient of the ball physics
    float frictionK = 1.2f;

    /// Lower bound applied to both friction constants
    float minFrictionK = 0.05f;

    // === Terrain penalties ===

    /// Gameplay sand friction multiplier; sand penalty scales by this / 6
    float sandFrictionMultiplier = 6.0f;

    /// Strokes added per sand cell on the path (at multiplier 6)
    float sandPenaltyPerCell = 0.01f;

    /// Strokes added per direction change
    float turnPenaltyPerTurn = 0.08f;
    float turnPenaltyMax = 1.5f;

    /// Strokes per average blocked neighbor along the path (corridor contact)
    float bankWeight = 0.12f;
    float bankPenaltyMax = 1.0f;

    /// Strokes added when the path crosses slopes, scaled by coverage
    float hillBump = 0.15f;

    // === Slope assistance (K-best candidates) ===

    /// Strokes removed per unit of downhill momentum
    float downhillBonusFactor = 0.18f;
    float downhillBonusMax = 1.6f;

    /// Net momentum (downhill - uphill) above which the ball free-rolls
    float autoAssistMomentumThreshold = 1.35f;

    /// Strokes removed when auto-assist triggers
    float autoAssistBonus = 0.45f;

    /// Auto-assist segments that trigger the bonus on their own
    int autoAssistSegmentThreshold = 3;

    /// Single-step downhill contribution that counts as an auto-assist segment
    float autoAssistSegmentMomentum = 0.6f;

    /// Floor for slope-adjusted stroke estimates
    float minStrokes = 0.35f;

    // === Unreachable fallback ===

    /// Pixels per stroke for the straight-line fallback
    float fallbackShotPx = 260.0f;

    /// Strokes added per wall/water shape in the fallback
    float fallbackObstacleWeight = 0.3f;

    // === Par clamp ===

    int minPar = 2;
    int maxPar = 7;

    /// Effective shot distance D after friction scaling
    float effectiveShotPx() const;

    /// round(strokes + 1) clamped into [minPar, maxPar]
    int parForStrokes(float strokes) const;
};

/// Options for alternate cup placement suggestions
///
/// Unset values are derived per call from the cell size and fairway.
struct CupSuggestionOptions {
    /// Distance kept from the fairway boundary (default max(20, 2*cellSize))
    std::optional<float> edgeMargin;

    /// Path length must be at least this multiple of the straight distance
    float minStraightnessRatio = 1.08f;

    /// Minimum direction changes along the path
    int minTurns = 0;

    /// Minimum tee distance (default 25% of the fairway's larger side)
    std::optional<float> minDistancePx;

    /// Score per blocked neighbor along the path (default 0.5*cellSize)
    std::optional<float> bankWeight;

    /// Minimum spacing between returned candidates, in cells
    float minSeparationCells = 6.0f;

    /// Candidates must lie inside this polygon when it is non-empty; fewer
    /// than 3 vertices contain no point
    std::vector<Point> regionPolygon;
};

/// Complete configuration for HoleAnalyzer
struct AnalysisConfig {
    ParModelConfig par;
    CupSuggestionOptions cups;

    /// Cell size used by the analyzer's convenience overloads
    float cellSize = 20.0f;

    /// Number of K-best candidates requested by default
    int candidateCount = 3;

    /// Number of cup suggestions requested by default
    int cupSuggestionCount = 5;
};

/// JSON serialization for AnalysisConfig
///
/// Keys mirror the field names. fromJson keeps defaults for absent or
/// mistyped keys and returns a default config for malformed input.
class AnalysisConfigSerializer {
public:
    static std::string toJson(const AnalysisConfig& config);
    static AnalysisConfig fromJson(const std::string& json);
};

}  // namespace puttcraft
