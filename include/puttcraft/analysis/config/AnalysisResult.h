#pragma once

#include "puttcraft/core/Types.h"

#include <string>
#include <vector>

namespace puttcraft {

/// Single-path par suggestion
struct ParEstimate {
    bool reachable = false;
    int suggestedPar = 2;               ///< Always within [minPar, maxPar]
    float pathLengthPx = 0.0f;          ///< Straight-line distance when unreachable
    std::vector<std::string> notes;     ///< Human-readable diagnostics
};

/// One route proposed by the K-best diversifier, with its metrics
struct CandidatePath {
    std::vector<GridPoint> path;
    std::vector<Point> worldPoints;     ///< Cell centers along the path
    float lengthPx = 0.0f;
    int turns = 0;
    float corridorContact = 0.0f;       ///< Average blocked neighbors per path cell
    int sandCells = 0;
    int slopeCells = 0;
    float downhillMomentum = 0.0f;
    float uphillResistance = 0.0f;
    int autoAssistSegments = 0;
    float strokes = 0.0f;
    int par = 2;
};

/// Result of K-best par suggestion
struct ParSuggestions {
    std::vector<CandidatePath> candidates;  ///< Ascending by strokes, then length
    int bestIndex = -1;                     ///< 0 when candidates exist, -1 otherwise
    int par = 2;
};

/// Alternate cup placement
struct CupCandidate {
    Point position;
    float score = 0.0f;
    float lengthPx = 0.0f;
    int turns = 0;
};

/// Tee-to-cup route for overlay rendering
struct PathPreview {
    bool found = false;
    std::vector<GridPoint> pathCells;
    std::vector<Point> worldPoints;     ///< Polyline through cell centers
    std::vector<bool> sandAt;           ///< Parallel to pathCells
    std::vector<bool> slopeAt;          ///< Parallel to pathCells
    float cellSize = 0.0f;
    int cols = 0;
    int rows = 0;
};

}  // namespace puttcraft
