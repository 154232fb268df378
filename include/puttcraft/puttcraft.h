#pragma once

/// @file puttcraft.h
/// @brief Main header for the puttcraft hole analysis library
///
/// puttcraft turns hand-authored mini-golf hole geometry into a terrain
/// grid, searches it, and derives difficulty estimates for level editors.
///
/// Example usage:
/// @code
/// #include <puttcraft/puttcraft.h>
///
/// puttcraft::Level level;
/// level.tee = {60, 300};
/// level.cup.position = {740, 300};
/// level.walls.push_back(puttcraft::Rect{400, 60, 20, 540});
///
/// puttcraft::HoleAnalyzer analyzer;
/// auto estimate = analyzer.estimatePar(level, {0, 0, 800, 600});
/// @endcode

// Core module - Level geometry
#include "core/Types.h"
#include "core/Shape.h"
#include "core/Level.h"

// Analysis module - Grid, search and estimators
#include "analysis/TerrainGrid.h"
#include "analysis/IPathFinder.h"
#include "analysis/config/AnalysisConfig.h"
#include "analysis/config/AnalysisResult.h"
#include "analysis/HoleAnalyzer.h"

#include <string>

namespace puttcraft {

/// Library version
constexpr int VERSION_MAJOR = 0;
constexpr int VERSION_MINOR = 1;
constexpr int VERSION_PATCH = 0;

/// Get version as string (computed from constants)
inline std::string versionString() {
    return std::to_string(VERSION_MAJOR) + "." +
           std::to_string(VERSION_MINOR) + "." +
           std::to_string(VERSION_PATCH);
}

}  // namespace puttcraft
