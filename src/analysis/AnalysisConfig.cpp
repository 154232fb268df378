#include "puttcraft/analysis/config/AnalysisConfig.h"
#include "puttcraft/common/Logger.h"

#include <nlohmann/json.hpp>
#include <algorithm>
#include <cmath>

using json = nlohmann::json;

namespace puttcraft {

// ============================================================================
// ParModelConfig
// ============================================================================

float ParModelConfig::effectiveShotPx() const {
    const float refK = std::max(minFrictionK, referenceFrictionK);
    const float k = std::max(minFrictionK, frictionK);
    return baselineShotPx * (refK / k);
}

int ParModelConfig::parForStrokes(float strokes) const {
    if (std::isnan(strokes)) {
        return maxPar;
    }
    // Clamp before rounding so an infinite estimate stays representable
    const float par = std::clamp(strokes + 1.0f, static_cast<float>(minPar), static_cast<float>(maxPar));
    return std::clamp(static_cast<int>(std::lround(par)), minPar, maxPar);
}

// ============================================================================
// JSON Serialization
// ============================================================================

namespace {

template <typename T>
void readNumber(const json& j, const char* key, T& out) {
    if (j.contains(key) && j[key].is_number()) {
        out = j[key].get<T>();
    }
}

/// Shot distances divide the path length; zero or negative values keep the default
void readShotDistance(const json& j, const char* key, float& out) {
    if (!j.contains(key) || !j[key].is_number()) {
        return;
    }
    const float value = j[key].get<float>();
    if (!(value > 0.0f) || !std::isfinite(value)) {
        LOG_WARN("ignoring {}={}, expected a positive distance", key, value);
        return;
    }
    out = value;
}

template <typename T>
void readOptionalNumber(const json& j, const char* key, std::optional<T>& out) {
    if (j.contains(key) && j[key].is_number()) {
        out = j[key].get<T>();
    }
}

json parToJson(const ParModelConfig& par) {
    json j;
    j["baselineShotPx"] = par.baselineShotPx;
    j["referenceFrictionK"] = par.referenceFrictionK;
    j["frictionK"] = par.frictionK;
    j["minFrictionK"] = par.minFrictionK;
    j["sandFrictionMultiplier"] = par.sandFrictionMultiplier;
    j["sandPenaltyPerCell"] = par.sandPenaltyPerCell;
    j["turnPenaltyPerTurn"] = par.turnPenaltyPerTurn;
    j["turnPenaltyMax"] = par.turnPenaltyMax;
    j["bankWeight"] = par.bankWeight;
    j["bankPenaltyMax"] = par.bankPenaltyMax;
    j["hillBump"] = par.hillBump;
    j["downhillBonusFactor"] = par.downhillBonusFactor;
    j["downhillBonusMax"] = par.downhillBonusMax;
    j["autoAssistMomentumThreshold"] = par.autoAssistMomentumThreshold;
    j["autoAssistBonus"] = par.autoAssistBonus;
    j["autoAssistSegmentThreshold"] = par.autoAssistSegmentThreshold;
    j["autoAssistSegmentMomentum"] = par.autoAssistSegmentMomentum;
    j["minStrokes"] = par.minStrokes;
    j["fallbackShotPx"] = par.fallbackShotPx;
    j["fallbackObstacleWeight"] = par.fallbackObstacleWeight;
    j["minPar"] = par.minPar;
    j["maxPar"] = par.maxPar;
    return j;
}

void parFromJson(const json& j, ParModelConfig& par) {
    readShotDistance(j, "baselineShotPx", par.baselineShotPx);
    readNumber(j, "referenceFrictionK", par.referenceFrictionK);
    readNumber(j, "frictionK", par.frictionK);
    readNumber(j, "minFrictionK", par.minFrictionK);
    readNumber(j, "sandFrictionMultiplier", par.sandFrictionMultiplier);
    readNumber(j, "sandPenaltyPerCell", par.sandPenaltyPerCell);
    readNumber(j, "turnPenaltyPerTurn", par.turnPenaltyPerTurn);
    readNumber(j, "turnPenaltyMax", par.turnPenaltyMax);
    readNumber(j, "bankWeight", par.bankWeight);
    readNumber(j, "bankPenaltyMax", par.bankPenaltyMax);
    readNumber(j, "hillBump", par.hillBump);
    readNumber(j, "downhillBonusFactor", par.downhillBonusFactor);
    readNumber(j, "downhillBonusMax", par.downhillBonusMax);
    readNumber(j, "autoAssistMomentumThreshold", par.autoAssistMomentumThreshold);
    readNumber(j, "autoAssistBonus", par.autoAssistBonus);
    readNumber(j, "autoAssistSegmentThreshold", par.autoAssistSegmentThreshold);
    readNumber(j, "autoAssistSegmentMomentum", par.autoAssistSegmentMomentum);
    readNumber(j, "minStrokes", par.minStrokes);
    readShotDistance(j, "fallbackShotPx", par.fallbackShotPx);
    readNumber(j, "fallbackObstacleWeight", par.fallbackObstacleWeight);
    readNumber(j, "minPar", par.minPar);
    readNumber(j, "maxPar", par.maxPar);
}

json cupsToJson(const CupSuggestionOptions& cups) {
    json j;
    if (cups.edgeMargin.has_value()) {
        j["edgeMargin"] = cups.edgeMargin.value();
    }
    j["minStraightnessRatio"] = cups.minStraightnessRatio;
    j["minTurns"] = cups.minTurns;
    if (cups.minDistancePx.has_value()) {
        j["minDistancePx"] = cups.minDistancePx.value();
    }
    if (cups.bankWeight.has_value()) {
        j["bankWeight"] = cups.bankWeight.value();
    }
    j["minSeparationCells"] = cups.minSeparationCells;

    if (!cups.regionPolygon.empty()) {
        json region = json::array();
        for (const auto& p : cups.regionPolygon) {
            region.push_back({p.x, p.y});
        }
        j["regionPolygon"] = region;
    }
    return j;
}

void cupsFromJson(const json& j, CupSuggestionOptions& cups) {
    readOptionalNumber(j, "edgeMargin", cups.edgeMargin);
    readNumber(j, "minStraightnessRatio", cups.minStraightnessRatio);
    readNumber(j, "minTurns", cups.minTurns);
    readOptionalNumber(j, "minDistancePx", cups.minDistancePx);
    readOptionalNumber(j, "bankWeight", cups.bankWeight);
    readNumber(j, "minSeparationCells", cups.minSeparationCells);

    if (j.contains("regionPolygon") && j["regionPolygon"].is_array()) {
        for (const auto& pj : j["regionPolygon"]) {
            if (pj.is_array() && pj.size() == 2 && pj[0].is_number() && pj[1].is_number()) {
                cups.regionPolygon.emplace_back(pj[0].get<float>(), pj[1].get<float>());
            }
        }
    }
}

}  // namespace

std::string AnalysisConfigSerializer::toJson(const AnalysisConfig& config) {
    json j;
    j["par"] = parToJson(config.par);
    j["cups"] = cupsToJson(config.cups);
    j["cellSize"] = config.cellSize;
    j["candidateCount"] = config.candidateCount;
    j["cupSuggestionCount"] = config.cupSuggestionCount;
    return j.dump(2);
}

AnalysisConfig AnalysisConfigSerializer::fromJson(const std::string& jsonStr) {
    AnalysisConfig config;

    try {
        json j = json::parse(jsonStr);
        if (!j.is_object()) {
            LOG_WARN("analysis config is not a JSON object, using defaults");
            return {};
        }

        if (j.contains("par") && j["par"].is_object()) {
            parFromJson(j["par"], config.par);
        }
        if (j.contains("cups") && j["cups"].is_object()) {
            cupsFromJson(j["cups"], config.cups);
        }
        readNumber(j, "cellSize", config.cellSize);
        readNumber(j, "candidateCount", config.candidateCount);
        readNumber(j, "cupSuggestionCount", config.cupSuggestionCount);
    } catch (const json::exception& e) {
        LOG_WARN("failed to parse analysis config: {}", e.what());
        return {};
    }

    return config;
}

}  // namespace puttcraft
