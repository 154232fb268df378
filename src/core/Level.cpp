#include "puttcraft/core/Level.h"
#include "puttcraft/core/GeometryUtils.h"

#include <algorithm>
#include <cctype>
#include <string>

namespace puttcraft {

CompassDirection parseCompassDirection(std::string_view text) {
    std::string upper;
    upper.reserve(text.size());
    for (char c : text) {
        upper += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }

    if (upper == "N") return CompassDirection::N;
    if (upper == "NE") return CompassDirection::NE;
    if (upper == "E") return CompassDirection::E;
    if (upper == "SE") return CompassDirection::SE;
    if (upper == "S") return CompassDirection::S;
    if (upper == "SW") return CompassDirection::SW;
    if (upper == "W") return CompassDirection::W;
    if (upper == "NW") return CompassDirection::NW;
    return CompassDirection::None;
}

Point compassVector(CompassDirection dir) {
    using constants::SQRT1_2;
    switch (dir) {
        case CompassDirection::N:  return {0.0f, -1.0f};
        case CompassDirection::S:  return {0.0f, 1.0f};
        case CompassDirection::W:  return {-1.0f, 0.0f};
        case CompassDirection::E:  return {1.0f, 0.0f};
        case CompassDirection::NW: return {-SQRT1_2, -SQRT1_2};
        case CompassDirection::NE: return {SQRT1_2, -SQRT1_2};
        case CompassDirection::SW: return {-SQRT1_2, SQRT1_2};
        case CompassDirection::SE: return {SQRT1_2, SQRT1_2};
        default:                   return {0.0f, 0.0f};
    }
}

float SlopeField::clampedStrength() const {
    return std::clamp(strength, MIN_STRENGTH, MAX_STRENGTH);
}

}  // namespace puttcraft
