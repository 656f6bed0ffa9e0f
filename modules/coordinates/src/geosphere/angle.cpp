#include <geosphere/angle.hpp>

namespace geosphere {

double normalize_longitude(double deg) {
    if (deg > -kHalfTurn && deg <= kHalfTurn) {
        return deg;
    }

    // Euclidean remainder keeps the shifted value non-negative
    double shifted = std::fmod(deg + kHalfTurn, kFullTurn);
    if (shifted < 0.0) {
        shifted += kFullTurn;
    }

    const double wrapped = shifted - kHalfTurn;
    // Both boundaries are the same meridian; +180 is the canonical one
    return wrapped <= -kHalfTurn ? kHalfTurn : wrapped;
}

double normalize_radians(double rad) {
    if (rad >= 0.0 && rad < kTwoPi) {
        return rad;
    }

    double wrapped = std::fmod(rad, kTwoPi);
    if (wrapped < 0.0) {
        wrapped += kTwoPi;
    }

    // fmod of a tiny negative value can round back up to a full turn
    return wrapped >= kTwoPi ? 0.0 : wrapped;
}

void sin_cos_deg(double deg, double& sin_out, double& cos_out) {
    if (deg == 0.0) {
        sin_out = 0.0;
        cos_out = 1.0;
    } else if (std::abs(deg) == 90.0) {
        sin_out = std::copysign(1.0, deg);
        cos_out = 0.0;
    } else if (std::abs(deg) == kHalfTurn) {
        sin_out = 0.0;
        cos_out = -1.0;
    } else {
        const double rad = deg2rad(deg);
        sin_out = std::sin(rad);
        cos_out = std::cos(rad);
    }
}

}  // namespace geosphere
