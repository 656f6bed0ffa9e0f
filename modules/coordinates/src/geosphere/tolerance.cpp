#include <geosphere/tolerance.hpp>

#include <algorithm>
#include <cmath>

#include <geosphere/angle.hpp>
#include <geosphere/util/config.hpp>

namespace geosphere {

Tolerance Tolerance::from_config(const Config& config) {
    Tolerance tolerance;
    tolerance.absolute = config.param<double>("tolerance", "absolute", tolerance.absolute);
    tolerance.relative = config.param<double>("tolerance", "relative", tolerance.relative);
    tolerance.angle = config.param<double>("tolerance", "angle", tolerance.angle);
    return tolerance;
}

bool approx_equal(double a, double b, double absolute, double relative) {
    return std::abs(a - b) <= absolute + relative * std::max(std::abs(a), std::abs(b));
}

double angular_difference(double a_deg, double b_deg) {
    const double diff = std::fmod(std::abs(a_deg - b_deg), kFullTurn);
    return std::min(diff, kFullTurn - diff);
}

bool approx_equal(const GeographicCoordinate& a, const GeographicCoordinate& b, const Tolerance& tolerance) {
    if (std::abs(a.latitude() - b.latitude()) > tolerance.angle) {
        return false;
    }
    if (!approx_equal(a.altitude(), b.altitude(), tolerance.absolute, tolerance.relative)) {
        return false;
    }

    // Any longitude describes the same point at a pole
    const bool at_pole = kMaxLatitude - std::abs(a.latitude()) <= tolerance.angle &&
                         kMaxLatitude - std::abs(b.latitude()) <= tolerance.angle;
    if (at_pole) {
        return true;
    }

    return angular_difference(a.longitude(), b.longitude()) <= tolerance.angle;
}

bool approx_equal(const CartesianCoordinate& a, const CartesianCoordinate& b, const Tolerance& tolerance) {
    const double diff = (a.vector() - b.vector()).stableNorm();
    return diff <= tolerance.absolute + tolerance.relative * std::max(a.norm(), b.norm());
}

}  // namespace geosphere
