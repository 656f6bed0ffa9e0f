#pragma once

#include <cmath>

namespace geosphere {

// Sphere parameters
constexpr double kPi = 3.14159265358979323846;
constexpr double kTwoPi = 2.0 * kPi;
constexpr double kMeanEarthRadius = 6371000.0;  // Mean Earth radius in meters

// Geographic ranges (degrees)
constexpr double kMaxLatitude = 90.0;
constexpr double kHalfTurn = 180.0;
constexpr double kFullTurn = 360.0;

inline double deg2rad(double deg) {
    return deg * kPi / 180.0;
}

inline double rad2deg(double rad) {
    return rad * 180.0 / kPi;
}

/**
 * @brief Wrap a longitude into the canonical range (-180, 180]
 *
 * Values already inside the range are returned unchanged, so wrapping twice
 * gives the same result as wrapping once. -180 is folded to +180.
 *
 * @param deg Longitude in degrees (must be finite)
 * @return Equivalent longitude in (-180, 180] degrees
 */
double normalize_longitude(double deg);

/**
 * @brief Wrap an angle into a single full turn [0, 2pi)
 * @param rad Angle in radians (must be finite)
 * @return Equivalent angle in [0, 2pi) radians
 */
double normalize_radians(double rad);

/**
 * @brief Check that a latitude is finite and within [-90, 90]
 * @param deg Latitude in degrees
 */
inline bool is_valid_latitude(double deg) {
    return std::isfinite(deg) && deg >= -kMaxLatitude && deg <= kMaxLatitude;
}

/**
 * @brief Sine and cosine of an angle given in degrees
 *
 * Quadrant angles (0, +-90, +-180) return exact values instead of the rounded
 * results of std::sin/std::cos, so that axis-aligned points convert to exact zeros.
 *
 * @param deg Angle in degrees
 * @param sin_out Sine of the angle
 * @param cos_out Cosine of the angle
 */
void sin_cos_deg(double deg, double& sin_out, double& cos_out);

}  // namespace geosphere
