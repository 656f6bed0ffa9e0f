#pragma once

#include <geosphere/cartesian.hpp>
#include <geosphere/geographic.hpp>

namespace geosphere {

class Config;

/**
 * @brief Bounds for comparing coordinates that went through floating-point conversions
 */
struct Tolerance {
    double absolute = 1e-6;  // Length units
    double relative = 1e-9;  // Fraction of the larger magnitude
    double angle = 1e-9;     // Degrees

    /**
     * @brief Load the "tolerance" section of a config, keeping defaults for missing keys
     */
    static Tolerance from_config(const Config& config);
};

/**
 * @brief |a - b| <= absolute + relative * max(|a|, |b|)
 */
bool approx_equal(double a, double b, double absolute, double relative);

/**
 * @brief Smallest difference between two angles on the circle
 * @param a_deg First angle in degrees
 * @param b_deg Second angle in degrees
 * @return Difference in [0, 180] degrees
 */
double angular_difference(double a_deg, double b_deg);

/**
 * @brief Compare two geographic coordinates
 *
 * Longitudes are compared around the circle (180 and -179.9999999999 are close).
 * When both points lie at the same pole the longitude is not compared.
 */
bool approx_equal(const GeographicCoordinate& a, const GeographicCoordinate& b, const Tolerance& tolerance = Tolerance());

/**
 * @brief Compare two Cartesian coordinates by the length of their difference
 */
bool approx_equal(const CartesianCoordinate& a, const CartesianCoordinate& b, const Tolerance& tolerance = Tolerance());

}  // namespace geosphere
