#pragma once

#include <memory>
#include <spdlog/spdlog.h>

#include <geosphere/angle.hpp>
#include <geosphere/cartesian.hpp>
#include <geosphere/geographic.hpp>

namespace geosphere {

class Config;

/**
 * @brief Convert geographic coordinates on a sphere to Cartesian coordinates
 * @param geo Geographic coordinates (latitude, longitude in degrees, altitude above the sphere)
 * @param radius Sphere radius (default = mean Earth radius in meters)
 * @return Cartesian coordinates (x, y, z) in the unit of the radius
 * @throw ValidationError if the radius is not finite and positive,
 *        or if radius + altitude overflows (field "altitude")
 */
CartesianCoordinate to_cartesian(const GeographicCoordinate& geo, double radius = kMeanEarthRadius);

/**
 * @brief Convert Cartesian coordinates to geographic coordinates on a sphere
 * @param cart Cartesian coordinates (x, y, z)
 * @param radius Sphere radius (default = mean Earth radius in meters)
 * @return Geographic coordinates with latitude, longitude in degrees
 * @throw DegenerateCoordinateError if cart is the origin
 * @throw ValidationError if the radius is not finite and positive
 */
GeographicCoordinate to_geographic(const CartesianCoordinate& cart, double radius = kMeanEarthRadius);

/**
 * @brief Converter bound to a single sphere
 */
class SphereConverter {
public:
    /**
     * @brief Constructor
     * @param radius Sphere radius at altitude 0
     * @throw ValidationError if the radius is not finite and positive
     */
    explicit SphereConverter(double radius = kMeanEarthRadius);

    /**
     * @brief Construct from the "converter" section of a config
     */
    explicit SphereConverter(const Config& config);

    double radius() const { return radius_; }

    CartesianCoordinate to_cartesian(const GeographicCoordinate& geo) const;
    GeographicCoordinate to_geographic(const CartesianCoordinate& cart) const;

private:
    double radius_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace geosphere
