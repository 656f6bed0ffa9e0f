#include <geosphere/converter.hpp>

#include <algorithm>
#include <cmath>

#include <geosphere/errors.hpp>
#include <geosphere/util/config.hpp>
#include <geosphere/util/convert_to_string.hpp>
#include <geosphere/util/logging.hpp>

namespace geosphere {

namespace {
    void validate_radius(double radius) {
        if (!std::isfinite(radius) || radius <= 0.0) {
            throw ValidationError("radius", radius, "must be finite and positive");
        }
    }
}

CartesianCoordinate to_cartesian(const GeographicCoordinate& geo, double radius) {
    validate_radius(radius);

    double sin_lat, cos_lat, sin_lon, cos_lon;
    sin_cos_deg(geo.latitude(), sin_lat, cos_lat);
    sin_cos_deg(geo.longitude(), sin_lon, cos_lon);

    // Distance from the center of the sphere
    const double r = radius + geo.altitude();
    if (!std::isfinite(r)) {
        throw ValidationError("altitude", geo.altitude(), "radius + altitude overflows");
    }

    const double x = r * cos_lat * cos_lon;
    const double y = r * cos_lat * sin_lon;
    const double z = r * sin_lat;

    return CartesianCoordinate(x, y, z);
}

GeographicCoordinate to_geographic(const CartesianCoordinate& cart, double radius) {
    validate_radius(radius);

    const double r = cart.norm();
    if (r == 0.0) {
        throw DegenerateCoordinateError("latitude and longitude are undefined at the origin");
    }

    // asin(z / r) written as atan2, which keeps full precision near the poles
    const double lat_rad = std::atan2(cart.z(), std::hypot(cart.x(), cart.y()));
    // atan2 recovers the quadrant, including x == 0
    const double lon = rad2deg(std::atan2(cart.y(), cart.x()));
    // pi/2 in degrees may round past 90
    const double lat = std::max(-kMaxLatitude, std::min(kMaxLatitude, rad2deg(lat_rad)));

    return GeographicCoordinate(lat, lon, r - radius);
}

SphereConverter::SphereConverter(double radius) : radius_(radius), logger_(create_module_logger("converter")) {
    validate_radius(radius_);
    logger_->info("Sphere converter radius={:.3f}", radius_);
}

SphereConverter::SphereConverter(const Config& config) : SphereConverter(config.param<double>("converter", "radius", kMeanEarthRadius)) {}

CartesianCoordinate SphereConverter::to_cartesian(const GeographicCoordinate& geo) const {
    return geosphere::to_cartesian(geo, radius_);
}

GeographicCoordinate SphereConverter::to_geographic(const CartesianCoordinate& cart) const {
    if (cart.is_origin()) {
        logger_->debug("Rejecting degenerate point {}", convert_to_string(cart));
    }
    return geosphere::to_geographic(cart, radius_);
}

}  // namespace geosphere
