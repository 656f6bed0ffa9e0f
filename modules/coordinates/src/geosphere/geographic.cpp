#include <geosphere/geographic.hpp>

#include <algorithm>
#include <cmath>
#include <ostream>

#include <geosphere/angle.hpp>
#include <geosphere/errors.hpp>
#include <geosphere/util/convert_to_string.hpp>

namespace geosphere {

GeographicCoordinate::GeographicCoordinate(double latitude, double longitude, double altitude) {
    if (!std::isfinite(latitude)) {
        throw ValidationError("latitude", latitude, "must be finite");
    }
    if (latitude < -kMaxLatitude || latitude > kMaxLatitude) {
        throw ValidationError("latitude", latitude, "must be within [-90, 90] degrees");
    }
    if (!std::isfinite(longitude)) {
        throw ValidationError("longitude", longitude, "must be finite");
    }
    if (!std::isfinite(altitude)) {
        throw ValidationError("altitude", altitude, "must be finite");
    }

    latitude_ = latitude;
    longitude_ = normalize_longitude(longitude);
    altitude_ = altitude;
}

GeographicCoordinate GeographicCoordinate::from_radians(double latitude, double longitude, double altitude) {
    double latitude_deg = rad2deg(latitude);
    // pi/2 does not convert to exactly 90 degrees
    if (std::abs(latitude) <= kPi / 2.0) {
        latitude_deg = std::max(-kMaxLatitude, std::min(kMaxLatitude, latitude_deg));
    }
    return GeographicCoordinate(latitude_deg, rad2deg(longitude), altitude);
}

double GeographicCoordinate::latitude_rad() const {
    return deg2rad(latitude_);
}

double GeographicCoordinate::longitude_rad() const {
    return deg2rad(longitude_);
}

bool GeographicCoordinate::is_pole() const {
    return std::abs(latitude_) == kMaxLatitude;
}

bool GeographicCoordinate::operator==(const GeographicCoordinate& other) const {
    return latitude_ == other.latitude_ && longitude_ == other.longitude_ && altitude_ == other.altitude_;
}

std::ostream& operator<<(std::ostream& os, const GeographicCoordinate& coord) {
    return os << convert_to_string(coord);
}

}  // namespace geosphere
