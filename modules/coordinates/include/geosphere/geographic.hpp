#pragma once

#include <iosfwd>

namespace geosphere {

/**
 * @brief Point given by latitude, longitude and altitude above a reference sphere
 *
 * Angles are stored in degrees. After construction the latitude is in [-90, 90] and
 * the longitude in (-180, 180]. Latitude outside its range is rejected, while
 * longitude is wrapped, since wrapping latitude past a pole would also flip the longitude.
 */
class GeographicCoordinate {
public:
    /**
     * @brief Origin of the geographic frame (0, 0, 0)
     */
    GeographicCoordinate() = default;

    /**
     * @brief Validating constructor
     * @param latitude Latitude in degrees, within [-90, 90]
     * @param longitude Longitude in degrees, any finite value (wrapped into (-180, 180])
     * @param altitude Signed height above the reference sphere
     * @throw ValidationError if a field is non-finite or the latitude is out of range
     */
    GeographicCoordinate(double latitude, double longitude, double altitude);

    /**
     * @brief Construct from angles given in radians
     * @param latitude Latitude in radians, within [-pi/2, pi/2]
     * @param longitude Longitude in radians
     * @param altitude Signed height above the reference sphere
     * @throw ValidationError if a field is non-finite or the latitude is out of range
     */
    static GeographicCoordinate from_radians(double latitude, double longitude, double altitude);

    double latitude() const { return latitude_; }
    double longitude() const { return longitude_; }
    double altitude() const { return altitude_; }

    double latitude_rad() const;
    double longitude_rad() const;

    /**
     * @brief True at either pole, where the longitude carries no information
     */
    bool is_pole() const;

    bool operator==(const GeographicCoordinate& other) const;
    bool operator!=(const GeographicCoordinate& other) const { return !(*this == other); }

private:
    double latitude_ = 0.0;
    double longitude_ = 0.0;
    double altitude_ = 0.0;
};

std::ostream& operator<<(std::ostream& os, const GeographicCoordinate& coord);

}  // namespace geosphere
