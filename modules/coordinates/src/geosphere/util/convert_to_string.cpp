#include <geosphere/util/convert_to_string.hpp>

#include <boost/format.hpp>

#include <geosphere/cartesian.hpp>
#include <geosphere/geographic.hpp>

namespace geosphere {

std::string convert_to_string(const Eigen::Vector3d& v) {
    return (boost::format("(%.6f, %.6f, %.6f)") % v.x() % v.y() % v.z()).str();
}

std::string convert_to_string(const GeographicCoordinate& coord) {
    return (boost::format("lat=%.9f lon=%.9f alt=%.3f") % coord.latitude() % coord.longitude() % coord.altitude()).str();
}

std::string convert_to_string(const CartesianCoordinate& coord) {
    return convert_to_string(coord.vector());
}

}  // namespace geosphere
