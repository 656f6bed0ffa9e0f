#include <geosphere/cartesian.hpp>

#include <cmath>
#include <ostream>

#include <geosphere/errors.hpp>
#include <geosphere/util/convert_to_string.hpp>

namespace geosphere {

namespace {
    const char* const kAxisNames[] = {"x", "y", "z"};
}

CartesianCoordinate::CartesianCoordinate(double x, double y, double z)
    : CartesianCoordinate(Eigen::Vector3d(x, y, z)) {}

CartesianCoordinate::CartesianCoordinate(const Eigen::Vector3d& xyz) : xyz_(xyz) {
    for (int i = 0; i < 3; ++i) {
        if (!std::isfinite(xyz_[i])) {
            throw ValidationError(kAxisNames[i], xyz_[i], "must be finite");
        }
    }
}

double CartesianCoordinate::norm() const {
    return std::hypot(xyz_.x(), xyz_.y(), xyz_.z());
}

std::ostream& operator<<(std::ostream& os, const CartesianCoordinate& coord) {
    return os << convert_to_string(coord);
}

}  // namespace geosphere
