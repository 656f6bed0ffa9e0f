#include <geosphere/rotation.hpp>

#include <cmath>

#include <geosphere/angle.hpp>
#include <geosphere/errors.hpp>

namespace geosphere {

Eigen::Vector3d axis_vector(Axis axis) {
    switch (axis) {
        case Axis::X:
            return Eigen::Vector3d::UnitX();
        case Axis::Y:
            return Eigen::Vector3d::UnitY();
        case Axis::Z:
            return Eigen::Vector3d::UnitZ();
    }
    throw Error("unknown rotation axis");
}

Rotation::Rotation(const Eigen::Vector3d& axis, double angle) {
    if (!axis.allFinite()) {
        throw ValidationError("axis", axis.norm(), "must be finite");
    }
    if (!std::isfinite(angle)) {
        throw ValidationError("angle", angle, "must be finite");
    }

    angle_ = normalize_radians(angle);

    if (axis.isZero(0.0)) {
        axis_ = Eigen::Vector3d::Zero();
        R_.setIdentity();
        return;
    }

    axis_ = axis.stableNormalized();
    R_ = Eigen::AngleAxisd(angle_, axis_).toRotationMatrix();
}

Rotation Rotation::noop() {
    return Rotation(Eigen::Vector3d::Zero(), 0.0);
}

Rotation Rotation::about(Axis axis, double angle) {
    return Rotation(axis_vector(axis), angle);
}

CartesianCoordinate Rotation::transform(const CartesianCoordinate& point) const {
    return CartesianCoordinate(R_ * point.vector());
}

}  // namespace geosphere
