#pragma once

#include <Eigen/Core>
#include <Eigen/Geometry>

#include <geosphere/cartesian.hpp>

namespace geosphere {

enum class Axis { X, Y, Z };

/**
 * @brief Unit vector of a coordinate axis
 */
Eigen::Vector3d axis_vector(Axis axis);

/**
 * @brief Right-hand rotation of Cartesian points about an axis through the origin
 *
 * The angle is wrapped into [0, 2pi). A zero axis rotates nothing.
 */
class Rotation {
public:
    /**
     * @brief Constructor
     * @param axis Rotation axis (normalized internally, may be zero)
     * @param angle Rotation angle in radians
     * @throw ValidationError if the axis or the angle is not finite
     */
    Rotation(const Eigen::Vector3d& axis, double angle);

    /**
     * @brief Rotation that leaves every point unchanged
     */
    static Rotation noop();

    static Rotation about(Axis axis, double angle);

    const Eigen::Vector3d& axis() const { return axis_; }
    double angle() const { return angle_; }

    CartesianCoordinate transform(const CartesianCoordinate& point) const;

private:
    Eigen::Vector3d axis_;
    double angle_;
    Eigen::Matrix3d R_;
};

}  // namespace geosphere
