#pragma once

#include <iosfwd>
#include <Eigen/Core>

namespace geosphere {

/**
 * @brief Point given by (x, y, z) offsets from the center of the reference sphere
 *
 * Any finite triple is valid. The x axis points to latitude 0 / longitude 0,
 * the y axis to longitude 90 east and the z axis to the north pole.
 */
class CartesianCoordinate {
public:
    /**
     * @brief The origin (0, 0, 0)
     */
    CartesianCoordinate() : xyz_(Eigen::Vector3d::Zero()) {}

    /**
     * @brief Validating constructor
     * @throw ValidationError if any component is NaN or infinite
     */
    CartesianCoordinate(double x, double y, double z);

    /**
     * @brief Construct from an Eigen vector
     * @throw ValidationError if any component is NaN or infinite
     */
    explicit CartesianCoordinate(const Eigen::Vector3d& xyz);

    static CartesianCoordinate origin() { return CartesianCoordinate(); }

    double x() const { return xyz_.x(); }
    double y() const { return xyz_.y(); }
    double z() const { return xyz_.z(); }
    const Eigen::Vector3d& vector() const { return xyz_; }

    /**
     * @brief Distance from the origin (scaled to avoid under/overflow of the squares)
     */
    double norm() const;

    bool is_origin() const { return xyz_.isZero(0.0); }

    bool operator==(const CartesianCoordinate& other) const { return xyz_ == other.xyz_; }
    bool operator!=(const CartesianCoordinate& other) const { return !(*this == other); }

private:
    Eigen::Vector3d xyz_;
};

std::ostream& operator<<(std::ostream& os, const CartesianCoordinate& coord);

}  // namespace geosphere
