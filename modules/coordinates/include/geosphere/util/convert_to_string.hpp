#pragma once

#include <string>
#include <Eigen/Core>

namespace geosphere {

class GeographicCoordinate;
class CartesianCoordinate;

std::string convert_to_string(const Eigen::Vector3d& v);
std::string convert_to_string(const GeographicCoordinate& coord);
std::string convert_to_string(const CartesianCoordinate& coord);

}  // namespace geosphere
