#pragma once

#include <stdexcept>
#include <string>

namespace geosphere {

/**
 * @brief Base class of all errors raised by geosphere
 */
class Error : public std::runtime_error {
public:
    explicit Error(const std::string& what) : std::runtime_error(what) {}
};

/**
 * @brief A numeric field is outside its domain (non-finite, latitude out of range, bad radius)
 */
class ValidationError : public Error {
public:
    ValidationError(const std::string& field, double value, const std::string& reason);

    const std::string& field() const { return field_; }
    double value() const { return value_; }

private:
    std::string field_;
    double value_;
};

/**
 * @brief Latitude and longitude are undefined for the given point (the origin)
 */
class DegenerateCoordinateError : public Error {
public:
    explicit DegenerateCoordinateError(const std::string& what) : Error(what) {}
};

}  // namespace geosphere
