#include <geosphere/errors.hpp>

#include <boost/format.hpp>

namespace geosphere {

ValidationError::ValidationError(const std::string& field, double value, const std::string& reason)
    : Error((boost::format("invalid %s (%.12g): %s") % field % value % reason).str()),
      field_(field),
      value_(value) {}

}  // namespace geosphere
