#pragma once

#include <sstream>
#include <stdexcept>
#include <string>

namespace canal {
namespace config {

/**
 * @brief Raised when a configuration value is present but unusable
 */
class ConfigValidationError : public std::runtime_error {
 public:
  ConfigValidationError(const std::string& field, const std::string& reason)
      : std::runtime_error(formatError(field, reason)),
        field_(field),
        reason_(reason) {}

  const std::string& field() const { return field_; }
  const std::string& reason() const { return reason_; }

 private:
  static std::string formatError(const std::string& field,
                                 const std::string& reason) {
    std::ostringstream oss;
    oss << "Configuration validation failed for field '" << field
        << "': " << reason;
    return oss.str();
  }

  std::string field_;
  std::string reason_;
};

}  // namespace config
}  // namespace canal
