#pragma once

#include <stdexcept>
#include <string>

namespace logship::config {

// Configuration could not be loaded or failed validation. Fatal at startup.
class ConfigError : public std::runtime_error {
 public:
  explicit ConfigError(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace logship::config
