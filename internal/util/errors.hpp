#pragma once

#include <stdexcept>
#include <string>

namespace logship::util {

/*
  Central error types.

  StorageCorrupted is fatal: the daemon refuses to start rather than run
  with a queue or registry it cannot trust.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

class StorageCorrupted : public std::runtime_error {
 public:
  explicit StorageCorrupted(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace logship::util
