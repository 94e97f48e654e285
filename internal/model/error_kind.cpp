#include "error_kind.hpp"

#include <array>
#include <utility>

namespace logship::model {

namespace {

constexpr std::array<std::pair<ErrorKind, std::string_view>, 11> kNames = {{
    {ErrorKind::kNetwork, "network"},
    {ErrorKind::kTimeout, "timeout"},
    {ErrorKind::kThrottled, "throttled"},
    {ErrorKind::kServerError, "server_error"},
    {ErrorKind::kAuth, "auth"},
    {ErrorKind::kBucketMissing, "bucket_missing"},
    {ErrorKind::kTooLarge, "too_large"},
    {ErrorKind::kSourceVanished, "source_vanished"},
    {ErrorKind::kPermissionDenied, "permission_denied"},
    {ErrorKind::kPathEscape, "path_escape"},
    {ErrorKind::kUnknown, "unknown"},
}};

} // namespace

bool IsTransient(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kNetwork:
    case ErrorKind::kTimeout:
    case ErrorKind::kThrottled:
    case ErrorKind::kServerError:
    case ErrorKind::kUnknown:
      return true;
    default:
      return false;
  }
}

std::string_view ToString(ErrorKind kind) {
  for (const auto& [value, name] : kNames) {
    if (value == kind) {
      return name;
    }
  }
  return "unknown";
}

std::optional<ErrorKind> ErrorKindFromString(std::string_view name) {
  for (const auto& [value, text] : kNames) {
    if (text == name) {
      return value;
    }
  }
  return std::nullopt;
}

} // namespace logship::model
