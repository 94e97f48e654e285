#pragma once

#include <optional>
#include <string_view>

namespace logship::model {

/*
  Upload failure taxonomy. Transient kinds are retried with backoff,
  everything else fails the entry permanently.
*/
enum class ErrorKind {
  kNetwork,
  kTimeout,
  kThrottled,
  kServerError,
  kAuth,
  kBucketMissing,
  kTooLarge,
  kSourceVanished,
  kPermissionDenied,
  kPathEscape,
  kUnknown,
};

bool IsTransient(ErrorKind kind);

std::string_view ToString(ErrorKind kind);

std::optional<ErrorKind> ErrorKindFromString(std::string_view name);

} // namespace logship::model
