#include "upload_error.hpp"

#include <arrow/util/io_util.h>

#include <array>
#include <cerrno>
#include <string_view>
#include <utility>

namespace logship::upload {

namespace {

// Checked in order; the first marker found in the status message wins.
constexpr std::array<std::pair<std::string_view, model::ErrorKind>, 21> kMarkers = {{
    {"InvalidAccessKeyId", model::ErrorKind::kAuth},
    {"SignatureDoesNotMatch", model::ErrorKind::kAuth},
    {"ExpiredToken", model::ErrorKind::kAuth},
    {"AccessDenied", model::ErrorKind::kAuth},
    {"Forbidden", model::ErrorKind::kAuth},
    {"NoSuchBucket", model::ErrorKind::kBucketMissing},
    {"EntityTooLarge", model::ErrorKind::kTooLarge},
    {"SlowDown", model::ErrorKind::kThrottled},
    {"Throttl", model::ErrorKind::kThrottled},
    {"TooManyRequests", model::ErrorKind::kThrottled},
    {"RequestLimitExceeded", model::ErrorKind::kThrottled},
    {"RequestTimeout", model::ErrorKind::kTimeout},
    {"timed out", model::ErrorKind::kTimeout},
    {"Timeout", model::ErrorKind::kTimeout},
    {"InternalError", model::ErrorKind::kServerError},
    {"ServiceUnavailable", model::ErrorKind::kServerError},
    {"HTTP status 5", model::ErrorKind::kServerError},
    {"Couldn't connect", model::ErrorKind::kNetwork},
    {"Connection refused", model::ErrorKind::kNetwork},
    {"Network", model::ErrorKind::kNetwork},
    {"Unable to connect", model::ErrorKind::kNetwork},
}};

} // namespace

model::ErrorKind ClassifyStatus(const arrow::Status& status) {
  if (status.ok()) {
    return model::ErrorKind::kUnknown;
  }

  switch (arrow::internal::ErrnoFromStatus(status)) {
    case ENOENT:
      return model::ErrorKind::kSourceVanished;
    case EACCES:
    case EPERM:
      return model::ErrorKind::kPermissionDenied;
    case ELOOP:
      return model::ErrorKind::kPathEscape;
    case ETIMEDOUT:
      return model::ErrorKind::kTimeout;
    case ECONNREFUSED:
    case ECONNRESET:
    case EHOSTUNREACH:
    case ENETUNREACH:
      return model::ErrorKind::kNetwork;
    default:
      break;
  }

  const std::string message = status.message();
  for (const auto& [marker, kind] : kMarkers) {
    if (message.find(marker) != std::string::npos) {
      return kind;
    }
  }

  if (status.IsIOError()) {
    return model::ErrorKind::kNetwork;
  }
  return model::ErrorKind::kUnknown;
}

void Check(const arrow::Status& status, const std::string& context) {
  if (!status.ok()) {
    throw UploadError(ClassifyStatus(status), context + ": " + status.ToString());
  }
}

} // namespace logship::upload
