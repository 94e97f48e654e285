#pragma once

#include <arrow/status.h>

#include <stdexcept>
#include <string>

#include "internal/model/error_kind.hpp"

namespace logship::upload {

/*
  A failed transfer step, tagged with its retry classification.
*/
class UploadError : public std::runtime_error {
 public:
  UploadError(model::ErrorKind kind, const std::string& msg) : std::runtime_error(msg), kind_(kind) {
  }

  model::ErrorKind kind() const {
    return kind_;
  }

  bool transient() const {
    return model::IsTransient(kind_);
  }

 private:
  model::ErrorKind kind_;
};

// The multipart session can take no more parts; only a fresh upload can succeed.
class SessionBroken : public UploadError {
 public:
  SessionBroken(model::ErrorKind kind, const std::string& msg) : UploadError(kind, msg) {
  }
};

// Maps an Arrow status (local IO or object store) onto the failure taxonomy.
model::ErrorKind ClassifyStatus(const arrow::Status& status);

// Throws UploadError when status is not ok.
void Check(const arrow::Status& status, const std::string& context);

template <typename T>
T Unwrap(arrow::Result<T> result, const std::string& context) {
  Check(result.status(), context);
  return std::move(result).ValueOrDie();
}

} // namespace logship::upload
