#include "arrow_utils.hpp"

#include <arrow/filesystem/s3fs.h>

#include "internal/config/settings.hpp"

namespace logship::storage::common {

arrow::Result<std::pair<std::shared_ptr<arrow::fs::FileSystem>, std::string>> ResolveFileSystem(const config::StoreSettings& store) {
  if (!store.uri.empty()) {
    std::string resolved_path;
    ARROW_ASSIGN_OR_RAISE(auto fs, arrow::fs::FileSystemFromUri(store.uri, &resolved_path));
    return std::make_pair(std::move(fs), resolved_path);
  }

  arrow::fs::S3Options options = arrow::fs::S3Options::Defaults();
  options.region               = store.region;
  options.endpoint_override    = store.endpoint_override;
  if (!store.scheme.empty()) {
    options.scheme = store.scheme;
  }
  if (store.connect_timeout_seconds > 0) {
    options.connect_timeout = store.connect_timeout_seconds;
  }
  if (store.request_timeout_seconds > 0) {
    options.request_timeout = store.request_timeout_seconds;
  }
  options.allow_bucket_creation = false;
  options.allow_bucket_deletion = false;

  ARROW_ASSIGN_OR_RAISE(auto fs, arrow::fs::S3FileSystem::Make(options));
  return std::make_pair(std::shared_ptr<arrow::fs::FileSystem>(std::move(fs)), store.bucket);
}

} // namespace logship::storage::common
