#pragma once

#include <arrow/filesystem/filesystem.h>
#include <arrow/result.h>

#include <memory>
#include <string>
#include <utility>

namespace logship::config {
struct StoreSettings;
}

namespace logship::storage::common {

/*
  Resolve the remote filesystem and the root path objects live under.

  uri set       -> FileSystemFromUri (s3://bucket/prefix?region=..., file:///...)
  otherwise     -> S3FileSystem for bucket/region/endpoint
*/
arrow::Result<std::pair<std::shared_ptr<arrow::fs::FileSystem>, std::string>> ResolveFileSystem(const config::StoreSettings& store);

} // namespace logship::storage::common
