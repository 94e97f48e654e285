#include "multipart_transfer.hpp"

#include <arrow/io/file.h>

#include <algorithm>
#include <thread>
#include <vector>

#include <spdlog/fmt/fmt.h>

#include "internal/observability/logging.hpp"
#include "internal/upload/upload_error.hpp"

namespace logship::upload {

using logship::observability::IntField;
using logship::observability::StringField;

namespace {

void EnsureUnchanged(const model::FileIdentity& identity) {
  auto current = model::StatIdentity(identity.path);
  if (!current) {
    throw UploadError(model::ErrorKind::kSourceVanished, "source disappeared during upload: " + identity.path);
  }
  if (*current != identity) {
    throw SourceChanged("source modified during upload: " + identity.path);
  }
}

void AbortQuietly(storage::ObjectStore& store, const std::string& upload_id, const std::string& key) {
  try {
    store.AbortMultipart(upload_id);
  } catch (const std::exception& e) {
    LOGSHIP_LOG_WARN("Abort of multipart upload failed", {StringField("key", key), StringField("upload_id", upload_id), StringField("error", e.what())});
  }
}

std::string UploadPartWithRetry(storage::ObjectStore& store, const std::string& upload_id, const std::string& key, int part_number,
                                const std::shared_ptr<arrow::Buffer>& data, const TransferOptions& options) {
  for (uint32_t attempt = 0;; ++attempt) {
    try {
      return store.UploadPart(upload_id, part_number, data);
    } catch (const SessionBroken&) {
      throw;
    } catch (const UploadError& e) {
      if (!e.transient() || attempt >= options.part_retries) {
        throw;
      }
      LOGSHIP_LOG_WARN("Part upload failed, retrying", {StringField("key", key), IntField("part", part_number),
                                                        IntField("attempt", attempt + 1), StringField("error", e.what())});
      std::this_thread::sleep_for(options.part_retry_delay * (attempt + 1));
    }
  }
}

TransferResult TransferMultipart(storage::ObjectStore& store, arrow::io::ReadableFile& file, const model::FileIdentity& identity,
                                 const std::string& key, const TransferOptions& options, const std::function<bool()>& cancelled) {
  const auto part_size = std::max<uint64_t>(options.part_size_bytes, 1);
  const auto upload_id = store.CreateMultipart(key);

  std::vector<storage::CompletedPart> parts;
  try {
    for (uint64_t offset = 0; offset < identity.size_bytes; offset += part_size) {
      if (cancelled && cancelled()) {
        throw TransferCancelled(fmt::format("cancelled after {} parts: {}", parts.size(), identity.path));
      }

      const auto length = std::min<uint64_t>(part_size, identity.size_bytes - offset);
      auto       data   = Unwrap(file.ReadAt(static_cast<int64_t>(offset), static_cast<int64_t>(length)), "read " + identity.path);
      if (static_cast<uint64_t>(data->size()) != length) {
        throw SourceChanged("source truncated during upload: " + identity.path);
      }

      const int part_number = static_cast<int>(parts.size()) + 1;
      parts.push_back({part_number, UploadPartWithRetry(store, upload_id, key, part_number, data, options)});
    }

    EnsureUnchanged(identity);

    TransferResult result;
    result.etag  = store.CompleteMultipart(upload_id, parts);
    result.bytes = identity.size_bytes;
    result.parts = static_cast<int>(parts.size());
    return result;
  } catch (...) {
    AbortQuietly(store, upload_id, key);
    throw;
  }
}

} // namespace

TransferResult TransferFile(storage::ObjectStore& store, const model::FileIdentity& identity, const std::string& key, const TransferOptions& options,
                            const std::function<bool()>& cancelled) {
  if (identity.size_bytes > options.max_object_bytes) {
    throw UploadError(model::ErrorKind::kTooLarge,
                      fmt::format("{} is {} bytes, limit is {}", identity.path, identity.size_bytes, options.max_object_bytes));
  }

  auto file = Unwrap(arrow::io::ReadableFile::Open(identity.path), "open " + identity.path);
  if (static_cast<uint64_t>(Unwrap(file->GetSize(), "size " + identity.path)) != identity.size_bytes) {
    throw SourceChanged("source size changed before upload: " + identity.path);
  }

  if (identity.size_bytes <= options.multipart_threshold_bytes) {
    auto data = Unwrap(file->ReadAt(0, static_cast<int64_t>(identity.size_bytes)), "read " + identity.path);
    EnsureUnchanged(identity);

    TransferResult result;
    result.etag  = store.PutObject(key, data);
    result.bytes = identity.size_bytes;
    return result;
  }

  return TransferMultipart(store, *file, identity, key, options, cancelled);
}

} // namespace logship::upload
