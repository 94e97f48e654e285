#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <stdexcept>
#include <string>

#include "internal/model/file_identity.hpp"
#include "internal/storage/object_store.hpp"

namespace logship::upload {

struct TransferOptions {
  uint64_t                  multipart_threshold_bytes{5ULL * 1024 * 1024};
  uint64_t                  part_size_bytes{5ULL * 1024 * 1024};
  uint64_t                  max_object_bytes{5ULL * 1024 * 1024 * 1024 * 1024};
  uint32_t                  part_retries{3};
  std::chrono::milliseconds part_retry_delay{1000};
};

struct TransferResult {
  std::string etag;
  uint64_t    bytes{0};
  int         parts{0}; // 0 for a single PUT
};

// The file no longer matches the identity being uploaded.
class SourceChanged : public std::runtime_error {
 public:
  explicit SourceChanged(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Shutdown interrupted a transfer; any multipart upload was aborted.
class TransferCancelled : public std::runtime_error {
 public:
  explicit TransferCancelled(const std::string& msg) : std::runtime_error(msg) {
  }
};

/*
  Transfers one file to key.

  Files up to multipart_threshold_bytes go up in a single PUT. Larger ones
  are split into part_size_bytes parts; a failed part is retried in place
  (resuming from that part) up to part_retries times. After that, or as
  soon as the store reports a broken session, the multipart upload is
  aborted so no partial object is left behind. Throws UploadError,
  SourceChanged or TransferCancelled.
*/
TransferResult TransferFile(storage::ObjectStore& store, const model::FileIdentity& identity, const std::string& key, const TransferOptions& options,
                            const std::function<bool()>& cancelled = {});

} // namespace logship::upload
