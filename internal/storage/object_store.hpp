#pragma once

#include <arrow/buffer.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace logship::storage {

struct CompletedPart {
  int         part_number{0};
  std::string etag;
};

struct ObjectInfo {
  std::string key;
  uint64_t    size_bytes{0};
};

/*
  Capability-style remote object store. Keys are relative to the
  configured bucket / prefix.

  Every method throws upload::UploadError on failure, classified so the
  caller can decide between retry and permanent failure.

  Multipart contract:
    CreateMultipart -> UploadPart(1..n, in order) -> CompleteMultipart
  AbortMultipart discards everything sent so far; nothing becomes
  visible under key until CompleteMultipart succeeds. Re-sending a part
  number that was already accepted is a no-op. A failed part may be
  re-sent unless the store threw upload::SessionBroken.
*/
class ObjectStore {
 public:
  virtual ~ObjectStore() = default;

  virtual std::string PutObject(const std::string& key, const std::shared_ptr<arrow::Buffer>& data) = 0;

  virtual std::string CreateMultipart(const std::string& key)                                                             = 0;
  virtual std::string UploadPart(const std::string& upload_id, int part_number, const std::shared_ptr<arrow::Buffer>& data) = 0;
  virtual std::string CompleteMultipart(const std::string& upload_id, const std::vector<CompletedPart>& parts)             = 0;
  virtual void        AbortMultipart(const std::string& upload_id)                                                         = 0;

  // nullopt when nothing is stored under key.
  virtual std::optional<ObjectInfo> Stat(const std::string& key) = 0;

  virtual std::vector<ObjectInfo> List(const std::string& prefix) = 0;
  virtual void                    Delete(const std::string& key)  = 0;
};

using ObjectStorePtr = std::shared_ptr<ObjectStore>;

// Hex FNV-1a digest used as a content tag.
std::string ContentTag(const uint8_t* data, int64_t size);

} // namespace logship::storage
