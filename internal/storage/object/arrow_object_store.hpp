#pragma once

#include <arrow/filesystem/filesystem.h>
#include <arrow/io/interfaces.h>

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "internal/storage/object_store.hpp"

namespace logship::storage {

/*
  ObjectStore over an Arrow FileSystem (S3, or a local directory for
  testing and edge deployments).

  A multipart upload is one open Arrow output stream. For S3 that stream
  is itself an S3 multipart upload: Close() commits it, Abort() discards
  the uploaded parts on the server.
*/
class ArrowObjectStore : public ObjectStore {
 public:
  ArrowObjectStore(std::shared_ptr<arrow::fs::FileSystem> fs, std::string root_path);

  std::string PutObject(const std::string& key, const std::shared_ptr<arrow::Buffer>& data) override;

  std::string CreateMultipart(const std::string& key) override;
  std::string UploadPart(const std::string& upload_id, int part_number, const std::shared_ptr<arrow::Buffer>& data) override;
  std::string CompleteMultipart(const std::string& upload_id, const std::vector<CompletedPart>& parts) override;
  void        AbortMultipart(const std::string& upload_id) override;

  std::optional<ObjectInfo> Stat(const std::string& key) override;
  std::vector<ObjectInfo>   List(const std::string& prefix) override;
  void                    Delete(const std::string& key) override;

 private:
  struct Session {
    std::string                             key;
    std::shared_ptr<arrow::io::OutputStream> stream;
    std::vector<std::string>                etags; // index = part_number - 1
    bool                                    broken{false};
    std::mutex                              mutex;
  };

  std::string ObjectPath(const std::string& key) const;
  void        EnsureParent(const std::string& path);

  std::shared_ptr<arrow::fs::FileSystem> fs_;
  std::string                            root_path_;

  std::shared_ptr<Session> FindSession(const std::string& upload_id);

  std::mutex                                      mutex_;
  std::map<std::string, std::shared_ptr<Session>> sessions_;
  uint64_t                                        next_session_{1};
};

} // namespace logship::storage
