#include "arrow_object_store.hpp"

#include <arrow/filesystem/path_util.h>

#include <random>

#include <spdlog/fmt/fmt.h>

#include "internal/upload/upload_error.hpp"

namespace logship::storage {

using upload::Check;
using upload::SessionBroken;
using upload::Unwrap;
using upload::UploadError;

std::string ContentTag(const uint8_t* data, int64_t size) {
  uint64_t hash = 1469598103934665603ULL;
  for (int64_t i = 0; i < size; ++i) {
    hash ^= data[i];
    hash *= 1099511628211ULL;
  }
  return fmt::format("{:016x}", hash);
}

ArrowObjectStore::ArrowObjectStore(std::shared_ptr<arrow::fs::FileSystem> fs, std::string root_path)
    : fs_(std::move(fs)), root_path_(std::move(root_path)) {
  while (root_path_.size() > 1 && root_path_.back() == '/') {
    root_path_.pop_back();
  }
}

/*
  Object layout:

      <root_path>/<key>
*/
std::string ArrowObjectStore::ObjectPath(const std::string& key) const {
  if (root_path_.empty()) {
    return key;
  }
  return arrow::fs::internal::ConcatAbstractPath(root_path_, key);
}

// Object stores have no directories; only a local tree needs the parents.
void ArrowObjectStore::EnsureParent(const std::string& path) {
  if (fs_->type_name() != "local") {
    return;
  }
  const auto parent = arrow::fs::internal::GetAbstractPathParent(path).first;
  if (!parent.empty()) {
    Check(fs_->CreateDir(parent, /*recursive=*/true), "create " + parent);
  }
}

std::string ArrowObjectStore::PutObject(const std::string& key, const std::shared_ptr<arrow::Buffer>& data) {
  const auto path = ObjectPath(key);
  EnsureParent(path);

  auto out = Unwrap(fs_->OpenOutputStream(path), "open " + path);
  Check(out->Write(data->data(), data->size()), "write " + path);
  Check(out->Close(), "close " + path);
  return ContentTag(data->data(), data->size());
}

std::string ArrowObjectStore::CreateMultipart(const std::string& key) {
  const auto path = ObjectPath(key);
  EnsureParent(path);

  auto session    = std::make_shared<Session>();
  session->key    = key;
  session->stream = Unwrap(fs_->OpenOutputStream(path), "open " + path);

  static thread_local std::mt19937_64 rng{std::random_device{}()};

  std::lock_guard lock(mutex_);
  auto            upload_id = fmt::format("{:08x}-{}", static_cast<uint32_t>(rng()), next_session_++);
  sessions_.emplace(upload_id, std::move(session));
  return upload_id;
}

std::shared_ptr<ArrowObjectStore::Session> ArrowObjectStore::FindSession(const std::string& upload_id) {
  std::lock_guard lock(mutex_);
  auto            it = sessions_.find(upload_id);
  if (it == sessions_.end()) {
    throw UploadError(model::ErrorKind::kUnknown, "unknown multipart upload " + upload_id);
  }
  return it->second;
}

std::string ArrowObjectStore::UploadPart(const std::string& upload_id, int part_number, const std::shared_ptr<arrow::Buffer>& data) {
  auto            session = FindSession(upload_id);
  std::lock_guard lock(session->mutex);

  if (part_number >= 1 && static_cast<size_t>(part_number) <= session->etags.size()) {
    return session->etags[part_number - 1];
  }
  if (session->broken) {
    throw SessionBroken(model::ErrorKind::kNetwork, "multipart upload " + upload_id + " must be restarted");
  }
  if (static_cast<size_t>(part_number) != session->etags.size() + 1) {
    throw UploadError(model::ErrorKind::kUnknown, fmt::format("part {} out of order for {}", part_number, upload_id));
  }

  auto status = session->stream->Write(data->data(), data->size());
  if (!status.ok()) {
    // bytes may be half written; the stream cannot be resumed
    session->broken = true;
    throw SessionBroken(upload::ClassifyStatus(status), fmt::format("upload part {} of {}: {}", part_number, session->key, status.ToString()));
  }

  session->etags.push_back(ContentTag(data->data(), data->size()));
  return session->etags.back();
}

std::string ArrowObjectStore::CompleteMultipart(const std::string& upload_id, const std::vector<CompletedPart>& parts) {
  auto session = FindSession(upload_id);
  {
    std::lock_guard lock(session->mutex);
    if (session->broken) {
      throw UploadError(model::ErrorKind::kNetwork, "multipart upload " + upload_id + " must be restarted");
    }
    if (parts.size() != session->etags.size()) {
      throw UploadError(model::ErrorKind::kUnknown, fmt::format("complete with {} parts, {} uploaded", parts.size(), session->etags.size()));
    }
    for (const auto& part : parts) {
      if (part.part_number < 1 || static_cast<size_t>(part.part_number) > session->etags.size() ||
          session->etags[part.part_number - 1] != part.etag) {
        throw UploadError(model::ErrorKind::kUnknown, fmt::format("etag mismatch for part {}", part.part_number));
      }
    }
    Check(session->stream->Close(), "complete " + session->key);
  }

  std::string combined;
  for (const auto& part : parts) {
    combined += part.etag;
  }

  std::lock_guard lock(mutex_);
  sessions_.erase(upload_id);
  return fmt::format("{}-{}", ContentTag(reinterpret_cast<const uint8_t*>(combined.data()), static_cast<int64_t>(combined.size())), parts.size());
}

void ArrowObjectStore::AbortMultipart(const std::string& upload_id) {
  std::shared_ptr<Session> session;
  {
    std::lock_guard lock(mutex_);
    auto            it = sessions_.find(upload_id);
    if (it == sessions_.end()) {
      return;
    }
    session = it->second;
    sessions_.erase(it);
  }

  std::lock_guard lock(session->mutex);
  const auto      status = session->stream->Abort();
  // a local stream leaves the partial file behind
  if (fs_->type_name() == "local") {
    const auto removed = fs_->DeleteFile(ObjectPath(session->key));
    if (!removed.ok() && !removed.IsIOError()) {
      Check(removed, "remove partial " + session->key);
    }
  }
  Check(status, "abort " + session->key);
}

std::optional<ObjectInfo> ArrowObjectStore::Stat(const std::string& key) {
  const auto path = ObjectPath(key);
  auto       info = Unwrap(fs_->GetFileInfo(path), "stat " + path);
  if (info.type() != arrow::fs::FileType::File) {
    return std::nullopt;
  }
  return ObjectInfo{key, static_cast<uint64_t>(info.size())};
}

std::vector<ObjectInfo> ArrowObjectStore::List(const std::string& prefix) {
  arrow::fs::FileSelector selector;
  selector.base_dir        = ObjectPath(prefix);
  selector.recursive       = true;
  selector.allow_not_found = true;

  auto infos = Unwrap(fs_->GetFileInfo(selector), "list " + selector.base_dir);

  std::vector<ObjectInfo> out;
  for (const auto& info : infos) {
    if (!info.IsFile()) {
      continue;
    }
    ObjectInfo object;
    object.key        = root_path_.empty() ? info.path() : info.path().substr(root_path_.size() + 1);
    object.size_bytes = static_cast<uint64_t>(info.size());
    out.push_back(std::move(object));
  }
  return out;
}

void ArrowObjectStore::Delete(const std::string& key) {
  Check(fs_->DeleteFile(ObjectPath(key)), "delete " + key);
}

} // namespace logship::storage
