#include "processed_registry.hpp"

#include <algorithm>

#include "internal/observability/logging.hpp"
#include "state/state.pb.h"

namespace logship::registry {

using logship::observability::IntField;
using logship::observability::StringField;

namespace {

constexpr uint32_t kDocumentVersion = 1;

} // namespace

ProcessedRegistry::ProcessedRegistry(std::filesystem::path file, double retention_days)
    : document_(std::move(file)), retention_(util::Days(retention_days)) {
}

size_t ProcessedRegistry::Load() {
  logship::state::v1::RegistryDocument doc;

  std::lock_guard lock(mutex_);
  records_.clear();

  if (!document_.Read(&doc)) {
    LOGSHIP_LOG_INFO("Registry document not found, starting empty", {StringField("path", document_.path().string())});
    return 0;
  }

  for (const auto& in : doc.records()) {
    RegistryRecord record;
    record.identity.path       = in.identity().path();
    record.identity.size_bytes = in.identity().size_bytes();
    record.identity.mtime_ns   = in.identity().mtime_ns();
    record.identity_hash       = model::IdentityHash(record.identity);
    record.uploaded_at         = util::FromUnixMillis(in.uploaded_at_ms());
    record.expires_at          = util::FromUnixMillis(in.expires_at_ms());
    record.remote_key          = in.remote_key();

    if (!in.identity_hash().empty() && in.identity_hash() != record.identity_hash) {
      LOGSHIP_LOG_WARN("Registry record hash mismatch, rehashed", {StringField("path", record.identity.path)});
    }
    records_[record.identity] = std::move(record);
  }

  LOGSHIP_LOG_INFO("Registry loaded", {IntField("records", static_cast<int64_t>(records_.size()))});
  return records_.size();
}

bool ProcessedRegistry::ShouldSkip(const model::FileIdentity& identity, util::TimePoint now) const {
  std::lock_guard lock(mutex_);
  auto            it = records_.find(identity);
  return it != records_.end() && it->second.expires_at > now;
}

void ProcessedRegistry::Record(const model::FileIdentity& identity, std::string_view remote_key, util::TimePoint now) {
  std::lock_guard lock(mutex_);

  RegistryRecord record;
  record.identity      = identity;
  record.identity_hash = model::IdentityHash(identity);
  record.uploaded_at   = now;
  record.expires_at    = now + retention_;
  record.remote_key    = std::string(remote_key);

  // only a durable record counts
  std::optional<RegistryRecord> previous;
  if (auto it = records_.find(identity); it != records_.end()) {
    previous = it->second;
  }
  records_[identity] = std::move(record);
  try {
    Save();
  } catch (...) {
    if (previous) {
      records_[identity] = std::move(*previous);
    } else {
      records_.erase(identity);
    }
    throw;
  }
}

std::optional<RegistryRecord> ProcessedRegistry::Find(const model::FileIdentity& identity) const {
  std::lock_guard lock(mutex_);
  auto            it = records_.find(identity);
  if (it == records_.end()) {
    return std::nullopt;
  }
  return it->second;
}

size_t ProcessedRegistry::Prune(util::TimePoint now, const std::function<bool(const model::FileIdentity&)>& in_use) {
  std::lock_guard lock(mutex_);

  size_t removed = 0;
  for (auto it = records_.begin(); it != records_.end();) {
    if (it->second.expires_at <= now && !(in_use && in_use(it->first))) {
      it = records_.erase(it);
      ++removed;
    } else {
      ++it;
    }
  }

  if (removed > 0) {
    Save();
  }
  LOGSHIP_LOG_INFO("Registry pruned", {IntField("removed", static_cast<int64_t>(removed)), IntField("remaining", static_cast<int64_t>(records_.size()))});
  return removed;
}

std::vector<RegistryRecord> ProcessedRegistry::Snapshot() const {
  std::lock_guard             lock(mutex_);
  std::vector<RegistryRecord> out;
  out.reserve(records_.size());
  for (const auto& [identity, record] : records_) {
    out.push_back(record);
  }
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.uploaded_at < b.uploaded_at; });
  return out;
}

size_t ProcessedRegistry::Size() const {
  std::lock_guard lock(mutex_);
  return records_.size();
}

void ProcessedRegistry::Flush() {
  std::lock_guard lock(mutex_);
  Save();
}

// Caller holds mutex_.
void ProcessedRegistry::Save() const {
  logship::state::v1::RegistryDocument doc;
  doc.set_version(kDocumentVersion);

  std::vector<const RegistryRecord*> ordered;
  ordered.reserve(records_.size());
  for (const auto& [identity, record] : records_) {
    ordered.push_back(&record);
  }
  std::sort(ordered.begin(), ordered.end(), [](const auto* a, const auto* b) {
    return a->uploaded_at != b->uploaded_at ? a->uploaded_at < b->uploaded_at : a->identity.path < b->identity.path;
  });

  for (const auto* record : ordered) {
    auto* out = doc.add_records();
    out->set_identity_hash(record->identity_hash);
    out->mutable_identity()->set_path(record->identity.path);
    out->mutable_identity()->set_size_bytes(record->identity.size_bytes);
    out->mutable_identity()->set_mtime_ns(record->identity.mtime_ns);
    out->set_uploaded_at_ms(util::ToUnixMillis(record->uploaded_at));
    out->set_expires_at_ms(util::ToUnixMillis(record->expires_at));
    out->set_remote_key(record->remote_key);
  }
  document_.Write(doc);
}

} // namespace logship::registry
