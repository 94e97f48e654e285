#pragma once

#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "internal/model/file_identity.hpp"
#include "internal/persist/atomic_document.hpp"
#include "internal/util/time.hpp"

namespace logship::registry {

struct RegistryRecord {
  std::string         identity_hash;
  model::FileIdentity identity;
  util::TimePoint     uploaded_at{};
  util::TimePoint     expires_at{};
  std::string         remote_key;
};

/*
  Durable ledger of confirmed uploads. A live record for an exact
  identity means "do not upload again"; a file at the same path with a
  different size or mtime is a different file.
*/
class ProcessedRegistry {
 public:
  ProcessedRegistry(std::filesystem::path file, double retention_days);

  // Throws util::StorageCorrupted. Returns the number of records loaded.
  size_t Load();

  bool ShouldSkip(const model::FileIdentity& identity, util::TimePoint now) const;

  // Insert or refresh. expires_at = now + retention_days.
  void Record(const model::FileIdentity& identity, std::string_view remote_key, util::TimePoint now);

  std::optional<RegistryRecord> Find(const model::FileIdentity& identity) const;

  /*
    Remove expired records, except those whose identity is still queued
    (in_use returns true). Returns the number removed.
  */
  size_t Prune(util::TimePoint now, const std::function<bool(const model::FileIdentity&)>& in_use);

  std::vector<RegistryRecord> Snapshot() const;

  size_t Size() const;

  void Flush();

 private:
  using RecordMap = std::unordered_map<model::FileIdentity, RegistryRecord, model::FileIdentityHash>;

  void Save() const;

  persist::AtomicDocument document_;
  util::Clock::duration   retention_;

  mutable std::mutex mutex_;
  RecordMap          records_;
};

} // namespace logship::registry
