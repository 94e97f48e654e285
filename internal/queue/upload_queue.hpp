#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "internal/model/queue_entry.hpp"
#include "internal/persist/atomic_document.hpp"

namespace logship::queue {

/*
  Durable holding area between detection and upload.

  Every mutation rewrites the queue document atomically while the lock is
  held and only takes effect in memory once the write succeeded. Nothing
  here blocks on the network.
*/
class UploadQueue {
 public:
  struct Options {
    uint32_t             max_attempts{10};
    std::chrono::seconds max_backoff{512};
  };

  struct LoadStats {
    size_t loaded{0};
    size_t reset_in_flight{0};
    size_t dropped_missing{0};
    size_t dropped_stale_failures{0};
    size_t permanently_failed{0};
  };

  enum class EnqueueResult {
    kAdded,
    kDuplicate, // already pending or in flight
    kReplaced,  // superseded a pending entry for the same path
    kBlocked,   // identity is permanently failed
  };

  enum class FailOutcome {
    kRetry,
    kPermanentlyFailed,
    kUnknownEntry,
  };

  UploadQueue(std::filesystem::path file, Options options);

  /*
    Reload from disk. In-flight entries from a previous run are reset to
    pending; pending entries whose file is gone are dropped. Throws
    util::StorageCorrupted on an unreadable document.
  */
  LoadStats Load();

  EnqueueResult Enqueue(const model::FileIdentity& identity, util::TimePoint now);

  // Up to n due pending entries, oldest enqueued first, marked in flight.
  std::vector<model::QueueEntry> DequeueBatch(size_t n, util::TimePoint now);

  bool Complete(const model::FileIdentity& identity);

  FailOutcome Fail(const model::FileIdentity& identity, model::ErrorKind kind, std::string_view message, util::TimePoint now);

  /*
    Back to pending without counting an attempt. The entry is pending in
    memory even when the write throws; a document still holding it in
    flight reloads it as pending.
  */
  void Release(const model::FileIdentity& identity);

  // Drop an entry outright (superseded by a newer identity).
  bool Remove(const model::FileIdentity& identity);

  // Drops permanently failed entries whose file is gone or has changed.
  size_t PruneStaleFailures();

  bool Contains(const model::FileIdentity& identity) const;

  // pending + in flight
  size_t Depth() const;
  size_t PermanentlyFailedCount() const;

  std::vector<model::QueueEntry> Snapshot() const;

  void Flush();

  // Retry delay after the n-th failed attempt: min(2^(n-1), max_backoff) seconds.
  std::chrono::seconds Backoff(uint32_t attempt) const;

 private:
  using EntryMap = std::unordered_map<model::FileIdentity, model::QueueEntry, model::FileIdentityHash>;

  void Save() const;
  void SaveOrRestore(EntryMap previous, uint64_t previous_sequence);

  persist::AtomicDocument document_;
  Options                 options_;

  mutable std::mutex mutex_;
  EntryMap           entries_;
  uint64_t           next_sequence_{1};
};

} // namespace logship::queue
