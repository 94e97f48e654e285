#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "internal/model/queue_entry.hpp"
#include "internal/upload/multipart_transfer.hpp"
#include "internal/upload/transfer_pool.hpp"

namespace logship::model {
class RuleMatcher;
}

namespace logship::observability {
class MetricsPublisher;
}

namespace logship::queue {
class UploadQueue;
}

namespace logship::registry {
class ProcessedRegistry;
}

namespace logship::upload {

struct DrainStats {
  size_t   uploaded{0};
  size_t   skipped{0};    // already in the registry
  size_t   superseded{0}; // file changed since it was queued
  size_t   retried{0};
  size_t   failed{0}; // permanently
  size_t   released{0};
  uint64_t bytes{0};
  bool     auth_failed{false};
};

/*
  Drains the upload queue into the object store.

  For every entry: re-stat, skip or drop stale work, transfer, then write
  the registry record BEFORE removing the queue entry. A crash between the
  two leaves a queued entry whose re-upload lands on the same key.
*/
class UploadEngine {
 public:
  struct Options {
    std::string     vehicle_id;
    size_t          batch_size{50};
    size_t          workers{2};
    TransferOptions transfer;
  };

  using ClockFn      = std::function<util::TimePoint()>;
  using UploadedHook = std::function<void(const model::FileIdentity&, util::TimePoint)>;

  UploadEngine(Options options, std::shared_ptr<const model::RuleMatcher> matcher, std::shared_ptr<queue::UploadQueue> queue,
               std::shared_ptr<registry::ProcessedRegistry> registry, std::shared_ptr<storage::ObjectStore> store,
               std::shared_ptr<observability::MetricsPublisher> metrics, ClockFn clock = util::Now);
  ~UploadEngine();

  // Called after each confirmed upload (registry already written).
  void SetUploadedHook(UploadedHook hook);

  // Starts the workers and the background drain thread.
  void Start();

  /*
    Refuse new drains, let the running one finish for up to grace, then
    cancel: multipart transfers abort between parts and unstarted entries
    go back to pending.
  */
  void Stop(std::chrono::milliseconds grace);

  // Drain due entries batch by batch until none are left.
  DrainStats DrainOnce();

  // Asks the background thread for a DrainOnce. Requests made while a
  // drain is running coalesce into one more drain.
  void RequestDrain();

  uint64_t total_uploaded() const {
    return total_uploaded_.load();
  }
  uint64_t total_failed() const {
    return total_failed_.load();
  }
  uint64_t total_bytes() const {
    return total_bytes_.load();
  }

 private:
  enum class Outcome {
    kUploaded,
    kSkipped,
    kSuperseded,
    kRetry,
    kFailed,
    kReleased,
  };

  Outcome Process(const model::QueueEntry& entry, std::atomic<bool>& auth_failed, uint64_t& bytes);
  Outcome Fail(const model::FileIdentity& identity, model::ErrorKind kind, const std::string& message, uint32_t attempt);
  bool    RemoteCopyMatches(const std::string& key, const model::FileIdentity& identity);
  bool    Commit(const model::FileIdentity& identity, const std::string& key, util::TimePoint now);
  void    RunUploadedHook(const model::FileIdentity& identity, util::TimePoint now);
  void    ReleaseQuietly(const model::FileIdentity& identity);
  bool    Cancelled() const;
  void    DrainLoop();
  void    StopDrainThread();

  Options                                          options_;
  std::shared_ptr<const model::RuleMatcher>        matcher_;
  std::shared_ptr<queue::UploadQueue>              queue_;
  std::shared_ptr<registry::ProcessedRegistry>     registry_;
  std::shared_ptr<storage::ObjectStore>            store_;
  std::shared_ptr<observability::MetricsPublisher> metrics_;
  ClockFn                                          clock_;
  UploadedHook                                     uploaded_hook_;

  TransferPool pool_;

  std::mutex              drain_mutex_;
  std::condition_variable drain_cv_;
  std::condition_variable request_cv_;
  bool                    draining_{false};
  bool                    drain_requested_{false};
  bool                    stopping_{false};
  std::thread             drain_thread_;
  std::atomic<bool>       accepting_{true};
  std::atomic<bool>       cancelled_{false};

  std::atomic<uint64_t> total_uploaded_{0};
  std::atomic<uint64_t> total_failed_{0};
  std::atomic<uint64_t> total_bytes_{0};
};

} // namespace logship::upload
