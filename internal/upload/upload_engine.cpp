#include "upload_engine.hpp"

#include <filesystem>
#include <future>
#include <optional>
#include <system_error>
#include <thread>
#include <vector>

#include "internal/model/watch_rule.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/observability/spans.hpp"
#include "internal/queue/upload_queue.hpp"
#include "internal/registry/processed_registry.hpp"
#include "internal/upload/remote_key.hpp"
#include "internal/upload/upload_error.hpp"

namespace logship::upload {

using logship::observability::IntField;
using logship::observability::StringField;

namespace {

// Resolves symlinks on both sides; a file that lands outside its root escaped.
bool EscapesRoot(const model::WatchRule& rule, const std::filesystem::path& file) {
  std::error_code ec;
  auto            real_root = std::filesystem::canonical(rule.root, ec);
  if (ec) return true;
  auto real_file = std::filesystem::canonical(file, ec);
  if (ec) return true;

  model::WatchRule resolved = rule;
  resolved.root             = real_root;
  return !model::RelativeToRoot(resolved, real_file).has_value();
}

} // namespace

UploadEngine::UploadEngine(Options options, std::shared_ptr<const model::RuleMatcher> matcher, std::shared_ptr<queue::UploadQueue> queue,
                           std::shared_ptr<registry::ProcessedRegistry> registry, std::shared_ptr<storage::ObjectStore> store,
                           std::shared_ptr<observability::MetricsPublisher> metrics, ClockFn clock)
    : options_(std::move(options)),
      matcher_(std::move(matcher)),
      queue_(std::move(queue)),
      registry_(std::move(registry)),
      store_(std::move(store)),
      metrics_(std::move(metrics)),
      clock_(std::move(clock)),
      pool_(options_.workers) {
}

UploadEngine::~UploadEngine() {
  accepting_ = false;
  StopDrainThread();
  pool_.Stop();
}

void UploadEngine::SetUploadedHook(UploadedHook hook) {
  uploaded_hook_ = std::move(hook);
}

void UploadEngine::Start() {
  accepting_ = true;
  cancelled_ = false;
  pool_.Start();

  {
    std::lock_guard lock(drain_mutex_);
    stopping_        = false;
    drain_requested_ = false;
  }
  if (!drain_thread_.joinable()) {
    drain_thread_ = std::thread(&UploadEngine::DrainLoop, this);
  }
}

void UploadEngine::RequestDrain() {
  {
    std::lock_guard lock(drain_mutex_);
    drain_requested_ = true;
  }
  request_cv_.notify_one();
}

void UploadEngine::DrainLoop() {
  while (true) {
    {
      std::unique_lock lock(drain_mutex_);
      request_cv_.wait(lock, [&] { return drain_requested_ || stopping_; });
      if (stopping_) {
        return;
      }
      drain_requested_ = false;
    }
    DrainOnce();
  }
}

void UploadEngine::StopDrainThread() {
  {
    std::lock_guard lock(drain_mutex_);
    stopping_ = true;
  }
  request_cv_.notify_all();
  if (drain_thread_.joinable()) {
    drain_thread_.join();
  }
}

void UploadEngine::Stop(std::chrono::milliseconds grace) {
  accepting_ = false;
  {
    std::unique_lock lock(drain_mutex_);
    if (!drain_cv_.wait_for(lock, grace, [&] { return !draining_; })) {
      LOGSHIP_LOG_WARN("Shutdown grace period expired, cancelling uploads", {IntField("grace_ms", grace.count())});
      cancelled_ = true;
      drain_cv_.wait(lock, [&] { return !draining_; });
    }
  }
  StopDrainThread();
  pool_.Stop();
}

void UploadEngine::ReleaseQuietly(const model::FileIdentity& identity) {
  try {
    queue_->Release(identity);
  } catch (const std::exception& e) {
    // the entry stays in flight and is reset on the next load
    LOGSHIP_LOG_ERROR("Queue release failed", {StringField("path", identity.path), StringField("error", e.what())});
  }
}

bool UploadEngine::Cancelled() const {
  return cancelled_.load();
}

DrainStats UploadEngine::DrainOnce() {
  DrainStats stats;
  {
    std::lock_guard lock(drain_mutex_);
    if (!accepting_ || draining_) {
      return stats;
    }
    draining_ = true;
  }

  observability::SpanScope span(observability::span::kDrain);
  std::atomic<bool>        auth_failed{false};
  try {
    while (!Cancelled() && !auth_failed) {
      auto batch = queue_->DequeueBatch(options_.batch_size, clock_());
      if (batch.empty()) break;

      std::vector<Outcome>           outcomes(batch.size(), Outcome::kReleased);
      std::vector<uint64_t>          bytes(batch.size(), 0);
      std::vector<std::future<void>> pending;
      pending.reserve(batch.size());
      for (size_t i = 0; i < batch.size(); ++i) {
        pending.push_back(pool_.Submit([&, i] { outcomes[i] = Process(batch[i], auth_failed, bytes[i]); }));
      }

      size_t resolved = 0;
      for (size_t i = 0; i < pending.size(); ++i) {
        try {
          pending[i].get();
        } catch (const std::exception& e) {
          LOGSHIP_LOG_ERROR("Upload bookkeeping failed", {StringField("path", batch[i].identity.path), StringField("error", e.what())});
          outcomes[i] = Outcome::kReleased;
          ReleaseQuietly(batch[i].identity);
        }

        switch (outcomes[i]) {
          case Outcome::kUploaded:
            ++stats.uploaded;
            stats.bytes += bytes[i];
            ++resolved;
            break;
          case Outcome::kSkipped:
            ++stats.skipped;
            ++resolved;
            break;
          case Outcome::kSuperseded:
            ++stats.superseded;
            ++resolved;
            break;
          case Outcome::kRetry:
            ++stats.retried;
            break;
          case Outcome::kFailed:
            ++stats.failed;
            ++resolved;
            break;
          case Outcome::kReleased:
            ++stats.released;
            break;
        }
      }

      // retries are backed off and releases mean we are stopping
      if (resolved == 0) break;
    }
  } catch (const std::exception& e) {
    LOGSHIP_LOG_ERROR("Queue drain aborted", {StringField("error", e.what())});
  }
  stats.auth_failed = auth_failed.load();
  span.SetAttribute("logship.uploaded", static_cast<std::int64_t>(stats.uploaded));
  span.SetAttribute("logship.failed", static_cast<std::int64_t>(stats.failed));
  span.SetAttribute("logship.bytes", static_cast<std::int64_t>(stats.bytes));

  metrics_->SetGauge(observability::metric::kQueueDepth, static_cast<double>(queue_->Depth()));
  if (stats.uploaded + stats.failed + stats.retried > 0 || stats.auth_failed) {
    LOGSHIP_LOG_INFO("Queue drain finished", {IntField("uploaded", static_cast<int64_t>(stats.uploaded)),
                                              IntField("skipped", static_cast<int64_t>(stats.skipped)),
                                              IntField("retried", static_cast<int64_t>(stats.retried)),
                                              IntField("failed", static_cast<int64_t>(stats.failed)),
                                              IntField("bytes", static_cast<int64_t>(stats.bytes)),
                                              IntField("queue_depth", static_cast<int64_t>(queue_->Depth()))});
  }

  {
    std::lock_guard lock(drain_mutex_);
    draining_ = false;
  }
  drain_cv_.notify_all();
  return stats;
}

UploadEngine::Outcome UploadEngine::Process(const model::QueueEntry& entry, std::atomic<bool>& auth_failed, uint64_t& bytes) {
  const auto& identity = entry.identity;
  const auto  attempt  = entry.attempt_count + 1;

  if (Cancelled() || auth_failed) {
    queue_->Release(identity);
    return Outcome::kReleased;
  }

  auto current = model::StatIdentity(identity.path);
  if (!current) {
    std::error_code ec;
    if (!std::filesystem::exists(std::filesystem::symlink_status(identity.path, ec))) {
      return Fail(identity, model::ErrorKind::kSourceVanished, "source file no longer exists", attempt);
    }
    return Fail(identity, model::ErrorKind::kPathEscape, "source is not a regular file", attempt);
  }
  if (*current != identity) {
    LOGSHIP_LOG_INFO("Dropping superseded queue entry", {StringField("path", identity.path)});
    queue_->Remove(identity);
    return Outcome::kSuperseded;
  }

  if (registry_->ShouldSkip(identity, clock_())) {
    LOGSHIP_LOG_DEBUG("Already uploaded, skipping", {StringField("path", identity.path)});
    queue_->Complete(identity);
    return Outcome::kSkipped;
  }

  if (const auto* rule = matcher_->Find(identity.path); rule && EscapesRoot(*rule, identity.path)) {
    return Fail(identity, model::ErrorKind::kPathEscape, "resolved path escapes watch root " + rule->root.string(), attempt);
  }

  const auto key = BuildRemoteKey(options_.vehicle_id, *matcher_, identity);

  observability::SpanScope span(observability::span::kUpload);
  span.SetFile(identity);
  span.SetAttribute("logship.key", key);
  span.SetAttribute("logship.attempt", static_cast<std::int64_t>(attempt));

  // a crash between transfer and record leaves the object behind
  if (RemoteCopyMatches(key, identity)) {
    LOGSHIP_LOG_INFO("Already in remote store, skipping upload", {StringField("path", identity.path), StringField("key", key)});
    const auto now = clock_();
    if (!Commit(identity, key, now)) {
      span.RecordException("registry write failed");
      return Outcome::kReleased;
    }
    RunUploadedHook(identity, now);
    return Outcome::kSkipped;
  }

  LOGSHIP_LOG_INFO("Upload started", {StringField("path", identity.path), StringField("key", key), IntField("size", static_cast<int64_t>(identity.size_bytes)),
                                      IntField("attempt", attempt)});

  TransferResult result;
  try {
    result = TransferFile(*store_, identity, key, options_.transfer, [this] { return Cancelled(); });
  } catch (const SourceChanged& e) {
    LOGSHIP_LOG_INFO("Source changed during upload, dropping entry", {StringField("path", identity.path), StringField("reason", e.what())});
    queue_->Remove(identity);
    return Outcome::kSuperseded;
  } catch (const TransferCancelled& e) {
    LOGSHIP_LOG_WARN("Upload cancelled", {StringField("path", identity.path), StringField("reason", e.what())});
    queue_->Release(identity);
    return Outcome::kReleased;
  } catch (const UploadError& e) {
    span.SetFailed(e.kind(), e.what());
    if (e.kind() == model::ErrorKind::kAuth) {
      auth_failed = true;
    }
    return Fail(identity, e.kind(), e.what(), attempt);
  } catch (const std::exception& e) {
    span.SetFailed(model::ErrorKind::kUnknown, e.what());
    return Fail(identity, model::ErrorKind::kUnknown, e.what(), attempt);
  }

  const auto now = clock_();
  if (!Commit(identity, key, now)) {
    span.RecordException("registry write failed");
    return Outcome::kReleased;
  }

  bytes = result.bytes;
  total_uploaded_ += 1;
  total_bytes_ += result.bytes;
  metrics_->AddCounter(observability::metric::kFilesUploaded, 1);
  metrics_->AddCounter(observability::metric::kBytesUploaded, result.bytes);

  LOGSHIP_LOG_INFO("Upload succeeded", {StringField("path", identity.path), StringField("key", key), IntField("bytes", static_cast<int64_t>(result.bytes)),
                                        IntField("parts", result.parts), StringField("etag", result.etag)});

  RunUploadedHook(identity, now);
  return Outcome::kUploaded;
}

bool UploadEngine::RemoteCopyMatches(const std::string& key, const model::FileIdentity& identity) {
  std::optional<storage::ObjectInfo> remote;
  try {
    remote = store_->Stat(key);
  } catch (const UploadError& e) {
    LOGSHIP_LOG_DEBUG("Remote existence check failed, uploading", {StringField("key", key), StringField("error", e.what())});
    return false;
  }
  return remote && remote->size_bytes == identity.size_bytes;
}

// Register, then dequeue. False when the record could not be written; the
// entry is then released and the next attempt finds the remote copy.
bool UploadEngine::Commit(const model::FileIdentity& identity, const std::string& key, util::TimePoint now) {
  try {
    registry_->Record(identity, key, now);
  } catch (const std::exception& e) {
    LOGSHIP_LOG_ERROR("Registry write failed after upload", {StringField("path", identity.path), StringField("error", e.what())});
    queue_->Release(identity);
    return false;
  }
  queue_->Complete(identity);
  return true;
}

void UploadEngine::RunUploadedHook(const model::FileIdentity& identity, util::TimePoint now) {
  if (!uploaded_hook_) {
    return;
  }
  try {
    uploaded_hook_(identity, now);
  } catch (const std::exception& e) {
    LOGSHIP_LOG_ERROR("Post-upload hook failed", {StringField("path", identity.path), StringField("error", e.what())});
  }
}

UploadEngine::Outcome UploadEngine::Fail(const model::FileIdentity& identity, model::ErrorKind kind, const std::string& message, uint32_t attempt) {
  metrics_->AddCounter(observability::metric::kUploadFailures, 1, {{"kind", std::string(model::ToString(kind))}});

  switch (queue_->Fail(identity, kind, message, clock_())) {
    case queue::UploadQueue::FailOutcome::kRetry:
      LOGSHIP_LOG_WARN("Upload failed, will retry", {StringField("path", identity.path), StringField("kind", model::ToString(kind)),
                                                     IntField("attempt", attempt), IntField("backoff_s", queue_->Backoff(attempt).count()),
                                                     StringField("error", message)});
      return Outcome::kRetry;

    case queue::UploadQueue::FailOutcome::kPermanentlyFailed:
      total_failed_ += 1;
      LOGSHIP_LOG_ERROR("Upload failed permanently", {StringField("path", identity.path), StringField("kind", model::ToString(kind)),
                                                      IntField("attempt", attempt), StringField("error", message)});
      return Outcome::kFailed;

    case queue::UploadQueue::FailOutcome::kUnknownEntry:
      break;
  }
  LOGSHIP_LOG_WARN("Failed entry no longer queued", {StringField("path", identity.path)});
  return Outcome::kFailed;
}

} // namespace logship::upload
