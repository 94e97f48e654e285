#include "file_monitor.hpp"

#include <chrono>
#include <system_error>

#include "internal/model/watch_rule.hpp"
#include "internal/monitor/backlog_scanner.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/queue/upload_queue.hpp"
#include "internal/registry/processed_registry.hpp"

namespace logship::monitor {

using logship::observability::IntField;
using logship::observability::StringField;

using namespace std::chrono_literals;

FileMonitor::FileMonitor(Options options, std::shared_ptr<const model::RuleMatcher> matcher, std::shared_ptr<queue::UploadQueue> queue,
                         std::shared_ptr<registry::ProcessedRegistry> registry, std::shared_ptr<observability::MetricsPublisher> metrics)
    : options_(options),
      matcher_(std::move(matcher)),
      queue_(std::move(queue)),
      registry_(std::move(registry)),
      metrics_(std::move(metrics)),
      detector_(util::Seconds(options.file_stable_seconds)) {
}

FileMonitor::~FileMonitor() {
  Stop();
}

void FileMonitor::Start() {
  watcher_ = std::make_unique<InotifyWatcher>();
  for (const auto& rule : matcher_->rules()) {
    std::error_code ec;
    if (!std::filesystem::is_directory(rule.root, ec)) {
      LOGSHIP_LOG_WARN("Watch root does not exist", {StringField("path", rule.root.string())});
      continue;
    }
    watcher_->AddTree(rule.root, rule.recursive);
  }
  LOGSHIP_LOG_INFO("Watching log directories", {IntField("rules", static_cast<int64_t>(matcher_->rules().size())),
                                                IntField("watches", static_cast<int64_t>(watcher_->WatchCount()))});

  // watches go in first so nothing written during the scan is missed
  if (options_.scan_existing) {
    ScanBacklog(util::Now());
  }

  running_ = true;
  thread_  = std::thread(&FileMonitor::Loop, this);
}

void FileMonitor::Stop() {
  running_ = false;
  if (thread_.joinable()) thread_.join();
  watcher_.reset();
}

void FileMonitor::ScanBacklog(util::TimePoint now) {
  for (const auto& identity : monitor::ScanBacklog(*matcher_, now, options_.scan_max_age_days)) {
    detector_.Observe(identity.path, now);
  }
}

void FileMonitor::OnEvent(const std::filesystem::path& path, InotifyWatcher::EventType type, util::TimePoint now) {
  switch (type) {
    case InotifyWatcher::EventType::kRemoved:
      detector_.Forget(path);
      return;

    case InotifyWatcher::EventType::kDirectoryCreated: {
      // files may land before the new watch exists
      const auto* rule = matcher_->Find(path);
      if (!rule) {
        return;
      }
      for (const auto& file : ListCandidates(*matcher_, *rule, path)) {
        detector_.Observe(file, now);
      }
      return;
    }

    case InotifyWatcher::EventType::kChanged:
      if (matcher_->Candidate(path)) {
        detector_.Observe(path, now);
      }
      return;
  }
}

size_t FileMonitor::PumpStable(util::TimePoint now) {
  size_t enqueued = 0;
  for (const auto& identity : detector_.Poll(now)) {
    ++files_detected_;

    if (registry_->ShouldSkip(identity, now)) {
      LOGSHIP_LOG_DEBUG("Already uploaded, skipping", {StringField("path", identity.path)});
      continue;
    }

    try {
      switch (queue_->Enqueue(identity, now)) {
        case queue::UploadQueue::EnqueueResult::kAdded:
        case queue::UploadQueue::EnqueueResult::kReplaced:
          ++enqueued;
          metrics_->AddCounter(observability::metric::kFilesEnqueued, 1);
          LOGSHIP_LOG_INFO("File enqueued", {StringField("path", identity.path), IntField("size_bytes", static_cast<int64_t>(identity.size_bytes))});
          break;
        case queue::UploadQueue::EnqueueResult::kBlocked:
          LOGSHIP_LOG_DEBUG("File is permanently failed, not re-queued", {StringField("path", identity.path)});
          break;
        case queue::UploadQueue::EnqueueResult::kDuplicate:
          break;
      }
    } catch (const std::exception& e) {
      LOGSHIP_LOG_ERROR("Enqueue failed", {StringField("path", identity.path), StringField("error", e.what())});
    }
  }

  if (enqueued > 0) {
    metrics_->SetGauge(observability::metric::kQueueDepth, static_cast<double>(queue_->Depth()));
  }
  return enqueued;
}

void FileMonitor::Loop() {
  const auto on_event = [this](const std::filesystem::path& path, InotifyWatcher::EventType type) { OnEvent(path, type, util::Now()); };

  while (running_) {
    try {
      watcher_->PollOnce(500ms, on_event);
      PumpStable(util::Now());
    } catch (const std::exception& e) {
      LOGSHIP_LOG_ERROR("File monitor iteration failed", {StringField("error", e.what())});
      std::this_thread::sleep_for(1s);
    }
  }
}

} // namespace logship::monitor
