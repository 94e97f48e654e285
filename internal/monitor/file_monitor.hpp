#pragma once

#include <atomic>
#include <filesystem>
#include <memory>
#include <thread>

#include "internal/monitor/inotify_watcher.hpp"
#include "internal/monitor/stability_detector.hpp"

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

namespace logship::monitor {

/*
  Detection side of the pipeline:

      inotify / backlog scan -> StabilityDetector -> registry check -> queue

  Never reads file contents and never deletes anything.
*/
class FileMonitor {
 public:
  struct Options {
    double file_stable_seconds{60};
    bool   scan_existing{true};
    double scan_max_age_days{3};
  };

  FileMonitor(Options options, std::shared_ptr<const model::RuleMatcher> matcher, std::shared_ptr<queue::UploadQueue> queue,
              std::shared_ptr<registry::ProcessedRegistry> registry, std::shared_ptr<observability::MetricsPublisher> metrics);
  ~FileMonitor();

  // Backlog scan, then live watching on a background thread.
  void Start();
  void Stop();

  void ScanBacklog(util::TimePoint now);
  void OnEvent(const std::filesystem::path& path, InotifyWatcher::EventType type, util::TimePoint now);

  // Enqueue whatever became stable. Returns the number of new queue entries.
  size_t PumpStable(util::TimePoint now);

  uint64_t files_detected() const {
    return files_detected_.load();
  }

  const StabilityDetector& detector() const {
    return detector_;
  }

 private:
  void Loop();

  Options                                          options_;
  std::shared_ptr<const model::RuleMatcher>        matcher_;
  std::shared_ptr<queue::UploadQueue>              queue_;
  std::shared_ptr<registry::ProcessedRegistry>     registry_;
  std::shared_ptr<observability::MetricsPublisher> metrics_;

  StabilityDetector               detector_;
  std::unique_ptr<InotifyWatcher> watcher_;

  std::thread           thread_;
  std::atomic<bool>     running_{false};
  std::atomic<uint64_t> files_detected_{0};
};

} // namespace logship::monitor
