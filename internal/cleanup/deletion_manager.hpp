#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <string_view>

#include "internal/cleanup/disk_gauge.hpp"
#include "internal/model/deletion_policy.hpp"
#include "internal/model/file_identity.hpp"

namespace logship::model {
class RuleMatcher;
}

namespace logship::observability {
class MetricsPublisher;
}

namespace logship::registry {
class ProcessedRegistry;
}

namespace logship::cleanup {

enum class DiskPressure {
  kNormal,
  kWarning,
  kCritical,
};

/*
  Decides when local files go away. Every deletion passes the four
  ordered gates; any error while deciding means the file stays.

  Registry records and queue entries are never touched here.
*/
class DeletionManager {
 public:
  DeletionManager(model::DeletionPolicy policy, model::DiskThresholds thresholds, std::shared_ptr<const model::RuleMatcher> matcher,
                  std::shared_ptr<registry::ProcessedRegistry> registry, std::shared_ptr<DiskGauge> gauge,
                  std::shared_ptr<observability::MetricsPublisher> metrics);

  // After a confirmed upload. Deletes right away when keep_days is 0.
  bool OnUploaded(const model::FileIdentity& identity, util::TimePoint now);

  // Uploaded files whose keep period has elapsed.
  size_t RunDeferred(util::TimePoint now);

  // Files older than max_age_days, uploaded or not.
  size_t RunAgeSweep(util::TimePoint now);

  /*
    When usage is at or above critical (or available space is below the
    reserve), delete uploaded files oldest first until usage is below
    warning and the reserve is restored.
  */
  size_t RunEmergency(util::TimePoint now);

  // Measures the disk, publishes the usage gauge, logs threshold crossings.
  std::optional<DiskUsage> CheckDisk();

  DiskPressure Classify(const DiskUsage& usage) const;

  uint64_t total_deleted() const {
    return total_deleted_.load();
  }

  const model::DeletionPolicy& policy() const {
    return policy_;
  }

 private:
  // expected, when set, must still match what is on disk
  bool TryDelete(const std::filesystem::path& path, const std::optional<model::FileIdentity>& expected, std::string_view policy);

  model::DeletionPolicy                            policy_;
  model::DiskThresholds                            thresholds_;
  std::shared_ptr<const model::RuleMatcher>        matcher_;
  std::shared_ptr<registry::ProcessedRegistry>     registry_;
  std::shared_ptr<DiskGauge>                       gauge_;
  std::shared_ptr<observability::MetricsPublisher> metrics_;

  std::atomic<uint64_t> total_deleted_{0};
};

} // namespace logship::cleanup
