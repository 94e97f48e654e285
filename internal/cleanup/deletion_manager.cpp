#include "deletion_manager.hpp"

#include <algorithm>
#include <filesystem>
#include <system_error>
#include <unordered_set>
#include <vector>

#include "internal/cleanup/deletion_gates.hpp"
#include "internal/model/watch_rule.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/observability/spans.hpp"
#include "internal/registry/processed_registry.hpp"

namespace logship::cleanup {

using logship::observability::DoubleField;
using logship::observability::IntField;
using logship::observability::StringField;

namespace {

constexpr char kPolicyAfterUpload[] = "after_upload";
constexpr char kPolicyAgeBased[]    = "age_based";
constexpr char kPolicyEmergency[]   = "emergency";

constexpr double kBytesPerGiB = 1024.0 * 1024.0 * 1024.0;

// Regular files under root, hidden entries and symlinks excluded.
std::vector<std::filesystem::path> ListFiles(const std::filesystem::path& root) {
  namespace fs = std::filesystem;

  std::vector<fs::path> files;
  std::error_code       ec;
  fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
  if (ec) {
    LOGSHIP_LOG_WARN("Cannot list directory", {StringField("path", root.string()), StringField("error", ec.message())});
    return files;
  }

  for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
    if (ec) {
      LOGSHIP_LOG_WARN("Directory walk interrupted", {StringField("path", root.string()), StringField("error", ec.message())});
      break;
    }
    const auto&     path = it->path();
    std::error_code status_ec;
    const auto      status = it->symlink_status(status_ec);
    if (status_ec || model::IsHidden(path)) {
      if (!status_ec && fs::is_directory(status)) it.disable_recursion_pending();
      continue;
    }
    if (fs::is_regular_file(status)) {
      files.push_back(path);
    }
  }
  return files;
}

} // namespace

DeletionManager::DeletionManager(model::DeletionPolicy policy, model::DiskThresholds thresholds, std::shared_ptr<const model::RuleMatcher> matcher,
                                 std::shared_ptr<registry::ProcessedRegistry> registry, std::shared_ptr<DiskGauge> gauge,
                                 std::shared_ptr<observability::MetricsPublisher> metrics)
    : policy_(policy),
      thresholds_(thresholds),
      matcher_(std::move(matcher)),
      registry_(std::move(registry)),
      gauge_(std::move(gauge)),
      metrics_(std::move(metrics)) {
}

bool DeletionManager::OnUploaded(const model::FileIdentity& identity, util::TimePoint) {
  if (!policy_.after_upload.enabled || policy_.after_upload.keep_days > 0) {
    return false;
  }
  return TryDelete(identity.path, identity, kPolicyAfterUpload);
}

size_t DeletionManager::RunDeferred(util::TimePoint now) {
  if (!policy_.after_upload.enabled) {
    return 0;
  }

  const auto keep    = util::Days(policy_.after_upload.keep_days);
  size_t     deleted = 0;
  for (const auto& record : registry_->Snapshot()) {
    if (record.uploaded_at + keep > now) {
      continue;
    }
    // gone already, or a different file now lives at the path
    auto current = model::StatIdentity(record.identity.path);
    if (!current || *current != record.identity) {
      continue;
    }
    if (TryDelete(record.identity.path, record.identity, kPolicyAfterUpload)) {
      ++deleted;
    }
  }

  if (deleted > 0) {
    LOGSHIP_LOG_INFO("Deferred deletion finished", {IntField("deleted", static_cast<int64_t>(deleted))});
  }
  return deleted;
}

size_t DeletionManager::RunAgeSweep(util::TimePoint now) {
  const auto& age = policy_.age_based;
  if (!age.enabled || age.max_age_days <= 0) {
    LOGSHIP_LOG_DEBUG("Age-based cleanup disabled");
    return 0;
  }

  LOGSHIP_LOG_INFO("Running age-based cleanup", {DoubleField("max_age_days", age.max_age_days)});

  const auto max_age = util::Days(age.max_age_days);
  size_t     deleted = 0;
  for (const auto& rule : matcher_->rules()) {
    for (const auto& path : ListFiles(rule.root)) {
      // nested roots are swept under their own rule
      if (matcher_->Find(path) != &rule) {
        continue;
      }
      auto current = model::StatIdentity(path);
      if (!current || now - current->ModifiedAt() <= max_age) {
        continue;
      }
      if (TryDelete(path, current, kPolicyAgeBased)) {
        ++deleted;
      }
    }
  }

  LOGSHIP_LOG_INFO("Age-based cleanup finished", {IntField("deleted", static_cast<int64_t>(deleted))});
  return deleted;
}

DiskPressure DeletionManager::Classify(const DiskUsage& usage) const {
  const auto fraction = usage.UsageFraction();
  if (fraction >= thresholds_.critical || usage.available_bytes < thresholds_.reserved_bytes) {
    return DiskPressure::kCritical;
  }
  if (fraction >= thresholds_.warning) {
    return DiskPressure::kWarning;
  }
  return DiskPressure::kNormal;
}

std::optional<DiskUsage> DeletionManager::CheckDisk() {
  DiskUsage usage;
  try {
    usage = gauge_->Measure();
  } catch (const std::exception& e) {
    LOGSHIP_LOG_ERROR("Disk usage check failed", {StringField("error", e.what())});
    return std::nullopt;
  }

  metrics_->SetGauge(observability::metric::kDiskUsagePercent, usage.UsageFraction() * 100.0);

  switch (Classify(usage)) {
    case DiskPressure::kCritical:
      LOGSHIP_LOG_ERROR("Disk usage critical", {DoubleField("usage_percent", usage.UsageFraction() * 100.0),
                                                DoubleField("available_gb", static_cast<double>(usage.available_bytes) / kBytesPerGiB),
                                                DoubleField("reserved_gb", static_cast<double>(thresholds_.reserved_bytes) / kBytesPerGiB)});
      break;
    case DiskPressure::kWarning:
      LOGSHIP_LOG_WARN("Disk usage high", {DoubleField("usage_percent", usage.UsageFraction() * 100.0)});
      break;
    case DiskPressure::kNormal:
      break;
  }
  return usage;
}

size_t DeletionManager::RunEmergency(util::TimePoint) {
  if (!policy_.emergency.enabled) {
    return 0;
  }

  auto usage = CheckDisk();
  if (!usage || Classify(*usage) != DiskPressure::kCritical) {
    return 0;
  }

  // only files the registry confirms as uploaded, in their uploaded form
  std::vector<model::FileIdentity> candidates;
  std::unordered_set<std::string>  seen;
  for (const auto& record : registry_->Snapshot()) {
    auto current = model::StatIdentity(record.identity.path);
    if (current && *current == record.identity && seen.insert(current->path).second) {
      candidates.push_back(*current);
    }
  }
  std::sort(candidates.begin(), candidates.end(), [](const auto& a, const auto& b) {
    return a.mtime_ns != b.mtime_ns ? a.mtime_ns < b.mtime_ns : a.path < b.path;
  });

  LOGSHIP_LOG_WARN("Starting emergency cleanup", {DoubleField("usage_percent", usage->UsageFraction() * 100.0),
                                                  IntField("candidates", static_cast<int64_t>(candidates.size()))});

  size_t   deleted = 0;
  uint64_t freed   = 0;
  for (const auto& candidate : candidates) {
    if (usage->UsageFraction() < thresholds_.warning && usage->available_bytes >= thresholds_.reserved_bytes) {
      break;
    }
    if (TryDelete(candidate.path, candidate, kPolicyEmergency)) {
      ++deleted;
      freed += candidate.size_bytes;
    }
    try {
      *usage = gauge_->Measure();
    } catch (const std::exception& e) {
      LOGSHIP_LOG_ERROR("Disk usage check failed, stopping emergency cleanup", {StringField("error", e.what())});
      break;
    }
  }

  metrics_->SetGauge(observability::metric::kDiskUsagePercent, usage->UsageFraction() * 100.0);
  if (Classify(*usage) == DiskPressure::kCritical) {
    LOGSHIP_LOG_ERROR("Emergency cleanup could not relieve disk pressure", {IntField("deleted", static_cast<int64_t>(deleted)),
                                                                            DoubleField("usage_percent", usage->UsageFraction() * 100.0)});
  } else {
    LOGSHIP_LOG_WARN("Emergency cleanup finished", {IntField("deleted", static_cast<int64_t>(deleted)),
                                                    DoubleField("freed_gb", static_cast<double>(freed) / kBytesPerGiB),
                                                    DoubleField("usage_percent", usage->UsageFraction() * 100.0)});
  }
  return deleted;
}

bool DeletionManager::TryDelete(const std::filesystem::path& path, const std::optional<model::FileIdentity>& expected, std::string_view policy) {
  observability::SpanScope span(observability::span::kDelete);
  span.SetAttribute("logship.path", path.string());
  span.SetAttribute("logship.policy", policy);
  try {
    auto current = model::StatIdentity(path);
    if (!current) {
      LOGSHIP_LOG_DEBUG("Not deleting, no regular file at path", {StringField("path", path.string()), StringField("policy", policy)});
      return false;
    }
    if (expected && *current != *expected) {
      LOGSHIP_LOG_INFO("Not deleting, file changed", {StringField("path", path.string()), StringField("policy", policy)});
      return false;
    }

    const auto* rule = matcher_->Find(path);
    if (!rule) {
      LOGSHIP_LOG_WARN("Deletion vetoed", {StringField("path", path.string()), StringField("policy", policy), StringField("gate", "no_rule")});
      return false;
    }
    if (auto veto = FirstVeto(path, *rule)) {
      span.SetAttribute("logship.veto", ToString(*veto));
      LOGSHIP_LOG_INFO("Deletion vetoed", {StringField("path", path.string()), StringField("policy", policy), StringField("gate", ToString(*veto))});
      return false;
    }

    std::error_code ec;
    if (!std::filesystem::remove(path, ec)) {
      if (ec) {
        LOGSHIP_LOG_ERROR("Deletion failed", {StringField("path", path.string()), StringField("policy", policy), StringField("error", ec.message())});
        span.RecordException(ec.message());
      }
      return false;
    }
  } catch (const std::exception& e) {
    LOGSHIP_LOG_ERROR("Deletion check failed", {StringField("path", path.string()), StringField("policy", policy), StringField("error", e.what())});
    return false;
  }

  total_deleted_ += 1;
  metrics_->AddCounter(observability::metric::kFilesDeleted, 1, {{"policy", std::string(policy)}});
  LOGSHIP_LOG_INFO("File deleted", {StringField("path", path.string()), StringField("policy", policy),
                                    IntField("size", static_cast<int64_t>(expected ? expected->size_bytes : 0))});
  return true;
}

} // namespace logship::cleanup
