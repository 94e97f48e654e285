#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "config/config.pb.h"
#include "internal/model/deletion_policy.hpp"
#include "internal/model/schedule.hpp"
#include "internal/model/watch_rule.hpp"

namespace logship::config {

namespace defaults {
inline constexpr double   kFileStableSeconds       = 60;
inline constexpr double   kScanMaxAgeDays          = 3;
inline constexpr double   kRetentionDays           = 30;
inline constexpr char     kQueueFile[]             = "/var/lib/logship/queue.json";
inline constexpr char     kRegistryFile[]          = "/var/lib/logship/processed_files.json";
inline constexpr double   kKeepDays                = 14;
inline constexpr double   kMaxAgeDays              = 7;
inline constexpr char     kAgeScheduleTime[]       = "02:00";
inline constexpr double   kWarningThreshold        = 0.90;
inline constexpr double   kCriticalThreshold       = 0.95;
inline constexpr uint32_t kMaxAttempts             = 10;
inline constexpr uint32_t kWorkers                 = 2;
inline constexpr uint32_t kBatchSize               = 50;
inline constexpr uint32_t kPartRetries             = 3;
inline constexpr uint64_t kMultipartThresholdBytes = 5ULL * 1024 * 1024;
inline constexpr uint64_t kPartSizeBytes           = 5ULL * 1024 * 1024;
inline constexpr uint64_t kMaxObjectBytes          = 5ULL * 1024 * 1024 * 1024 * 1024;
inline constexpr double   kShutdownGraceSeconds    = 30;
inline constexpr int      kMinIntervalMinutes      = 5;
inline constexpr int      kMaxIntervalMinutes      = 24 * 60;
} // namespace defaults

struct StoreSettings {
  std::string bucket;
  std::string region;
  std::string endpoint_override;
  std::string scheme;
  std::string uri;
  double      connect_timeout_seconds{0};
  double      request_timeout_seconds{0};
};

struct UploadSettings {
  double   file_stable_seconds{defaults::kFileStableSeconds};
  bool     scan_existing{true};
  double   scan_max_age_days{defaults::kScanMaxAgeDays};
  bool     upload_on_start{true};
  uint32_t max_attempts{defaults::kMaxAttempts};
  uint32_t workers{defaults::kWorkers};
  uint32_t batch_size{defaults::kBatchSize};
  uint32_t part_retries{defaults::kPartRetries};
  uint64_t multipart_threshold_bytes{defaults::kMultipartThresholdBytes};
  uint64_t part_size_bytes{defaults::kPartSizeBytes};
  uint64_t max_object_bytes{defaults::kMaxObjectBytes};
  double   shutdown_grace_seconds{defaults::kShutdownGraceSeconds};
};

/*
  Validated, immutable view of RuntimeConfig handed to the pipeline.
  A reload builds a new Settings; nothing mutates a live one.
*/
struct Settings {
  std::string                   vehicle_id;
  std::vector<model::WatchRule> rules;
  StoreSettings                 store;
  model::ScheduleState          schedule;
  UploadSettings                upload;
  std::filesystem::path         queue_file{defaults::kQueueFile};
  std::filesystem::path         registry_file{defaults::kRegistryFile};
  double                        retention_days{defaults::kRetentionDays};
  model::DeletionPolicy         deletion;
  model::DiskThresholds         disk;
  std::filesystem::path         disk_usage_path;
};

// Validates (throws ConfigError) then applies defaults.
Settings BuildSettings(const logship::runtime::config::RuntimeConfig& config);

} // namespace logship::config
