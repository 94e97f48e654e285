#include "settings.hpp"

#include <cmath>

#include "internal/config/config_validator.hpp"
#include "internal/util/time.hpp"

namespace logship::config {

namespace {

template <typename Message, typename Getter, typename Has, typename T>
T OrDefault(const Message& message, Has has, Getter get, T fallback) {
  return (message.*has)() ? static_cast<T>((message.*get)()) : fallback;
}

model::ScheduleState BuildSchedule(const logship::runtime::config::UploadConfig& upload) {
  model::ScheduleState state;
  const auto&          schedule = upload.schedule();
  if (schedule.mode() == "daily") {
    state.mode         = model::ScheduleMode::kDaily;
    state.daily_minute = *util::ParseTimeOfDay(schedule.daily_time());
  } else {
    state.mode     = model::ScheduleMode::kInterval;
    state.interval = std::chrono::minutes(static_cast<int64_t>(std::lround(schedule.interval_hours() * 60 + schedule.interval_minutes())));
  }

  const auto& hours = upload.operational_hours();
  if (hours.enabled()) {
    state.operational_hours.enabled      = true;
    state.operational_hours.start_minute = *util::ParseTimeOfDay(hours.start());
    state.operational_hours.end_minute   = *util::ParseTimeOfDay(hours.end());
  }
  return state;
}

} // namespace

Settings BuildSettings(const logship::runtime::config::RuntimeConfig& config) {
  ValidateConfig(config);

  using logship::runtime::config::AfterUploadDeletionConfig;
  using logship::runtime::config::AgeBasedDeletionConfig;
  using logship::runtime::config::ScanExistingFilesConfig;
  using logship::runtime::config::UploadConfig;

  Settings settings;
  settings.vehicle_id = config.vehicle_id();

  for (const auto& dir : config.log_directories()) {
    model::WatchRule rule;
    rule.root           = model::NormalizeRoot(dir.path());
    rule.source         = dir.source();
    rule.pattern        = dir.pattern();
    rule.recursive      = !dir.has_recursive() || dir.recursive();
    rule.allow_deletion = !dir.has_allow_deletion() || dir.allow_deletion();
    settings.rules.push_back(std::move(rule));
  }

  const auto& s3                            = config.s3();
  settings.store.bucket                     = s3.bucket();
  settings.store.region                     = s3.region();
  settings.store.endpoint_override          = s3.endpoint_override();
  settings.store.scheme                     = s3.scheme();
  settings.store.uri                        = s3.uri();
  settings.store.connect_timeout_seconds    = s3.connect_timeout_seconds();
  settings.store.request_timeout_seconds    = s3.request_timeout_seconds();

  const auto& upload = config.upload();
  settings.schedule  = BuildSchedule(upload);

  auto& out               = settings.upload;
  out.file_stable_seconds = OrDefault(upload, &UploadConfig::has_file_stable_seconds, &UploadConfig::file_stable_seconds, defaults::kFileStableSeconds);
  out.upload_on_start     = OrDefault(upload, &UploadConfig::has_upload_on_start, &UploadConfig::upload_on_start, true);
  out.max_attempts        = OrDefault(upload, &UploadConfig::has_max_attempts, &UploadConfig::max_attempts, defaults::kMaxAttempts);
  out.workers             = OrDefault(upload, &UploadConfig::has_workers, &UploadConfig::workers, defaults::kWorkers);
  out.batch_size          = OrDefault(upload, &UploadConfig::has_batch_size, &UploadConfig::batch_size, defaults::kBatchSize);
  out.part_retries        = OrDefault(upload, &UploadConfig::has_part_retries, &UploadConfig::part_retries, defaults::kPartRetries);
  out.multipart_threshold_bytes =
      OrDefault(upload, &UploadConfig::has_multipart_threshold_bytes, &UploadConfig::multipart_threshold_bytes, defaults::kMultipartThresholdBytes);
  out.part_size_bytes  = OrDefault(upload, &UploadConfig::has_part_size_bytes, &UploadConfig::part_size_bytes, defaults::kPartSizeBytes);
  out.max_object_bytes = OrDefault(upload, &UploadConfig::has_max_object_bytes, &UploadConfig::max_object_bytes, defaults::kMaxObjectBytes);
  out.shutdown_grace_seconds =
      OrDefault(upload, &UploadConfig::has_shutdown_grace_seconds, &UploadConfig::shutdown_grace_seconds, defaults::kShutdownGraceSeconds);

  const auto& scan      = upload.scan_existing_files();
  out.scan_existing     = OrDefault(scan, &ScanExistingFilesConfig::has_enabled, &ScanExistingFilesConfig::enabled, true);
  out.scan_max_age_days = OrDefault(scan, &ScanExistingFilesConfig::has_max_age_days, &ScanExistingFilesConfig::max_age_days, defaults::kScanMaxAgeDays);

  if (!upload.queue_file().empty()) {
    settings.queue_file = upload.queue_file();
  }
  const auto& registry = upload.processed_files_registry();
  if (!registry.registry_file().empty()) {
    settings.registry_file = registry.registry_file();
  }
  settings.retention_days = registry.has_retention_days() ? registry.retention_days() : defaults::kRetentionDays;

  const auto& after_upload                = config.deletion().after_upload();
  settings.deletion.after_upload.enabled  = OrDefault(after_upload, &AfterUploadDeletionConfig::has_enabled, &AfterUploadDeletionConfig::enabled, true);
  settings.deletion.after_upload.keep_days =
      OrDefault(after_upload, &AfterUploadDeletionConfig::has_keep_days, &AfterUploadDeletionConfig::keep_days, defaults::kKeepDays);

  const auto& age_based                    = config.deletion().age_based();
  settings.deletion.age_based.enabled      = OrDefault(age_based, &AgeBasedDeletionConfig::has_enabled, &AgeBasedDeletionConfig::enabled, true);
  settings.deletion.age_based.max_age_days =
      OrDefault(age_based, &AgeBasedDeletionConfig::has_max_age_days, &AgeBasedDeletionConfig::max_age_days, defaults::kMaxAgeDays);
  settings.deletion.age_based.schedule_minute =
      *util::ParseTimeOfDay(age_based.schedule_time().empty() ? defaults::kAgeScheduleTime : age_based.schedule_time());

  settings.deletion.emergency.enabled = config.deletion().emergency().enabled();

  const auto& disk             = config.disk();
  settings.disk.warning        = disk.has_warning_threshold() ? disk.warning_threshold() : defaults::kWarningThreshold;
  settings.disk.critical       = disk.has_critical_threshold() ? disk.critical_threshold() : defaults::kCriticalThreshold;
  settings.disk.reserved_bytes = static_cast<uint64_t>(disk.reserved_gb() * 1024.0 * 1024.0 * 1024.0);
  settings.disk_usage_path     = disk.usage_path().empty() ? settings.rules.front().root : std::filesystem::path(disk.usage_path());

  return settings;
}

} // namespace logship::config
