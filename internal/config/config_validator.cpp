#include "config_validator.hpp"

#include <regex>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "internal/config/config_error.hpp"
#include "internal/config/settings.hpp"
#include "internal/util/time.hpp"

namespace logship::config {

namespace {

class Errors {
 public:
  void Add(std::string message) {
    messages_.push_back(std::move(message));
  }

  void ThrowIfAny() const {
    if (messages_.empty()) {
      return;
    }
    std::string joined = "Invalid configuration: ";
    for (size_t i = 0; i < messages_.size(); ++i) {
      if (i > 0) {
        joined += "; ";
      }
      joined += messages_[i];
    }
    throw ConfigError(joined);
  }

 private:
  std::vector<std::string> messages_;
};

void CheckTimeOfDay(Errors& errors, const std::string& field, const std::string& value) {
  if (!util::ParseTimeOfDay(value)) {
    errors.Add(field + " must be HH:MM, got '" + value + "'");
  }
}

void ValidateLogDirectories(const logship::runtime::config::RuntimeConfig& config, Errors& errors) {
  if (config.log_directories().empty()) {
    errors.Add("log_directories cannot be empty");
    return;
  }

  static const std::regex kSourcePattern("^[A-Za-z0-9_]+$");

  std::set<std::string> seen_paths;
  std::set<std::string> seen_sources;
  for (int i = 0; i < config.log_directories_size(); ++i) {
    const auto& dir    = config.log_directories(i);
    const auto  prefix = "log_directories[" + std::to_string(i) + "]";

    if (dir.path().empty()) {
      errors.Add(prefix + ".path must be a non-empty string");
    } else if (!seen_paths.insert(model::NormalizeRoot(dir.path()).string()).second) {
      errors.Add(prefix + ": duplicate path '" + dir.path() + "'");
    }

    if (dir.source().empty()) {
      errors.Add(prefix + ".source must be a non-empty string");
    } else if (!std::regex_match(dir.source(), kSourcePattern)) {
      errors.Add(prefix + ".source must contain only letters, numbers and underscores, got '" + dir.source() + "'");
    } else if (!seen_sources.insert(dir.source()).second) {
      errors.Add(prefix + ": duplicate source '" + dir.source() + "'");
    }
  }
}

void ValidateUpload(const logship::runtime::config::UploadConfig& upload, Errors& errors) {
  const auto& schedule = upload.schedule();
  if (schedule.mode() == "daily") {
    CheckTimeOfDay(errors, "upload.schedule.daily_time", schedule.daily_time());
  } else if (schedule.mode() == "interval") {
    if (schedule.interval_hours() < 0 || schedule.interval_minutes() < 0) {
      errors.Add("upload.schedule intervals must be >= 0");
    } else {
      const double total_minutes = schedule.interval_hours() * 60 + schedule.interval_minutes();
      if (total_minutes < defaults::kMinIntervalMinutes) {
        errors.Add("upload.schedule: minimum interval is 5 minutes");
      } else if (total_minutes > defaults::kMaxIntervalMinutes) {
        errors.Add("upload.schedule: maximum interval is 24 hours");
      }
    }
  } else {
    errors.Add("upload.schedule.mode must be 'daily' or 'interval', got '" + schedule.mode() + "'");
  }

  if (upload.has_file_stable_seconds() && upload.file_stable_seconds() < 0) {
    errors.Add("upload.file_stable_seconds must be >= 0");
  }

  if (upload.operational_hours().enabled()) {
    CheckTimeOfDay(errors, "upload.operational_hours.start", upload.operational_hours().start());
    CheckTimeOfDay(errors, "upload.operational_hours.end", upload.operational_hours().end());
  }

  if (upload.scan_existing_files().has_max_age_days() && upload.scan_existing_files().max_age_days() < 0) {
    errors.Add("upload.scan_existing_files.max_age_days must be >= 0");
  }

  if (upload.processed_files_registry().has_retention_days() && upload.processed_files_registry().retention_days() <= 0) {
    errors.Add("upload.processed_files_registry.retention_days must be > 0");
  }

  if (upload.has_max_attempts() && upload.max_attempts() < 1) {
    errors.Add("upload.max_attempts must be >= 1");
  }
  if (upload.has_workers() && upload.workers() < 1) {
    errors.Add("upload.workers must be >= 1");
  }
  if (upload.has_batch_size() && upload.batch_size() < 1) {
    errors.Add("upload.batch_size must be >= 1");
  }
  if (upload.has_part_size_bytes() && upload.part_size_bytes() == 0) {
    errors.Add("upload.part_size_bytes must be > 0");
  }
  if (upload.has_shutdown_grace_seconds() && upload.shutdown_grace_seconds() < 0) {
    errors.Add("upload.shutdown_grace_seconds must be >= 0");
  }
}

void ValidateDisk(const logship::runtime::config::DiskConfig& disk, Errors& errors) {
  if (disk.reserved_gb() <= 0) {
    errors.Add("disk.reserved_gb must be positive");
  }

  const double warning  = disk.has_warning_threshold() ? disk.warning_threshold() : defaults::kWarningThreshold;
  const double critical = disk.has_critical_threshold() ? disk.critical_threshold() : defaults::kCriticalThreshold;
  if (warning <= 0 || warning >= 1) {
    errors.Add("disk.warning_threshold must be between 0 and 1");
  }
  if (critical <= 0 || critical >= 1) {
    errors.Add("disk.critical_threshold must be between 0 and 1");
  }
  if (critical <= warning) {
    errors.Add("disk.critical_threshold must be greater than disk.warning_threshold");
  }
}

void ValidateDeletion(const logship::runtime::config::RuntimeConfig& config, Errors& errors) {
  const auto& deletion = config.deletion();

  if (deletion.after_upload().has_keep_days() && deletion.after_upload().keep_days() < 0) {
    errors.Add("deletion.after_upload.keep_days must be >= 0");
  }
  if (deletion.age_based().has_max_age_days() && deletion.age_based().max_age_days() < 0) {
    errors.Add("deletion.age_based.max_age_days must be >= 0");
  }
  if (!deletion.age_based().schedule_time().empty()) {
    CheckTimeOfDay(errors, "deletion.age_based.schedule_time", deletion.age_based().schedule_time());
  }

  // The registry is the evidence of upload; it must outlive the keep period.
  const bool   after_upload_enabled = !deletion.after_upload().has_enabled() || deletion.after_upload().enabled();
  const double keep_days      = deletion.after_upload().has_keep_days() ? deletion.after_upload().keep_days() : defaults::kKeepDays;
  const auto&  registry       = config.upload().processed_files_registry();
  const double retention_days = registry.has_retention_days() ? registry.retention_days() : defaults::kRetentionDays;
  if (after_upload_enabled && retention_days < keep_days) {
    errors.Add("upload.processed_files_registry.retention_days must be >= deletion.after_upload.keep_days");
  }
}

} // namespace

void ValidateConfig(const logship::runtime::config::RuntimeConfig& config) {
  Errors errors;

  if (config.vehicle_id().empty()) {
    errors.Add("vehicle_id must be a non-empty string");
  }

  ValidateLogDirectories(config, errors);

  if (config.s3().uri().empty()) {
    if (config.s3().bucket().empty()) {
      errors.Add("Missing s3.bucket");
    }
    if (config.s3().region().empty()) {
      errors.Add("Missing s3.region");
    }
  }

  const auto& observability = config.observability();
  if (observability.has_trace_sample_ratio() && (observability.trace_sample_ratio() < 0 || observability.trace_sample_ratio() > 1)) {
    errors.Add("observability.trace_sample_ratio must be between 0 and 1");
  }

  ValidateUpload(config.upload(), errors);
  ValidateDisk(config.disk(), errors);
  ValidateDeletion(config, errors);

  errors.ThrowIfAny();
}

} // namespace logship::config
