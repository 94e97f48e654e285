#include "daemon.hpp"

#include <chrono>

#include "internal/cleanup/deletion_manager.hpp"
#include "internal/monitor/file_monitor.hpp"
#include "internal/observability/logging.hpp"
#include "internal/queue/upload_queue.hpp"
#include "internal/registry/processed_registry.hpp"
#include "internal/scheduler/scheduler.hpp"
#include "internal/upload/upload_engine.hpp"

namespace logship::runtime {

using logship::observability::BoolField;
using logship::observability::DoubleField;
using logship::observability::IntField;
using logship::observability::StringField;

Daemon::Daemon(const config::Settings& settings, factory::Overrides overrides) : app_(factory::Build(settings, std::move(overrides))) {
}

Daemon::~Daemon() {
  Stop();
}

void Daemon::Start() {
  const auto now = util::Now();

  // ------------------------------------------------------------------
  // Durable state first: nothing may enqueue before the reload
  // ------------------------------------------------------------------
  app_.queue->Load();

  const auto records = app_.registry->Load();
  const auto pruned =
      app_.registry->Prune(now, [queue = app_.queue](const model::FileIdentity& identity) { return queue->Contains(identity); });
  LOGSHIP_LOG_INFO("Processed-file registry loaded", {IntField("records", static_cast<int64_t>(records)), IntField("pruned", static_cast<int64_t>(pruned))});

  LogPolicySummary();

  // ------------------------------------------------------------------
  // Pipeline
  // ------------------------------------------------------------------
  app_.engine->Start();
  app_.monitor->Start();
  app_.scheduler->Start();
  started_ = true;

  LOGSHIP_LOG_INFO("logship started", {StringField("vehicle_id", app_.settings.vehicle_id)});
}

void Daemon::Stop() {
  if (!started_) {
    return;
  }
  started_ = false;

  LOGSHIP_LOG_INFO("Shutting down logship");

  app_.monitor->Stop();
  app_.scheduler->RequestStop();
  app_.engine->Stop(std::chrono::duration_cast<std::chrono::milliseconds>(util::Seconds(app_.settings.upload.shutdown_grace_seconds)));
  app_.scheduler->Stop();

  try {
    app_.queue->Flush();
    app_.registry->Flush();
  } catch (const std::exception& e) {
    LOGSHIP_LOG_ERROR("Flushing state on shutdown failed", {StringField("error", e.what())});
  }

  const auto stats = statistics();
  LOGSHIP_LOG_INFO("Session statistics", {IntField("files_detected", static_cast<int64_t>(stats.files_detected)),
                                          IntField("files_uploaded", static_cast<int64_t>(stats.files_uploaded)),
                                          IntField("files_failed", static_cast<int64_t>(stats.files_failed)),
                                          IntField("bytes_uploaded", static_cast<int64_t>(stats.bytes_uploaded)),
                                          IntField("files_deleted", static_cast<int64_t>(stats.files_deleted)),
                                          IntField("queue_depth", static_cast<int64_t>(app_.queue->Depth()))});
}

Statistics Daemon::statistics() const {
  Statistics stats;
  stats.files_detected = app_.monitor->files_detected();
  stats.files_uploaded = app_.engine->total_uploaded();
  stats.files_failed   = app_.engine->total_failed();
  stats.bytes_uploaded = app_.engine->total_bytes();
  stats.files_deleted  = app_.deletion->total_deleted();
  return stats;
}

void Daemon::LogPolicySummary() const {
  LogSettingsSummary(app_.settings);
  if (const auto failed = app_.queue->PermanentlyFailedCount(); failed > 0) {
    LOGSHIP_LOG_WARN("Permanently failed uploads need operator attention", {IntField("entries", static_cast<int64_t>(failed))});
  }
}

void LogSettingsSummary(const config::Settings& settings) {
  const auto& store = settings.store;
  LOGSHIP_LOG_INFO("Configuration", {StringField("vehicle_id", settings.vehicle_id),
                                     StringField("bucket", store.uri.empty() ? store.bucket : store.uri),
                                     StringField("region", store.region),
                                     IntField("directories", static_cast<int64_t>(settings.rules.size()))});

  for (const auto& rule : settings.rules) {
    LOGSHIP_LOG_INFO("Log directory", {StringField("path", rule.root.string()), StringField("source", rule.source),
                                       StringField("pattern", rule.pattern.empty() ? "*" : rule.pattern), BoolField("recursive", rule.recursive),
                                       BoolField("allow_deletion", rule.allow_deletion)});
  }

  const auto& schedule = settings.schedule;
  if (schedule.mode == model::ScheduleMode::kDaily) {
    LOGSHIP_LOG_INFO("Upload schedule", {StringField("mode", "daily"), StringField("time", util::FormatTimeOfDay(schedule.daily_minute))});
  } else {
    LOGSHIP_LOG_INFO("Upload schedule", {StringField("mode", "interval"), IntField("minutes", schedule.interval.count())});
  }
  if (schedule.operational_hours.enabled) {
    LOGSHIP_LOG_INFO("Operational hours", {StringField("start", util::FormatTimeOfDay(schedule.operational_hours.start_minute)),
                                           StringField("end", util::FormatTimeOfDay(schedule.operational_hours.end_minute))});
  }

  const auto& deletion = settings.deletion;
  LOGSHIP_LOG_INFO("Deletion policy: after upload", {BoolField("enabled", deletion.after_upload.enabled),
                                                     DoubleField("keep_days", deletion.after_upload.keep_days)});
  LOGSHIP_LOG_INFO("Deletion policy: age based", {BoolField("enabled", deletion.age_based.enabled),
                                                  DoubleField("max_age_days", deletion.age_based.max_age_days),
                                                  StringField("schedule_time", util::FormatTimeOfDay(deletion.age_based.schedule_minute))});
  LOGSHIP_LOG_INFO("Deletion policy: emergency", {BoolField("enabled", deletion.emergency.enabled),
                                                  DoubleField("warning_threshold", settings.disk.warning),
                                                  DoubleField("critical_threshold", settings.disk.critical),
                                                  DoubleField("reserved_gb", static_cast<double>(settings.disk.reserved_bytes) / (1024.0 * 1024.0 * 1024.0))});
}

} // namespace logship::runtime
