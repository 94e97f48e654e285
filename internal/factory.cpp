#include "factory.hpp"

#include "internal/cleanup/deletion_manager.hpp"
#include "internal/cleanup/disk_gauge.hpp"
#include "internal/model/watch_rule.hpp"
#include "internal/monitor/file_monitor.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/queue/upload_queue.hpp"
#include "internal/registry/processed_registry.hpp"
#include "internal/scheduler/scheduler.hpp"
#include "internal/storage/storage_factory.hpp"
#include "internal/upload/upload_engine.hpp"

namespace logship::factory {

namespace {

upload::TransferOptions ToTransferOptions(const config::UploadSettings& upload) {
  upload::TransferOptions options;
  options.multipart_threshold_bytes = upload.multipart_threshold_bytes;
  options.part_size_bytes           = upload.part_size_bytes;
  options.max_object_bytes          = upload.max_object_bytes;
  options.part_retries              = upload.part_retries;
  return options;
}

} // namespace

Application Build(const config::Settings& settings, Overrides overrides) {
  Application app;
  app.settings = settings;

  // ------------------------------------------------------------------
  // Shared state
  // ------------------------------------------------------------------
  app.metrics = overrides.metrics ? std::move(overrides.metrics) : observability::MakeMetricsPublisher();
  app.matcher = std::make_shared<const model::RuleMatcher>(settings.rules);

  queue::UploadQueue::Options queue_options;
  queue_options.max_attempts = settings.upload.max_attempts;
  app.queue                  = std::make_shared<queue::UploadQueue>(settings.queue_file, queue_options);
  app.registry               = std::make_shared<registry::ProcessedRegistry>(settings.registry_file, settings.retention_days);

  // ------------------------------------------------------------------
  // Remote store and local disk
  // ------------------------------------------------------------------
  app.store = overrides.store ? std::move(overrides.store) : storage::BuildObjectStore(settings.store);

  std::shared_ptr<cleanup::DiskGauge> gauge = overrides.disk_gauge;
  if (!gauge) {
    gauge = std::make_shared<cleanup::StatvfsDiskGauge>(settings.disk_usage_path);
  }
  app.deletion = std::make_shared<cleanup::DeletionManager>(settings.deletion, settings.disk, app.matcher, app.registry, gauge, app.metrics);

  // ------------------------------------------------------------------
  // Pipeline
  // ------------------------------------------------------------------
  monitor::FileMonitor::Options monitor_options;
  monitor_options.file_stable_seconds = settings.upload.file_stable_seconds;
  monitor_options.scan_existing       = settings.upload.scan_existing;
  monitor_options.scan_max_age_days   = settings.upload.scan_max_age_days;
  app.monitor = std::make_shared<monitor::FileMonitor>(monitor_options, app.matcher, app.queue, app.registry, app.metrics);

  upload::UploadEngine::Options engine_options;
  engine_options.vehicle_id = settings.vehicle_id;
  engine_options.batch_size = settings.upload.batch_size;
  engine_options.workers    = settings.upload.workers;
  engine_options.transfer   = ToTransferOptions(settings.upload);
  app.engine = std::make_shared<upload::UploadEngine>(engine_options, app.matcher, app.queue, app.registry, app.store, app.metrics);

  app.engine->SetUploadedHook([deletion = app.deletion](const model::FileIdentity& identity, util::TimePoint now) {
    deletion->OnUploaded(identity, now);
  });

  // ------------------------------------------------------------------
  // Scheduler
  // ------------------------------------------------------------------
  scheduler::Scheduler::Options scheduler_options;
  scheduler_options.schedule          = settings.schedule;
  scheduler_options.upload_on_start   = settings.upload.upload_on_start;
  scheduler_options.age_sweep_enabled = settings.deletion.age_based.enabled;
  scheduler_options.age_sweep_minute  = settings.deletion.age_based.schedule_minute;

  scheduler::Scheduler::Jobs jobs;
  jobs.drain            = [engine = app.engine] { engine->RequestDrain(); };
  jobs.deferred_cleanup = [deletion = app.deletion](util::TimePoint now) { deletion->RunDeferred(now); };
  jobs.emergency_check  = [deletion = app.deletion](util::TimePoint now) {
    if (deletion->policy().emergency.enabled) {
      deletion->RunEmergency(now);
    } else {
      deletion->CheckDisk();
    }
  };
  jobs.age_sweep      = [deletion = app.deletion](util::TimePoint now) { deletion->RunAgeSweep(now); };
  jobs.registry_prune = [registry = app.registry, queue = app.queue](util::TimePoint now) {
    queue->PruneStaleFailures();
    registry->Prune(now, [&queue](const model::FileIdentity& identity) { return queue->Contains(identity); });
  };
  app.scheduler = std::make_shared<scheduler::Scheduler>(scheduler_options, std::move(jobs));

  return app;
}

} // namespace logship::factory
