#include "scheduler.hpp"

#include "internal/observability/logging.hpp"
#include "internal/scheduler/schedule_policy.hpp"

namespace logship::scheduler {

using logship::observability::StringField;

Scheduler::Scheduler(Options options, Jobs jobs, ClockFn clock) : options_(options), jobs_(std::move(jobs)), clock_(std::move(clock)) {
}

Scheduler::~Scheduler() {
  Stop();
}

void Scheduler::Initialize(util::TimePoint now) {
  next_drain_at_       = options_.upload_on_start ? now : NextDrainTime(options_.schedule, now);
  next_maintenance_at_ = now;
  next_age_sweep_at_   = NextDailyTime(options_.age_sweep_minute, now);
  next_prune_at_       = now + options_.prune_interval;
  drain_owed_          = false;
  deferral_logged_     = false;

  LOGSHIP_LOG_INFO("Scheduler armed", {StringField("mode", options_.schedule.mode == model::ScheduleMode::kDaily ? "daily" : "interval"),
                                       StringField("next_drain", util::LocalDate(next_drain_at_) + " " +
                                                                     util::FormatTimeOfDay(util::LocalMinuteOfDay(next_drain_at_)))});
}

Scheduler::TickResult Scheduler::Tick(util::TimePoint now) {
  TickResult result;

  if (now >= next_drain_at_) {
    drain_owed_    = true;
    next_drain_at_ = NextDrainTime(options_.schedule, now);
  }

  if (drain_owed_) {
    if (DrainPermitted(options_.schedule, now)) {
      drain_owed_      = false;
      deferral_logged_ = false;
      RunJob("drain", jobs_.drain);
      result.drained = true;
    } else {
      result.drain_deferred = true;
      if (!deferral_logged_) {
        const auto& hours = options_.schedule.operational_hours;
        LOGSHIP_LOG_INFO("Outside operational hours, upload deferred", {StringField("window_start", util::FormatTimeOfDay(hours.start_minute)),
                                                                         StringField("window_end", util::FormatTimeOfDay(hours.end_minute))});
        deferral_logged_ = true;
      }
    }
  }

  if (now >= next_maintenance_at_) {
    next_maintenance_at_ = now + options_.maintenance_interval;
    if (jobs_.deferred_cleanup) RunJob("deferred_cleanup", [&] { jobs_.deferred_cleanup(now); });
    if (jobs_.emergency_check) RunJob("emergency_check", [&] { jobs_.emergency_check(now); });
    result.maintenance = true;
  }

  if (now >= next_age_sweep_at_) {
    next_age_sweep_at_ = NextDailyTime(options_.age_sweep_minute, now);
    if (options_.age_sweep_enabled && jobs_.age_sweep) {
      RunJob("age_sweep", [&] { jobs_.age_sweep(now); });
      result.age_sweep = true;
    }
  }

  if (now >= next_prune_at_) {
    next_prune_at_ = now + options_.prune_interval;
    if (jobs_.registry_prune) {
      RunJob("registry_prune", [&] { jobs_.registry_prune(now); });
      result.pruned = true;
    }
  }

  return result;
}

void Scheduler::RunJob(const char* name, const std::function<void()>& job) {
  if (!job) return;
  try {
    job();
  } catch (const std::exception& e) {
    LOGSHIP_LOG_ERROR("Scheduled job failed", {StringField("job", name), StringField("error", e.what())});
  }
}

void Scheduler::Start() {
  Initialize(clock_());
  running_ = true;
  thread_  = std::thread(&Scheduler::Loop, this);
}

void Scheduler::RequestStop() {
  {
    std::lock_guard lock(mutex_);
    running_ = false;
  }
  cv_.notify_all();
}

void Scheduler::Stop() {
  RequestStop();
  if (thread_.joinable()) thread_.join();
}

void Scheduler::Loop() {
  while (running_) {
    Tick(clock_());

    std::unique_lock lock(mutex_);
    cv_.wait_for(lock, options_.tick_period, [&] { return !running_; });
  }
}

} // namespace logship::scheduler
