#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <stdexcept>
#include <thread>

#include "internal/scheduler/schedule_policy.hpp"
#include "internal/scheduler/scheduler.hpp"
#include "tests/unit/test_support.hpp"

namespace {

using namespace std::chrono_literals;
using logship::model::OperationalHours;
using logship::model::ScheduleMode;
using logship::model::ScheduleState;
using logship::scheduler::Scheduler;
using logship::testing::FixedNow;

struct Counts {
  int drains{0};
  int cleanup{0};
  int emergency{0};
  int age{0};
  int prune{0};
};

Scheduler::Jobs CountingJobs(Counts& counts) {
  Scheduler::Jobs jobs;
  jobs.drain            = [&counts] { ++counts.drains; };
  jobs.deferred_cleanup = [&counts](logship::util::TimePoint) { ++counts.cleanup; };
  jobs.emergency_check  = [&counts](logship::util::TimePoint) { ++counts.emergency; };
  jobs.age_sweep        = [&counts](logship::util::TimePoint) { ++counts.age; };
  jobs.registry_prune   = [&counts](logship::util::TimePoint) { ++counts.prune; };
  return jobs;
}

void TestOperationalWindow() {
  using logship::scheduler::WithinWindow;

  OperationalHours day{true, 9 * 60, 17 * 60};
  assert(WithinWindow(day, 9 * 60));
  assert(WithinWindow(day, 16 * 60 + 59));
  assert(!WithinWindow(day, 17 * 60));
  assert(!WithinWindow(day, 8 * 60 + 59));

  OperationalHours night{true, 22 * 60, 6 * 60};
  assert(WithinWindow(night, 23 * 60));
  assert(WithinWindow(night, 0));
  assert(WithinWindow(night, 5 * 60 + 59));
  assert(!WithinWindow(night, 6 * 60));
  assert(!WithinWindow(night, 12 * 60));

  OperationalHours always{true, 8 * 60, 8 * 60};
  assert(WithinWindow(always, 3 * 60));

  ScheduleState schedule;
  schedule.operational_hours = day;
  // FixedNow is 12:00
  assert(logship::scheduler::DrainPermitted(schedule, FixedNow()));
  assert(!logship::scheduler::DrainPermitted(schedule, FixedNow() + 6h));
  schedule.operational_hours.enabled = false;
  assert(logship::scheduler::DrainPermitted(schedule, FixedNow() + 6h));
}

void TestNextTriggerTimes() {
  using logship::scheduler::NextDailyTime;
  using logship::scheduler::NextDrainTime;
  const auto now = FixedNow();

  assert(NextDailyTime(13 * 60, now) == now + 1h);
  // strictly after: the same minute today is already taken
  assert(NextDailyTime(12 * 60, now) == now + 24h);
  assert(NextDailyTime(2 * 60, now) == now + 14h);
  assert(NextDailyTime(0, now) == now + 12h);

  ScheduleState interval;
  interval.interval = 15min;
  assert(NextDrainTime(interval, now) == now + 15min);

  ScheduleState daily;
  daily.mode         = ScheduleMode::kDaily;
  daily.daily_minute = 3 * 60;
  assert(NextDrainTime(daily, now) == now + 15h);
}

void TestIntervalDrains() {
  Counts             counts;
  Scheduler::Options options;
  options.schedule.interval = 60min;
  options.upload_on_start   = false;
  options.age_sweep_enabled = false;
  Scheduler scheduler(options, CountingJobs(counts));

  const auto now = FixedNow();
  scheduler.Initialize(now);
  assert(scheduler.next_drain_at() == now + 60min);

  auto first = scheduler.Tick(now);
  assert(!first.drained && first.maintenance);
  assert(!scheduler.Tick(now + 59min).drained);
  assert(scheduler.Tick(now + 60min).drained);
  assert(!scheduler.Tick(now + 61min).drained);
  assert(scheduler.Tick(now + 120min).drained);
  assert(counts.drains == 2);
  assert(counts.age == 0);
}

void TestUploadOnStart() {
  Counts             counts;
  Scheduler::Options options;
  options.schedule.interval = 60min;
  Scheduler scheduler(options, CountingJobs(counts));

  scheduler.Initialize(FixedNow());
  assert(scheduler.Tick(FixedNow()).drained);
  assert(counts.drains == 1);
  assert(scheduler.next_drain_at() == FixedNow() + 60min);
}

void TestDrainHeldUntilWindowOpens() {
  Counts             counts;
  Scheduler::Options options;
  options.schedule.interval          = 60min;
  options.schedule.operational_hours = {true, 20 * 60, 6 * 60};
  Scheduler scheduler(options, CountingJobs(counts));

  const auto now = FixedNow();
  scheduler.Initialize(now);

  auto held = scheduler.Tick(now);
  assert(held.drain_deferred && !held.drained);
  assert(scheduler.drain_owed());
  // maintenance ignores the window
  assert(held.maintenance && counts.cleanup == 1 && counts.emergency == 1);

  assert(scheduler.Tick(now + 1h).drain_deferred);
  assert(scheduler.Tick(now + 7h).drain_deferred);

  // several missed triggers collapse into one drain at 20:00
  assert(scheduler.Tick(now + 8h).drained);
  assert(counts.drains == 1);
  assert(!scheduler.drain_owed());
  assert(!scheduler.Tick(now + 8h + 1min).drained);
  assert(scheduler.Tick(now + 9h).drained);
  assert(counts.drains == 2);
}

void TestDailyDrain() {
  Counts             counts;
  Scheduler::Options options;
  options.schedule.mode         = ScheduleMode::kDaily;
  options.schedule.daily_minute = 3 * 60;
  options.upload_on_start       = false;
  Scheduler scheduler(options, CountingJobs(counts));

  const auto now = FixedNow();
  scheduler.Initialize(now);
  assert(!scheduler.Tick(now + 14h + 59min).drained);
  assert(scheduler.Tick(now + 15h).drained);
  assert(scheduler.next_drain_at() == now + 39h);
}

void TestMaintenanceCadence() {
  Counts             counts;
  Scheduler::Options options;
  options.upload_on_start      = false;
  options.maintenance_interval = 60s;
  options.age_sweep_minute     = 2 * 60;
  Scheduler scheduler(options, CountingJobs(counts));

  const auto now = FixedNow();
  scheduler.Initialize(now);
  assert(scheduler.Tick(now).maintenance);
  assert(!scheduler.Tick(now + 30s).maintenance);
  assert(scheduler.Tick(now + 60s).maintenance);
  assert(counts.cleanup == 2);

  // age sweep at 02:00, prune a day after start
  assert(!scheduler.Tick(now + 13h).age_sweep);
  assert(scheduler.Tick(now + 14h).age_sweep);
  assert(!scheduler.Tick(now + 15h).age_sweep);
  assert(counts.age == 1);
  assert(!scheduler.Tick(now + 23h).pruned);
  assert(scheduler.Tick(now + 24h).pruned);
  assert(counts.prune == 1);
}

void TestFailingJobDoesNotStopTicks() {
  Counts             counts;
  auto               jobs = CountingJobs(counts);
  jobs.drain            = [] { throw std::runtime_error("boom"); };
  Scheduler::Options options;
  Scheduler          scheduler(options, jobs);

  scheduler.Initialize(FixedNow());
  auto result = scheduler.Tick(FixedNow());
  assert(result.drained && result.maintenance);
  assert(counts.cleanup == 1);
}

void TestBackgroundLoop() {
  std::atomic<int> drains{0};
  Scheduler::Jobs  jobs;
  jobs.drain = [&drains] { ++drains; };

  Scheduler::Options options;
  options.tick_period = 10ms;
  Scheduler scheduler(options, jobs);
  scheduler.Start();

  const auto deadline = std::chrono::steady_clock::now() + 5s;
  while (drains.load() == 0 && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(5ms);
  }
  scheduler.Stop();
  assert(drains.load() == 1);
}

} // namespace

int main() {
  logship::testing::UseUtc();

  TestOperationalWindow();
  TestNextTriggerTimes();
  TestIntervalDrains();
  TestUploadOnStart();
  TestDrainHeldUntilWindowOpens();
  TestDailyDrain();
  TestMaintenanceCadence();
  TestFailingJobDoesNotStopTicks();
  TestBackgroundLoop();

  std::cout << "logship_unit_scheduler: pass\n";
  return 0;
}
