#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>

#include "internal/model/schedule.hpp"
#include "internal/util/time.hpp"

namespace logship::scheduler {

/*
  The only component that triggers time-based work.

  Drains fire on the interval/daily schedule (or once at start) and are
  held back outside operational hours; a held drain runs at the first
  tick inside the window. Cleanup and maintenance ignore the window.

  Tick() is driven by one thread: the internal loop, or a test.
*/
class Scheduler {
 public:
  struct Jobs {
    std::function<void()>                drain;
    std::function<void(util::TimePoint)> deferred_cleanup;
    std::function<void(util::TimePoint)> emergency_check;
    std::function<void(util::TimePoint)> age_sweep;
    std::function<void(util::TimePoint)> registry_prune;
  };

  struct Options {
    model::ScheduleState      schedule;
    bool                      upload_on_start{true};
    bool                      age_sweep_enabled{true};
    int                       age_sweep_minute{2 * 60};
    std::chrono::seconds      maintenance_interval{60};
    std::chrono::hours        prune_interval{24};
    std::chrono::milliseconds tick_period{1000};
  };

  struct TickResult {
    bool drained{false};
    bool drain_deferred{false};
    bool maintenance{false};
    bool age_sweep{false};
    bool pruned{false};
  };

  using ClockFn = std::function<util::TimePoint()>;

  Scheduler(Options options, Jobs jobs, ClockFn clock = util::Now);
  ~Scheduler();

  // Arms every timer relative to now.
  void Initialize(util::TimePoint now);

  TickResult Tick(util::TimePoint now);

  void Start();

  // Stop issuing ticks without waiting for a running job.
  void RequestStop();
  void Stop();

  util::TimePoint next_drain_at() const {
    return next_drain_at_;
  }

  bool drain_owed() const {
    return drain_owed_;
  }

 private:
  void Loop();
  void RunJob(const char* name, const std::function<void()>& job);

  Options options_;
  Jobs    jobs_;
  ClockFn clock_;

  util::TimePoint next_drain_at_{};
  util::TimePoint next_maintenance_at_{};
  util::TimePoint next_age_sweep_at_{};
  util::TimePoint next_prune_at_{};
  bool            drain_owed_{false};
  bool            deferral_logged_{false};

  std::thread             thread_;
  std::mutex              mutex_;
  std::condition_variable cv_;
  std::atomic<bool>       running_{false};
};

} // namespace logship::scheduler
