#pragma once

#include <cstdint>

#include "internal/factory.hpp"

namespace logship::runtime {

struct Statistics {
  uint64_t files_detected{0};
  uint64_t files_uploaded{0};
  uint64_t files_failed{0};
  uint64_t bytes_uploaded{0};
  uint64_t files_deleted{0};
};

/*
  One generation of the running service.

  Start() restores durable state before anything can enqueue, then brings
  up detection and scheduling. Stop() is bounded by the shutdown grace
  period and flushes both stores. A reload is Stop() on this instance and
  Start() on a new one.
*/
class Daemon {
 public:
  explicit Daemon(const config::Settings& settings, factory::Overrides overrides = {});
  ~Daemon();

  Daemon(const Daemon&)            = delete;
  Daemon& operator=(const Daemon&) = delete;

  // Throws util::StorageCorrupted when the queue or registry is unreadable.
  void Start();
  void Stop();

  Statistics statistics() const;

  factory::Application& app() {
    return app_;
  }

 private:
  void LogPolicySummary() const;

  factory::Application app_;
  bool                 started_{false};
};

// Human-readable configuration summary, also printed by --test-config.
void LogSettingsSummary(const config::Settings& settings);

} // namespace logship::runtime
