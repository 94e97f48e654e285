#pragma once

#include <filesystem>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <vector>

#include "internal/model/file_identity.hpp"
#include "internal/util/time.hpp"

namespace logship::monitor {

/*
  Debounces filesystem activity into "stable" file identities.

  Every event for a path re-arms its timer. When a timer fires the file is
  stat'ed again and emitted only if size and mtime still match what was
  seen when the timer was armed; otherwise it is re-armed. Time is always
  passed in so tests can drive a simulated clock.
*/
class StabilityDetector {
 public:
  using StatFunction = std::function<std::optional<model::FileIdentity>(const std::filesystem::path&)>;

  explicit StabilityDetector(util::Clock::duration quiet_period, StatFunction stat = model::StatIdentity);

  void Observe(const std::filesystem::path& path, util::TimePoint now);

  // File removed or renamed away.
  void Forget(const std::filesystem::path& path);

  std::vector<model::FileIdentity> Poll(util::TimePoint now);

  std::optional<util::TimePoint> NextDeadline() const;

  size_t Armed() const;

 private:
  struct Timer {
    util::TimePoint                    deadline;
    std::optional<model::FileIdentity> snapshot;
  };

  util::Clock::duration quiet_period_;
  StatFunction          stat_;

  mutable std::mutex                     mutex_;
  std::map<std::filesystem::path, Timer> timers_;
};

} // namespace logship::monitor
