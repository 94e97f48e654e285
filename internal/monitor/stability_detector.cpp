#include "stability_detector.hpp"

namespace logship::monitor {

StabilityDetector::StabilityDetector(util::Clock::duration quiet_period, StatFunction stat)
    : quiet_period_(quiet_period), stat_(std::move(stat)) {
}

void StabilityDetector::Observe(const std::filesystem::path& path, util::TimePoint now) {
  auto snapshot = stat_(path);

  std::lock_guard lock(mutex_);
  timers_[path] = Timer{now + quiet_period_, std::move(snapshot)};
}

void StabilityDetector::Forget(const std::filesystem::path& path) {
  std::lock_guard lock(mutex_);
  timers_.erase(path);
}

std::vector<model::FileIdentity> StabilityDetector::Poll(util::TimePoint now) {
  std::vector<std::filesystem::path> due;
  {
    std::lock_guard lock(mutex_);
    for (const auto& [path, timer] : timers_) {
      if (timer.deadline <= now) {
        due.push_back(path);
      }
    }
  }

  std::vector<model::FileIdentity> stable;
  for (const auto& path : due) {
    auto current = stat_(path);

    std::lock_guard lock(mutex_);
    auto            it = timers_.find(path);
    // re-armed by an event while we were stat'ing
    if (it == timers_.end() || it->second.deadline > now) {
      continue;
    }

    if (!current) {
      timers_.erase(it);
      continue;
    }

    if (it->second.snapshot && *it->second.snapshot == *current) {
      stable.push_back(*current);
      timers_.erase(it);
      continue;
    }

    it->second = Timer{now + quiet_period_, std::move(current)};
  }
  return stable;
}

std::optional<util::TimePoint> StabilityDetector::NextDeadline() const {
  std::lock_guard                lock(mutex_);
  std::optional<util::TimePoint> earliest;
  for (const auto& [path, timer] : timers_) {
    if (!earliest || timer.deadline < *earliest) {
      earliest = timer.deadline;
    }
  }
  return earliest;
}

size_t StabilityDetector::Armed() const {
  std::lock_guard lock(mutex_);
  return timers_.size();
}

} // namespace logship::monitor
