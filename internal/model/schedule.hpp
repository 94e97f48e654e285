#pragma once

#include <chrono>

namespace logship::model {

enum class ScheduleMode {
  kInterval,
  kDaily,
};

/*
  Time-of-day window [start, end) in local minutes. start > end wraps
  midnight; start == end is always open.
*/
struct OperationalHours {
  bool enabled{false};
  int  start_minute{0};
  int  end_minute{0};
};

struct ScheduleState {
  ScheduleMode         mode{ScheduleMode::kInterval};
  std::chrono::minutes interval{60};
  int                  daily_minute{0};
  OperationalHours     operational_hours;
};

} // namespace logship::model
