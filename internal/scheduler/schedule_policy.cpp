#include "schedule_policy.hpp"

#include <chrono>

namespace logship::scheduler {

using namespace std::chrono_literals;

bool WithinWindow(const model::OperationalHours& hours, int minute_of_day) {
  if (hours.start_minute == hours.end_minute) {
    return true;
  }
  if (hours.start_minute < hours.end_minute) {
    return minute_of_day >= hours.start_minute && minute_of_day < hours.end_minute;
  }
  return minute_of_day >= hours.start_minute || minute_of_day < hours.end_minute;
}

bool DrainPermitted(const model::ScheduleState& schedule, util::TimePoint now) {
  if (!schedule.operational_hours.enabled) {
    return true;
  }
  return WithinWindow(schedule.operational_hours, util::LocalMinuteOfDay(now));
}

util::TimePoint NextDailyTime(int minute_of_day, util::TimePoint after) {
  const auto offset    = std::chrono::minutes(minute_of_day);
  auto       candidate = util::LocalMidnight(after) + offset;
  if (candidate <= after) {
    // 36h lands inside tomorrow even across a DST change
    candidate = util::LocalMidnight(util::LocalMidnight(after) + 36h) + offset;
  }
  return candidate;
}

util::TimePoint NextDrainTime(const model::ScheduleState& schedule, util::TimePoint after) {
  switch (schedule.mode) {
    case model::ScheduleMode::kDaily:
      return NextDailyTime(schedule.daily_minute, after);
    case model::ScheduleMode::kInterval:
      break;
  }
  return after + std::chrono::duration_cast<util::Clock::duration>(schedule.interval);
}

} // namespace logship::scheduler
