#pragma once

#include "internal/model/schedule.hpp"
#include "internal/util/time.hpp"

namespace logship::scheduler {

// [start, end) in local minutes; wraps midnight when start > end, always open when equal.
bool WithinWindow(const model::OperationalHours& hours, int minute_of_day);

// May the queue be drained at now.
bool DrainPermitted(const model::ScheduleState& schedule, util::TimePoint now);

// First local occurrence of minute_of_day strictly after `after`.
util::TimePoint NextDailyTime(int minute_of_day, util::TimePoint after);

// Next drain trigger strictly after `after`.
util::TimePoint NextDrainTime(const model::ScheduleState& schedule, util::TimePoint after);

} // namespace logship::scheduler
