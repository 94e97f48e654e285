#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace logship::util {

/*
  Time utilities. Every component takes TimePoint arguments explicitly so
  tests can drive a simulated clock.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

int64_t   ToUnixMillis(TimePoint tp);
TimePoint FromUnixMillis(int64_t ms);

int64_t   ToUnixNanos(TimePoint tp);
TimePoint FromUnixNanos(int64_t ns);

// Fractional days (retention settings allow 0.5 etc).
Clock::duration Days(double days);
Clock::duration Seconds(double seconds);

// "YYYY-MM-DD" of tp in the local timezone.
std::string LocalDate(TimePoint tp);

// Minutes since local midnight, 0..1439.
int LocalMinuteOfDay(TimePoint tp);

// Local midnight of the day containing tp.
TimePoint LocalMidnight(TimePoint tp);

// "HH:MM" -> minutes since midnight. nullopt unless 00:00..23:59.
std::optional<int> ParseTimeOfDay(std::string_view text);

std::string FormatTimeOfDay(int minute_of_day);

} // namespace logship::util
