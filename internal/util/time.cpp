#include "time.hpp"

#include <ctime>
#include <stdexcept>

#include <spdlog/fmt/fmt.h>

namespace logship::util {

namespace {

std::tm ToLocalTm(TimePoint tp) {
  const std::time_t seconds = Clock::to_time_t(tp);
  std::tm           local{};
  if (localtime_r(&seconds, &local) == nullptr) {
    throw std::runtime_error("localtime_r failed");
  }
  return local;
}

} // namespace

TimePoint Now() {
  return Clock::now();
}

int64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

TimePoint FromUnixMillis(int64_t ms) {
  return TimePoint{} + std::chrono::milliseconds(ms);
}

int64_t ToUnixNanos(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::nanoseconds>(tp.time_since_epoch()).count();
}

TimePoint FromUnixNanos(int64_t ns) {
  return TimePoint{} + std::chrono::duration_cast<Clock::duration>(std::chrono::nanoseconds(ns));
}

Clock::duration Days(double days) {
  return Seconds(days * 86400.0);
}

Clock::duration Seconds(double seconds) {
  return std::chrono::duration_cast<Clock::duration>(std::chrono::duration<double>(seconds));
}

std::string LocalDate(TimePoint tp) {
  const auto local = ToLocalTm(tp);
  return fmt::format("{:04d}-{:02d}-{:02d}", local.tm_year + 1900, local.tm_mon + 1, local.tm_mday);
}

int LocalMinuteOfDay(TimePoint tp) {
  const auto local = ToLocalTm(tp);
  return local.tm_hour * 60 + local.tm_min;
}

TimePoint LocalMidnight(TimePoint tp) {
  auto local    = ToLocalTm(tp);
  local.tm_hour = 0;
  local.tm_min  = 0;
  local.tm_sec  = 0;
  local.tm_isdst = -1;
  return Clock::from_time_t(std::mktime(&local));
}

std::optional<int> ParseTimeOfDay(std::string_view text) {
  if (text.size() != 5 || text[2] != ':') {
    return std::nullopt;
  }
  auto digit = [](char c) { return c >= '0' && c <= '9'; };
  if (!digit(text[0]) || !digit(text[1]) || !digit(text[3]) || !digit(text[4])) {
    return std::nullopt;
  }
  const int hours   = (text[0] - '0') * 10 + (text[1] - '0');
  const int minutes = (text[3] - '0') * 10 + (text[4] - '0');
  if (hours > 23 || minutes > 59) {
    return std::nullopt;
  }
  return hours * 60 + minutes;
}

std::string FormatTimeOfDay(int minute_of_day) {
  return fmt::format("{:02d}:{:02d}", minute_of_day / 60, minute_of_day % 60);
}

} // namespace logship::util
