#pragma once

#include <chrono>
#include <cstdint>
#include <ctime>
#include <string>

namespace gridbot {

// -----------------------------------------------------------------------------
// Time conversion utilities
// -----------------------------------------------------------------------------
//
// @brief  Free functions over epoch-millisecond timestamps, the unit every
//         ITimeProvider returns.
//
// Thread-safety: Stateless; safe to call from any thread.
// -----------------------------------------------------------------------------

constexpr std::int64_t kMsPerSecond = 1000;
constexpr std::int64_t kMsPerMinute = 60 * kMsPerSecond;
constexpr std::int64_t kMsPerHour = 60 * kMsPerMinute;
constexpr std::int64_t kMsPerDay = 24 * kMsPerHour;

// -------------------------------------------------------------------------
// utc_day_index
// -------------------------------------------------------------------------
// @brief  Days since 1970-01-01 UTC for the given epoch milliseconds.
//
// @details
// Two timestamps fall on the same UTC calendar date exactly when their day
// indices are equal, which is what the daily equity-high reset compares.
// Floors toward negative infinity so pre-epoch values stay consistent.
// -------------------------------------------------------------------------
inline std::int64_t utc_day_index(std::int64_t ms) {
  std::int64_t day = ms / kMsPerDay;
  if (ms % kMsPerDay < 0) {
    --day;
  }
  return day;
}

inline double ms_to_hours(std::int64_t ms) {
  return static_cast<double>(ms) / static_cast<double>(kMsPerHour);
}

inline std::int64_t hours_to_ms(double hours) {
  return static_cast<std::int64_t>(hours * static_cast<double>(kMsPerHour));
}

// -------------------------------------------------------------------------
// format_iso8601_utc
// -------------------------------------------------------------------------
// @brief  Renders epoch milliseconds as "YYYY-MM-DDTHH:MM:SSZ" for status
//         frames and log lines.
// -------------------------------------------------------------------------
inline std::string format_iso8601_utc(std::int64_t ms) {
  std::int64_t whole = ms / kMsPerSecond;
  if (ms % kMsPerSecond < 0) {
    --whole;
  }
  std::time_t secs = static_cast<std::time_t>(whole);
  std::tm tm_utc{};
  gmtime_r(&secs, &tm_utc);
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm_utc);
  return buf;
}

}  // namespace gridbot
