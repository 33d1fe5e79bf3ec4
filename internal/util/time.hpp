#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace tablebook::util {

/*
  Time utilities. Single place to control the clock source and the
  civil date / time-of-day formats used on the wire.

  Dates are "YYYY-MM-DD", times of day are "HH:MM" and are carried
  internally as minutes since local midnight.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;
using Date      = std::chrono::year_month_day;

TimePoint Now();

uint64_t ToUnixMillis(TimePoint tp);

// nullopt when malformed or not a real calendar day
std::optional<Date> ParseDate(std::string_view text);
std::string         FormatDate(const Date& date);

// 0 = Monday ... 6 = Sunday
unsigned WeekdayIndex(const Date& date);

inline constexpr int kMinutesPerDay = 24 * 60;

// "HH:MM" in [00:00, 23:59]
std::optional<int> ParseTimeOfDay(std::string_view text);
std::string        FormatTimeOfDay(int minutes);

struct LocalDateTime {
  Date date;
  int  minute_of_day = 0;
};

// Wall clock of a restaurant at a fixed UTC offset.
LocalDateTime ToLocal(TimePoint tp, int utc_offset_minutes);
TimePoint     ToInstant(const Date& date, int minute_of_day, int utc_offset_minutes);

} // namespace tablebook::util
