#include "time.hpp"

#include <cstdio>

namespace tablebook::util {

namespace {

bool ParseDigits(std::string_view text, int& out) {
  if (text.empty()) return false;
  int value = 0;
  for (char c : text) {
    if (c < '0' || c > '9') return false;
    value = value * 10 + (c - '0');
  }
  out = value;
  return true;
}

} // namespace

TimePoint Now() {
  return Clock::now();
}

uint64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

std::optional<Date> ParseDate(std::string_view text) {
  if (text.size() != 10 || text[4] != '-' || text[7] != '-') {
    return std::nullopt;
  }

  int year = 0, month = 0, day = 0;
  if (!ParseDigits(text.substr(0, 4), year) || !ParseDigits(text.substr(5, 2), month) || !ParseDigits(text.substr(8, 2), day)) {
    return std::nullopt;
  }

  Date date{std::chrono::year{year}, std::chrono::month{static_cast<unsigned>(month)}, std::chrono::day{static_cast<unsigned>(day)}};
  if (!date.ok()) {
    return std::nullopt;
  }
  return date;
}

std::string FormatDate(const Date& date) {
  char buf[16];
  std::snprintf(buf, sizeof(buf), "%04d-%02u-%02u", static_cast<int>(date.year()), static_cast<unsigned>(date.month()),
                static_cast<unsigned>(date.day()));
  return buf;
}

unsigned WeekdayIndex(const Date& date) {
  // iso_encoding: Monday = 1 ... Sunday = 7
  return std::chrono::weekday{std::chrono::sys_days{date}}.iso_encoding() - 1;
}

std::optional<int> ParseTimeOfDay(std::string_view text) {
  if (text.size() != 5 || text[2] != ':') {
    return std::nullopt;
  }

  int hours = 0, minutes = 0;
  if (!ParseDigits(text.substr(0, 2), hours) || !ParseDigits(text.substr(3, 2), minutes)) {
    return std::nullopt;
  }
  if (hours > 23 || minutes > 59) {
    return std::nullopt;
  }
  return hours * 60 + minutes;
}

std::string FormatTimeOfDay(int minutes) {
  char buf[8];
  std::snprintf(buf, sizeof(buf), "%02d:%02d", minutes / 60, minutes % 60);
  return buf;
}

LocalDateTime ToLocal(TimePoint tp, int utc_offset_minutes) {
  const auto local = std::chrono::time_point_cast<std::chrono::minutes>(tp) + std::chrono::minutes(utc_offset_minutes);
  const auto day   = std::chrono::floor<std::chrono::days>(local);

  LocalDateTime out;
  out.date          = Date{day};
  out.minute_of_day = static_cast<int>((local - day).count());
  return out;
}

TimePoint ToInstant(const Date& date, int minute_of_day, int utc_offset_minutes) {
  return TimePoint{std::chrono::sys_days{date}} + std::chrono::minutes(minute_of_day) - std::chrono::minutes(utc_offset_minutes);
}

} // namespace tablebook::util
