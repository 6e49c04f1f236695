#include "time.hpp"

#include <charconv>
#include <cstdio>
#include <system_error>

namespace runlens::util {

namespace {

bool ParseDigits(std::string_view text, int& out) {
  if (text.empty()) return false;
  for (char c : text) {
    if (c < '0' || c > '9') return false;
  }
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
  return ec == std::errc() && ptr == text.data() + text.size();
}

} // namespace

TimePoint Now() {
  return Clock::now();
}

CalendarDate Today() {
  return ToCalendarDate(Now());
}

CalendarDate ToCalendarDate(TimePoint tp) {
  return CalendarDate{std::chrono::floor<std::chrono::days>(tp)};
}

std::string FormatIsoDate(const CalendarDate& date) {
  char buf[16];
  std::snprintf(buf, sizeof(buf), "%04d-%02u-%02u", static_cast<int>(date.year()), static_cast<unsigned>(date.month()),
                static_cast<unsigned>(date.day()));
  return buf;
}

std::optional<CalendarDate> ParseIsoDate(std::string_view text) {
  if (text.size() < 10 || text[4] != '-' || text[7] != '-') {
    return std::nullopt;
  }
  if (text.size() > 10 && text[10] != 'T' && text[10] != ' ') {
    return std::nullopt;
  }

  int y = 0;
  int m = 0;
  int d = 0;
  if (!ParseDigits(text.substr(0, 4), y) || !ParseDigits(text.substr(5, 2), m) || !ParseDigits(text.substr(8, 2), d)) {
    return std::nullopt;
  }

  CalendarDate date{std::chrono::year{y}, std::chrono::month{static_cast<unsigned>(m)}, std::chrono::day{static_cast<unsigned>(d)}};
  if (!date.ok()) {
    return std::nullopt;
  }
  return date;
}

int64_t DaysBetween(const CalendarDate& from, const CalendarDate& to) {
  return (std::chrono::sys_days{to} - std::chrono::sys_days{from}).count();
}

CalendarDate AddDays(const CalendarDate& date, int64_t days) {
  return CalendarDate{std::chrono::sys_days{date} + std::chrono::days{days}};
}

int64_t ToUnixSeconds(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
}

} // namespace runlens::util
