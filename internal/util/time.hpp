#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace runlens::util {

/*
  Time utilities — single place to control clock source later.

  Activity dates are calendar days (no time of day); they are stored
  as ISO "YYYY-MM-DD" text so lexical and chronological order agree.
*/

using Clock        = std::chrono::system_clock;
using TimePoint    = Clock::time_point;
using CalendarDate = std::chrono::year_month_day;

TimePoint Now();

// Current calendar date (UTC).
CalendarDate Today();

CalendarDate ToCalendarDate(TimePoint tp);

std::string FormatIsoDate(const CalendarDate& date);

// Accepts "YYYY-MM-DD" optionally followed by a time part
// ("YYYY-MM-DDTHH:MM:SS" / "YYYY-MM-DD HH:MM:SS"), which is ignored.
std::optional<CalendarDate> ParseIsoDate(std::string_view text);

// Signed whole days from `from` to `to`.
int64_t DaysBetween(const CalendarDate& from, const CalendarDate& to);

CalendarDate AddDays(const CalendarDate& date, int64_t days);

int64_t ToUnixSeconds(TimePoint tp);

} // namespace runlens::util
