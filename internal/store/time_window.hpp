#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

#include "internal/db/api/types.hpp"
#include "internal/util/time.hpp"

namespace runlens::store {

/*
  The five supported read windows.

  kLastImport is session scoped; the others are calendar scoped and
  inclusive of the boundary day.
*/
enum class TimeWindow {
  kLastImport,
  kLast30Days,
  kLast90Days,
  kThisYear,
  kAllTime,
};

inline constexpr TimeWindow kDefaultTimeWindow = TimeWindow::kLast30Days;

inline constexpr std::array<TimeWindow, 5> kAllTimeWindows = {
    TimeWindow::kLastImport, TimeWindow::kLast30Days, TimeWindow::kLast90Days, TimeWindow::kThisYear, TimeWindow::kAllTime,
};

// Display name, e.g. "Last 30 Days".
std::string_view TimeWindowName(TimeWindow window);

// Accepts the display name (case-insensitive) or the short CLI forms
// "last-import", "30d", "90d", "year", "all".
std::optional<TimeWindow> ParseTimeWindow(std::string_view text);

// Parses a Last Import session id: decimal digits only, positive, in range.
std::optional<int64_t> ParseSessionId(std::string_view text);

// Repository filter for `window` evaluated on `today`.
// std::nullopt means the window is empty by definition (Last Import
// without a session id) and no query must be issued.
std::optional<db::ActivityFilter> WindowFilter(TimeWindow window, std::optional<int64_t> session_id, const util::CalendarDate& today);

} // namespace runlens::store
