#include "internal/store/time_window.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <system_error>
#include <string>

namespace runlens::store {

namespace {

std::string Lower(std::string_view text) {
  std::string out(text);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

} // namespace

std::string_view TimeWindowName(TimeWindow window) {
  switch (window) {
    case TimeWindow::kLastImport:
      return "Last Import";
    case TimeWindow::kLast30Days:
      return "Last 30 Days";
    case TimeWindow::kLast90Days:
      return "Last 90 Days";
    case TimeWindow::kThisYear:
      return "This Year";
    case TimeWindow::kAllTime:
      return "All Time";
  }
  return "Unknown";
}

std::optional<TimeWindow> ParseTimeWindow(std::string_view text) {
  const auto lowered = Lower(text);
  for (TimeWindow window : kAllTimeWindows) {
    if (lowered == Lower(TimeWindowName(window))) return window;
  }
  if (lowered == "last-import") return TimeWindow::kLastImport;
  if (lowered == "30d") return TimeWindow::kLast30Days;
  if (lowered == "90d") return TimeWindow::kLast90Days;
  if (lowered == "year") return TimeWindow::kThisYear;
  if (lowered == "all") return TimeWindow::kAllTime;
  return std::nullopt;
}

std::optional<int64_t> ParseSessionId(std::string_view text) {
  if (text.empty() || !std::isdigit(static_cast<unsigned char>(text.front()))) return std::nullopt;

  int64_t value = 0;
  auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc() || end != text.data() + text.size() || value <= 0) return std::nullopt;
  return value;
}

std::optional<db::ActivityFilter> WindowFilter(TimeWindow window, std::optional<int64_t> session_id, const util::CalendarDate& today) {
  db::ActivityFilter filter;
  switch (window) {
    case TimeWindow::kLastImport:
      // never widen to all data when the session is unknown
      if (!session_id) return std::nullopt;
      filter.session_id = *session_id;
      break;
    case TimeWindow::kLast30Days:
      filter.min_date = util::FormatIsoDate(util::AddDays(today, -30));
      break;
    case TimeWindow::kLast90Days:
      filter.min_date = util::FormatIsoDate(util::AddDays(today, -90));
      break;
    case TimeWindow::kThisYear:
      filter.min_date = util::FormatIsoDate(util::CalendarDate{today.year(), std::chrono::January, std::chrono::day{1}});
      break;
    case TimeWindow::kAllTime:
      break;
  }
  return filter;
}

} // namespace runlens::store
