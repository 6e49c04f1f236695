#include "internal/store/time_window.hpp"

#include <cassert>
#include <chrono>
#include <iostream>

namespace {

using namespace std::chrono;
using runlens::store::ParseTimeWindow;
using runlens::store::TimeWindow;
using runlens::store::TimeWindowName;
using runlens::store::WindowFilter;

constexpr year_month_day kToday{year{2024}, month{3}, day{15}};

void TestNamesRoundTrip() {
  for (auto window : runlens::store::kAllTimeWindows) {
    assert(ParseTimeWindow(TimeWindowName(window)) == window);
  }
  assert(TimeWindowName(TimeWindow::kLast30Days) == "Last 30 Days");
  assert(ParseTimeWindow("last 90 days") == TimeWindow::kLast90Days);
  assert(ParseTimeWindow("30d") == TimeWindow::kLast30Days);
  assert(ParseTimeWindow("ALL") == TimeWindow::kAllTime);
  assert(!ParseTimeWindow("Last 6 Months").has_value());
  assert(runlens::store::kDefaultTimeWindow == TimeWindow::kLast30Days);
}

void TestCalendarBounds() {
  auto last30 = WindowFilter(TimeWindow::kLast30Days, std::nullopt, kToday);
  assert(last30.has_value());
  assert(last30->min_date == "2024-02-14");
  assert(!last30->session_id.has_value());

  auto last90 = WindowFilter(TimeWindow::kLast90Days, std::nullopt, kToday);
  assert(last90->min_date == "2023-12-16");

  auto year = WindowFilter(TimeWindow::kThisYear, 42, kToday);
  assert(year->min_date == "2024-01-01");
  // the session id only scopes Last Import
  assert(!year->session_id.has_value());

  auto all = WindowFilter(TimeWindow::kAllTime, std::nullopt, kToday);
  assert(all.has_value());
  assert(!all->min_date.has_value());
  assert(!all->session_id.has_value());
}

void TestLastImportNeedsSession() {
  assert(!WindowFilter(TimeWindow::kLastImport, std::nullopt, kToday).has_value());

  auto scoped = WindowFilter(TimeWindow::kLastImport, 1700000000, kToday);
  assert(scoped.has_value());
  assert(scoped->session_id == 1700000000);
  assert(!scoped->min_date.has_value());
}

void TestSessionIdArguments() {
  using runlens::store::ParseSessionId;

  assert(ParseSessionId("1700000000") == 1700000000);
  assert(!ParseSessionId("").has_value());
  assert(!ParseSessionId("last").has_value());
  assert(!ParseSessionId("12abc").has_value());
  assert(!ParseSessionId("-5").has_value());
  assert(!ParseSessionId("+5").has_value());
  assert(!ParseSessionId("0").has_value());
  assert(!ParseSessionId("99999999999999999999").has_value());
}

} // namespace

int main() {
  TestNamesRoundTrip();
  TestCalendarBounds();
  TestLastImportNeedsSession();
  TestSessionIdArguments();

  std::cout << "runlens_unit_time_window: pass\n";
  return 0;
}
