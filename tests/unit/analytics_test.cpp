#include <cassert>
#include <chrono>
#include <cmath>
#include <iostream>
#include <string>
#include <vector>

#include "internal/analytics/aggregator.hpp"
#include "internal/analytics/trend.hpp"
#include "internal/util/errors.hpp"

namespace {

using namespace std::chrono;
using runlens::analytics::ClassifyQuadrant;
using runlens::analytics::ComputeTrend;
using runlens::analytics::MeanEfficiency;
using runlens::analytics::TrendDirection;
using runlens::store::StoredActivity;
using runlens::taxonomy::QuadrantVerdict;

StoredActivity Make(year_month_day date, double ef, double decoupling, const std::string& name = "run.fit") {
  StoredActivity activity;
  activity.record.filename = name;
  activity.record.date     = date;
  activity.record.metrics.set_efficiency_factor(ef);
  activity.record.metrics.set_decoupling_pct(decoupling);
  return activity;
}

bool Near(double a, double b, double eps = 1e-9) {
  return std::fabs(a - b) < eps;
}

void TestMeanEfficiency() {
  auto empty = MeanEfficiency({});
  assert(empty.insufficient_data);
  assert(empty.count == 0);
  assert(empty.mean == 0.0);

  auto mean = MeanEfficiency({Make(year{2024} / 1 / 1, 1.0, 0), Make(year{2024} / 1 / 2, 2.0, 0)});
  assert(!mean.insufficient_data);
  assert(mean.count == 2);
  assert(Near(mean.mean, 1.5));
}

void TestTrendNeedsTwoDistinctDates() {
  assert(ComputeTrend({}).direction == TrendDirection::kInsufficientData);
  assert(ComputeTrend({Make(year{2024} / 1 / 1, 1.2, 0)}).direction == TrendDirection::kInsufficientData);

  // two runs on the same day are still one date
  auto same_day = ComputeTrend({Make(year{2024} / 1 / 1, 1.0, 0), Make(year{2024} / 1 / 1, 1.4, 0)});
  assert(same_day.direction == TrendDirection::kInsufficientData);
  assert(same_day.slope_per_day == 0.0);
}

void TestTrendDirection() {
  auto improving = ComputeTrend({Make(year{2024} / 1 / 1, 1.0, 0), Make(year{2024} / 1 / 11, 1.5, 0)});
  assert(improving.direction == TrendDirection::kImproving);
  assert(Near(improving.slope_per_day, 0.05));

  auto declining = ComputeTrend({Make(year{2024} / 1 / 11, 1.0, 0), Make(year{2024} / 1 / 1, 1.5, 0)});
  assert(declining.direction == TrendDirection::kDeclining);
  assert(Near(declining.slope_per_day, -0.05));

  // below 0.00864 EF/day counts as flat
  auto stable = ComputeTrend({Make(year{2024} / 1 / 1, 1.0, 0), Make(year{2024} / 1 / 11, 1.05, 0)});
  assert(stable.direction == TrendDirection::kStable);

  runlens::classify::TrendThresholds strict;
  strict.stable_epsilon_per_day = 0.001;
  auto sensitive = ComputeTrend({Make(year{2024} / 1 / 1, 1.0, 0), Make(year{2024} / 1 / 11, 1.05, 0)}, strict);
  assert(sensitive.direction == TrendDirection::kImproving);
}

void TestQuadrantPartition() {
  const double mean = 1.2;

  assert(ClassifyQuadrant(1.3, 4.0, mean) == QuadrantVerdict::kRaceReady);
  assert(ClassifyQuadrant(1.3, 6.0, mean) == QuadrantVerdict::kExpensiveSpeed);
  assert(ClassifyQuadrant(1.1, 4.0, mean) == QuadrantVerdict::kBaseMaintenance);
  assert(ClassifyQuadrant(1.1, 6.0, mean) == QuadrantVerdict::kStruggling);

  // boundaries are closed toward the favourable side
  assert(ClassifyQuadrant(1.2, 5.0, mean) == QuadrantVerdict::kRaceReady);
  assert(ClassifyQuadrant(1.2, 5.01, mean) == QuadrantVerdict::kExpensiveSpeed);

  bool threw = false;
  try {
    (void)ClassifyQuadrant(std::nan(""), 1.0, mean);
  } catch (const runlens::util::InvalidMetricInput&) {
    threw = true;
  }
  assert(threw);
}

void TestEndToEndWindow() {
  std::vector<StoredActivity> window = {
      Make(year{2024} / 3 / 1, 1.0, 3.0, "one.fit"),
      Make(year{2024} / 3 / 8, 1.1, 7.0, "two.fit"),
      Make(year{2024} / 3 / 15, 1.3, 2.0, "three.fit"),
  };

  auto mean = MeanEfficiency(window);
  assert(Near(mean.mean, 3.4 / 3.0));
  assert(std::fabs(mean.mean - 1.133) < 0.001);

  assert(ClassifyQuadrant(window[0], mean.mean) == QuadrantVerdict::kBaseMaintenance);
  assert(ClassifyQuadrant(window[1], mean.mean) == QuadrantVerdict::kStruggling);
  assert(ClassifyQuadrant(window[2], mean.mean) == QuadrantVerdict::kRaceReady);

  auto trend = ComputeTrend(window);
  assert(trend.slope_per_day > 0.0);
  assert(trend.direction == TrendDirection::kImproving);
}

void TestMonthlySummaryAndZoneTotals() {
  std::vector<StoredActivity> window;
  auto                        a = Make(year{2024} / 1 / 5, 1.0, 4.0);
  a.record.metrics.set_distance_mi(5.0);
  a.record.metrics.set_avg_heart_rate(140);
  a.record.metrics.mutable_zone_time()->set_z2_s(1200);
  auto b = Make(year{2024} / 1 / 20, 1.2, 6.0);
  b.record.metrics.set_distance_mi(7.0);
  b.record.metrics.set_avg_heart_rate(150);
  b.record.metrics.mutable_zone_time()->set_z2_s(600);
  b.record.metrics.mutable_zone_time()->set_z4_s(300);
  auto c = Make(year{2024} / 2 / 2, 1.4, 2.0);
  c.record.metrics.set_distance_mi(10.0);
  window = {c, b, a};

  auto months = runlens::analytics::SummarizeByMonth(window);
  assert(months.size() == 2);
  assert(months[0].month == year{2024} / January);
  assert(months[0].run_count == 2);
  assert(Near(months[0].mean_efficiency, 1.1));
  assert(Near(months[0].mean_decoupling, 5.0));
  assert(Near(months[0].total_distance_mi, 12.0));
  assert(Near(months[0].mean_heart_rate, 145.0));
  assert(months[1].month == year{2024} / February);
  assert(months[1].run_count == 1);

  auto zones = runlens::analytics::TotalZoneTime(window);
  assert(zones.z2_s == 1800.0);
  assert(zones.z4_s == 300.0);
  assert(zones.Total() == 2100.0);
}

} // namespace

int main() {
  TestMeanEfficiency();
  TestTrendNeedsTwoDistinctDates();
  TestTrendDirection();
  TestQuadrantPartition();
  TestEndToEndWindow();
  TestMonthlySummaryAndZoneTotals();

  std::cout << "runlens_unit_analytics: pass\n";
  return 0;
}
