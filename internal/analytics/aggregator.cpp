#include "internal/analytics/aggregator.hpp"

#include <cmath>
#include <map>
#include <string>

#include "internal/util/errors.hpp"

namespace runlens::analytics {

namespace {

double CheckedEfficiency(const store::StoredActivity& activity) {
  const double ef = activity.record.metrics.efficiency_factor();
  if (!std::isfinite(ef)) {
    throw util::InvalidMetricInput("efficiency factor of " + activity.record.filename + " is not finite");
  }
  return ef;
}

struct MonthAccumulator {
  std::size_t runs        = 0;
  double      ef_sum      = 0.0;
  double      decoupling  = 0.0;
  double      distance_mi = 0.0;
  double      hr_sum      = 0.0;
};

} // namespace

EfficiencyAggregate MeanEfficiency(const std::vector<store::StoredActivity>& activities) {
  EfficiencyAggregate aggregate;
  if (activities.empty()) {
    return aggregate;
  }

  double sum = 0.0;
  for (const auto& activity : activities) {
    sum += CheckedEfficiency(activity);
  }

  aggregate.count             = activities.size();
  aggregate.mean              = sum / static_cast<double>(aggregate.count);
  aggregate.insufficient_data = false;
  return aggregate;
}

std::vector<MonthlySummary> SummarizeByMonth(const std::vector<store::StoredActivity>& activities) {
  std::map<std::chrono::year_month, MonthAccumulator> months;

  for (const auto& activity : activities) {
    const auto& date    = activity.record.date;
    const auto& metrics = activity.record.metrics;

    auto& acc = months[std::chrono::year_month{date.year(), date.month()}];
    acc.runs++;
    acc.ef_sum += CheckedEfficiency(activity);
    acc.decoupling += metrics.decoupling_pct();
    acc.distance_mi += metrics.distance_mi();
    acc.hr_sum += metrics.avg_heart_rate();
  }

  std::vector<MonthlySummary> out;
  out.reserve(months.size());
  for (const auto& [month, acc] : months) {
    const double n = static_cast<double>(acc.runs);

    MonthlySummary summary;
    summary.month             = month;
    summary.run_count         = acc.runs;
    summary.mean_efficiency   = acc.ef_sum / n;
    summary.mean_decoupling   = acc.decoupling / n;
    summary.total_distance_mi = acc.distance_mi;
    summary.mean_heart_rate   = acc.hr_sum / n;
    out.push_back(summary);
  }
  return out;
}

classify::ZoneDistribution TotalZoneTime(const std::vector<store::StoredActivity>& activities) {
  classify::ZoneDistribution total;
  for (const auto& activity : activities) {
    const auto& metrics = activity.record.metrics;
    if (!metrics.has_zone_time()) {
      continue;
    }
    auto zones = classify::ZoneDistribution::FromProto(metrics.zone_time());
    total.z1_s += zones.z1_s;
    total.z2_s += zones.z2_s;
    total.z3_s += zones.z3_s;
    total.z4_s += zones.z4_s;
    total.z5_s += zones.z5_s;
  }
  return total;
}

} // namespace runlens::analytics
