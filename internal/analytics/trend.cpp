#include "internal/analytics/trend.hpp"

#include <cmath>
#include <set>
#include <string>

#include "internal/util/errors.hpp"

namespace runlens::analytics {

std::string_view TrendDirectionName(TrendDirection direction) {
  switch (direction) {
    case TrendDirection::kImproving:
      return "improving";
    case TrendDirection::kDeclining:
      return "declining";
    case TrendDirection::kStable:
      return "stable";
    case TrendDirection::kInsufficientData:
      return "insufficient-data";
  }
  return "unknown";
}

TrendResult ComputeTrend(const std::vector<store::StoredActivity>& activities, const classify::TrendThresholds& thresholds) {
  TrendResult result;

  std::set<std::chrono::sys_days> distinct;
  for (const auto& activity : activities) {
    distinct.insert(std::chrono::sys_days{activity.record.date});
  }
  if (distinct.size() < 2) {
    return result;
  }

  const auto earliest = std::chrono::year_month_day{*distinct.begin()};
  const auto n        = static_cast<double>(activities.size());

  double x_mean = 0.0;
  double y_mean = 0.0;
  for (const auto& activity : activities) {
    const double ef = activity.record.metrics.efficiency_factor();
    if (!std::isfinite(ef)) {
      throw util::InvalidMetricInput("efficiency factor of " + activity.record.filename + " is not finite");
    }
    x_mean += static_cast<double>(util::DaysBetween(earliest, activity.record.date));
    y_mean += ef;
  }
  x_mean /= n;
  y_mean /= n;

  double sxy = 0.0;
  double sxx = 0.0;
  for (const auto& activity : activities) {
    const double dx = static_cast<double>(util::DaysBetween(earliest, activity.record.date)) - x_mean;
    sxy += dx * (activity.record.metrics.efficiency_factor() - y_mean);
    sxx += dx * dx;
  }

  // two distinct dates guarantee sxx > 0
  result.slope_per_day = sxy / sxx;

  if (std::fabs(result.slope_per_day) < thresholds.stable_epsilon_per_day) {
    result.direction = TrendDirection::kStable;
  } else if (result.slope_per_day > 0) {
    result.direction = TrendDirection::kImproving;
  } else {
    result.direction = TrendDirection::kDeclining;
  }
  return result;
}

taxonomy::QuadrantVerdict ClassifyQuadrant(double efficiency_factor, double decoupling_pct, double mean_efficiency) {
  if (!std::isfinite(efficiency_factor) || !std::isfinite(decoupling_pct) || !std::isfinite(mean_efficiency)) {
    throw util::InvalidMetricInput("quadrant inputs must be finite");
  }

  const bool fast      = efficiency_factor >= mean_efficiency;
  const bool efficient = decoupling_pct <= kQuadrantDecouplingPct;

  if (fast) {
    return efficient ? taxonomy::QuadrantVerdict::kRaceReady : taxonomy::QuadrantVerdict::kExpensiveSpeed;
  }
  return efficient ? taxonomy::QuadrantVerdict::kBaseMaintenance : taxonomy::QuadrantVerdict::kStruggling;
}

taxonomy::QuadrantVerdict ClassifyQuadrant(const store::StoredActivity& activity, double mean_efficiency) {
  const auto& metrics = activity.record.metrics;
  return ClassifyQuadrant(metrics.efficiency_factor(), metrics.decoupling_pct(), mean_efficiency);
}

} // namespace runlens::analytics
