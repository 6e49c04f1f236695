#pragma once

#include <chrono>
#include <cstddef>
#include <vector>

#include "internal/classify/classifier.hpp"
#include "internal/store/activity_store.hpp"

namespace runlens::analytics {

struct EfficiencyAggregate {
  double      mean  = 0.0;
  std::size_t count = 0;

  // Set when the window is empty; mean is then 0 and must not be used
  // as a comparison baseline.
  bool insufficient_data = true;
};

// One calendar month of a long window.
struct MonthlySummary {
  std::chrono::year_month month;

  std::size_t run_count          = 0;
  double      mean_efficiency    = 0.0;
  double      mean_decoupling    = 0.0;
  double      total_distance_mi  = 0.0;
  double      mean_heart_rate    = 0.0;
};

// Arithmetic mean of efficiency_factor. Non-finite EF throws
// util::InvalidMetricInput.
EfficiencyAggregate MeanEfficiency(const std::vector<store::StoredActivity>& activities);

// Oldest month first.
std::vector<MonthlySummary> SummarizeByMonth(const std::vector<store::StoredActivity>& activities);

// Sum of zone_time over the window; activities without zone time add 0.
classify::ZoneDistribution TotalZoneTime(const std::vector<store::StoredActivity>& activities);

} // namespace runlens::analytics
