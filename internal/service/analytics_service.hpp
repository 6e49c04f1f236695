#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/analytics/aggregator.hpp"
#include "internal/analytics/trend.hpp"
#include "internal/classify/classifier.hpp"
#include "internal/store/activity_store.hpp"

namespace runlens::service {

// Windows with more activities than this are summarised per month.
inline constexpr std::size_t kMonthlySummaryMinActivities = 20;

struct ActivityRow {
  store::StoredActivity activity;

  taxonomy::FormVerdict                        form     = taxonomy::FormVerdict::kPlodding;
  taxonomy::LoadCategory                       load     = taxonomy::LoadCategory::kRecovery;
  std::optional<taxonomy::TrainingEffectLabel> training_effect;
  taxonomy::QuadrantVerdict                    quadrant = taxonomy::QuadrantVerdict::kBaseMaintenance;
  taxonomy::DecouplingStatus                   decoupling = taxonomy::DecouplingStatus::kExcellent;
  classify::SplitTally                         splits;
};

/*
  Everything the presentation layer needs for one window.

  Rows whose metrics cannot be classified are moved to row_errors and
  excluded from every aggregate.
*/
struct WindowAnalytics {
  store::TimeWindow      window = store::kDefaultTimeWindow;
  std::optional<int64_t> session_id;

  std::vector<ActivityRow> rows; // newest first

  analytics::EfficiencyAggregate efficiency;
  analytics::TrendResult         trend;

  classify::ZoneDistribution              zone_time;
  std::optional<taxonomy::LoadMixVerdict> load_mix; // absent without zone time

  classify::SplitTally split_totals;

  // filled when rows.size() > kMonthlySummaryMinActivities
  std::vector<analytics::MonthlySummary> monthly;

  std::vector<store::RowError> row_errors;
};

class AnalyticsService {
 public:
  AnalyticsService(std::shared_ptr<store::ActivityStore> store, std::shared_ptr<const classify::Classifier> classifier, double zone2_floor_bpm);

  WindowAnalytics Analyze(store::TimeWindow window, std::optional<int64_t> session_id = std::nullopt);

  // `key` is the 64 character hex hash. Throws util::InvalidArgument
  // when malformed; deleting an absent key is a no-op.
  void Delete(const std::string& key);

  uint64_t Count();

 private:
  ActivityRow ClassifyRow(store::StoredActivity activity) const;

  std::shared_ptr<store::ActivityStore>       store_;
  std::shared_ptr<const classify::Classifier> classifier_;
  double                                      zone2_floor_bpm_;
};

} // namespace runlens::service
