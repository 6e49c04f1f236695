#include "internal/service/analytics_service.hpp"

#include <cmath>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace runlens::service {

using runlens::observability::IntField;
using runlens::observability::StringField;

AnalyticsService::AnalyticsService(std::shared_ptr<store::ActivityStore>       store,
                                   std::shared_ptr<const classify::Classifier> classifier,
                                   double                                      zone2_floor_bpm)
    : store_(std::move(store)), classifier_(std::move(classifier)), zone2_floor_bpm_(zone2_floor_bpm) {
  if (!store_ || !classifier_) {
    throw util::InvalidArgument("analytics service requires a store and a classifier");
  }
}

ActivityRow AnalyticsService::ClassifyRow(store::StoredActivity activity) const {
  const auto& m = activity.record.metrics;
  if (!std::isfinite(m.efficiency_factor()) || m.efficiency_factor() < 0.0) {
    throw util::InvalidMetricInput("efficiency factor of " + activity.record.filename + " is not a finite non-negative value");
  }

  ActivityRow row;
  row.form            = classifier_->ClassifyForm(m.avg_cadence_spm());
  row.load            = classifier_->ClassifyLoad(m.training_load());
  row.training_effect = classifier_->ClassifyTrainingEffect(m.total_training_effect(), m.total_anaerobic_training_effect());
  row.decoupling      = classifier_->ClassifyDecoupling(m.decoupling_pct());
  row.splits          = classifier_->ClassifySplits(m, zone2_floor_bpm_);
  // quadrant is placed once the window mean is known
  row.activity = std::move(activity);
  return row;
}

WindowAnalytics AnalyticsService::Analyze(store::TimeWindow window, std::optional<int64_t> session_id) {
  WindowAnalytics out;
  out.window     = window;
  out.session_id = session_id;

  auto result    = store_->Query(window, session_id);
  out.row_errors = std::move(result.row_errors);

  std::vector<store::StoredActivity> valid;
  for (auto& activity : result.activities) {
    try {
      out.rows.push_back(ClassifyRow(activity));
      valid.push_back(std::move(activity));
    } catch (const util::InvalidMetricInput& e) {
      RUNLENS_LOG_WARN("activity excluded from analytics", {StringField("hash", activity.key), StringField("error", e.what())});
      out.row_errors.push_back(store::RowError{activity.key, e.what()});
    }
  }

  out.efficiency = analytics::MeanEfficiency(valid);
  out.trend      = analytics::ComputeTrend(valid, classifier_->Thresholds().trend);

  for (auto& row : out.rows) {
    row.quadrant = analytics::ClassifyQuadrant(row.activity, out.efficiency.mean);
    out.split_totals.high_quality += row.splits.high_quality;
    out.split_totals.structural += row.splits.structural;
    out.split_totals.broken += row.splits.broken;
  }

  out.zone_time = analytics::TotalZoneTime(valid);
  if (out.zone_time.Total() > 0) {
    out.load_mix = classifier_->ClassifyLoadMix(out.zone_time);
  }

  if (out.rows.size() > kMonthlySummaryMinActivities) {
    out.monthly = analytics::SummarizeByMonth(valid);
  }

  RUNLENS_LOG_INFO("window analysed", {StringField("window", store::TimeWindowName(window)), IntField("rows", static_cast<int64_t>(out.rows.size())),
                                       IntField("row_errors", static_cast<int64_t>(out.row_errors.size())),
                                       StringField("trend", analytics::TrendDirectionName(out.trend.direction))});
  return out;
}

void AnalyticsService::Delete(const std::string& key) {
  auto hash = util::ContentHashFromHex(key);
  if (!hash) {
    throw util::InvalidArgument("malformed activity hash: " + key);
  }
  store_->Delete(*hash);
}

uint64_t AnalyticsService::Count() {
  return store_->Count();
}

} // namespace runlens::service
