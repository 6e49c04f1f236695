#include "internal/service/analytics_service.hpp"

#include <cassert>
#include <chrono>
#include <cmath>
#include <iostream>
#include <memory>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"

namespace {

using namespace std::chrono;
using runlens::analytics::TrendDirection;
using runlens::service::AnalyticsService;
using runlens::store::MetricRecord;
using runlens::store::TimeWindow;
using namespace runlens::taxonomy;

constexpr year_month_day kToday{year{2024}, month{3}, day{20}};

MetricRecord Make(const std::string& name, year_month_day date, double ef, double decoupling, int64_t session_id = 1) {
  MetricRecord record;
  record.content_hash = runlens::util::HashBytes(name);
  record.filename     = name;
  record.date         = date;
  record.session_id   = session_id;

  auto& m = record.metrics;
  m.set_sport("running");
  m.set_efficiency_factor(ef);
  m.set_decoupling_pct(decoupling);
  m.set_avg_cadence_spm(172);
  m.set_training_load(120.0);
  m.set_total_training_effect(3.6);
  m.set_total_anaerobic_training_effect(1.0);
  return record;
}

struct Fixture {
  std::shared_ptr<runlens::db::memory::MemoryRepository> repository = std::make_shared<runlens::db::memory::MemoryRepository>();
  std::shared_ptr<runlens::store::ActivityStore>         store = std::make_shared<runlens::store::ActivityStore>(repository, [] { return kToday; });
  AnalyticsService service{store, std::make_shared<runlens::classify::Classifier>(), 130.0};
};

void TestEmptyWindow() {
  Fixture f;

  auto out = f.service.Analyze(TimeWindow::kLast30Days);
  assert(out.rows.empty());
  assert(out.efficiency.insufficient_data);
  assert(out.trend.direction == TrendDirection::kInsufficientData);
  assert(!out.load_mix.has_value());
  assert(out.monthly.empty());
}

void TestWindowVerdicts() {
  Fixture f;

  auto one = Make("one.fit", year{2024} / 3 / 1, 1.0, 3.0);
  one.metrics.mutable_zone_time()->set_z2_s(3000);
  auto* split = one.metrics.add_splits();
  split->set_cadence_spm(168);
  split->set_heart_rate(145);
  f.store->Upsert(one);

  auto two = Make("two.fit", year{2024} / 3 / 8, 1.1, 7.0);
  two.metrics.mutable_zone_time()->set_z2_s(2000);
  two.metrics.mutable_zone_time()->set_z4_s(200);
  f.store->Upsert(two);

  f.store->Upsert(Make("three.fit", year{2024} / 3 / 15, 1.3, 2.0));

  auto out = f.service.Analyze(TimeWindow::kLast30Days);
  assert(out.rows.size() == 3);
  assert(std::fabs(out.efficiency.mean - 3.4 / 3.0) < 1e-9);
  assert(out.trend.direction == TrendDirection::kImproving);

  // newest first
  assert(out.rows[0].activity.record.filename == "three.fit");
  assert(out.rows[0].quadrant == QuadrantVerdict::kRaceReady);
  assert(out.rows[1].quadrant == QuadrantVerdict::kStruggling);
  assert(out.rows[1].decoupling == DecouplingStatus::kModerate);
  assert(out.rows[2].quadrant == QuadrantVerdict::kBaseMaintenance);

  assert(out.rows[0].form == FormVerdict::kEliteForm);
  assert(out.rows[0].load == LoadCategory::kBase);
  assert(out.rows[0].training_effect == TrainingEffectLabel::kThreshold);

  assert(out.split_totals.high_quality == 1);
  assert(out.load_mix == LoadMixVerdict::kZone2Base);
  assert(out.zone_time.Total() == 5200.0);
}

void TestInvalidMetricsBecomeRowErrors() {
  Fixture f;

  f.store->Upsert(Make("good.fit", year{2024} / 3 / 10, 1.2, 3.0));
  auto bad = Make("bad.fit", year{2024} / 3 / 11, 1.2, 3.0);
  bad.metrics.set_total_training_effect(7.5);
  f.store->Upsert(bad);

  auto out = f.service.Analyze(TimeWindow::kAllTime);
  assert(out.rows.size() == 1);
  assert(out.rows[0].activity.record.filename == "good.fit");
  assert(out.row_errors.size() == 1);
  assert(out.row_errors[0].key == runlens::util::ToHex(runlens::util::HashBytes("bad.fit")));
  assert(out.efficiency.count == 1);
}

void TestNonFiniteEfficiencyBecomesRowError() {
  Fixture f;

  f.store->Upsert(Make("good.fit", year{2024} / 3 / 10, 1.2, 3.0, 7));
  f.store->Upsert(Make("next.fit", year{2024} / 3 / 12, 1.3, 3.0, 7));

  // a payload that decodes cleanly but carries NaN
  runlens::db::model::ActivityRecord nan_row;
  nan_row.hash       = runlens::util::ToHex(runlens::util::HashBytes("nan.fit"));
  nan_row.filename   = "nan.fit";
  nan_row.date       = "2024-03-11";
  nan_row.session_id = 7;
  nan_row.json       = R"({"sport":"running","efficiency_factor":"NaN","decoupling_pct":3.0,"avg_cadence_spm":170})";
  {
    auto tx = f.repository->Begin();
    assert(f.repository->UpsertActivity(*tx, nan_row));
    tx->Commit();
  }

  auto queried = f.store->Query(TimeWindow::kLastImport, 7);
  assert(queried.activities.size() == 3);
  assert(queried.row_errors.empty());

  auto out = f.service.Analyze(TimeWindow::kLastImport, 7);
  assert(out.rows.size() == 2);
  assert(out.row_errors.size() == 1);
  assert(out.row_errors[0].key == nan_row.hash);
  assert(out.efficiency.count == 2);
  assert(std::fabs(out.efficiency.mean - 1.25) < 1e-9);
  assert(out.trend.direction == TrendDirection::kImproving);
}

void TestLongWindowsGetMonthlySummary() {
  Fixture f;

  for (int i = 0; i < 21; ++i) {
    auto date = year_month_day{sys_days{year{2024} / 1 / 1} + days{i * 3}};
    f.store->Upsert(Make("run" + std::to_string(i) + ".fit", date, 1.0 + i * 0.01, 4.0));
  }

  auto out = f.service.Analyze(TimeWindow::kAllTime);
  assert(out.rows.size() == 21);
  assert(out.monthly.size() == 3);
  assert(out.monthly[0].run_count + out.monthly[1].run_count + out.monthly[2].run_count == 21);
}

void TestLastImportAndPassThrough() {
  Fixture f;

  f.store->Upsert(Make("a.fit", year{2024} / 3 / 1, 1.0, 3.0, 10));
  f.store->Upsert(Make("b.fit", year{2024} / 3 / 2, 1.0, 3.0, 11));

  assert(f.service.Analyze(TimeWindow::kLastImport).rows.empty());
  assert(f.service.Analyze(TimeWindow::kLastImport, 11).rows.size() == 1);

  assert(f.service.Count() == 2);
  f.service.Delete(runlens::util::ToHex(runlens::util::HashBytes("a.fit")));
  f.service.Delete(runlens::util::ToHex(runlens::util::HashBytes("a.fit")));
  assert(f.service.Count() == 1);

  bool threw = false;
  try {
    f.service.Delete("not-a-hash");
  } catch (const runlens::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestEmptyWindow();
  TestWindowVerdicts();
  TestInvalidMetricsBecomeRowErrors();
  TestNonFiniteEfficiencyBecomesRowError();
  TestLongWindowsGetMonthlySummary();
  TestLastImportAndPassThrough();

  std::cout << "runlens_unit_analytics_service: pass\n";
  return 0;
}
