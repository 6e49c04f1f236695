#include "internal/classify/classifier.hpp"

#include <cassert>
#include <cmath>
#include <iostream>
#include <limits>

#include "internal/util/errors.hpp"
#include "runlens/activity/v1/activity.pb.h"

namespace {

using runlens::classify::Classifier;
using runlens::classify::ClassifierThresholds;
using runlens::classify::ZoneDistribution;
using namespace runlens::taxonomy;

template <typename Fn>
bool ThrowsInvalidMetric(Fn&& fn) {
  try {
    fn();
  } catch (const runlens::util::InvalidMetricInput&) {
    return true;
  }
  return false;
}

void TestFormBoundaries() {
  Classifier c;

  assert(c.ClassifyForm(170.0) == FormVerdict::kEliteForm);
  assert(c.ClassifyForm(169.9) == FormVerdict::kGoodForm);
  assert(c.ClassifyForm(169.0) == FormVerdict::kGoodForm);
  assert(c.ClassifyForm(160.0) == FormVerdict::kGoodForm);
  assert(c.ClassifyForm(159.0) == FormVerdict::kPlodding);
  assert(c.ClassifyForm(155.0) == FormVerdict::kPlodding);
  assert(c.ClassifyForm(154.9) == FormVerdict::kHeavyFeet);
  assert(c.ClassifyForm(135.0) == FormVerdict::kHeavyFeet);
  assert(c.ClassifyForm(134.0) == FormVerdict::kHikingRest);
  assert(c.ClassifyForm(0.0) == FormVerdict::kHikingRest);
}

void TestLoadBoundaries() {
  Classifier c;

  assert(c.ClassifyLoad(0.0) == LoadCategory::kRecovery);
  assert(c.ClassifyLoad(74.999) == LoadCategory::kRecovery);
  assert(c.ClassifyLoad(75.0) == LoadCategory::kBase);
  assert(c.ClassifyLoad(149.999) == LoadCategory::kBase);
  assert(c.ClassifyLoad(150.0) == LoadCategory::kOverload);
  assert(c.ClassifyLoad(299.999) == LoadCategory::kOverload);
  assert(c.ClassifyLoad(300.0) == LoadCategory::kOverreaching);
  assert(c.ClassifyLoad(1200.0) == LoadCategory::kOverreaching);
}

void TestSplitBuckets() {
  Classifier   c;
  const double floor = 130.0;

  assert(c.ClassifySplit(165.0, 145.0, floor, 2.0) == SplitBucket::kHighQuality);
  assert(c.ClassifySplit(160.0, 131.0, floor, 8.0) == SplitBucket::kHighQuality);

  // steep ground is structural regardless of mechanics
  assert(c.ClassifySplit(175.0, 150.0, floor, 8.1) == SplitBucket::kStructural);
  assert(c.ClassifySplit(120.0, 150.0, floor, 0.0) == SplitBucket::kStructural);
  assert(c.ClassifySplit(170.0, 120.0, floor, 0.0) == SplitBucket::kStructural);

  // 140-159 spm above the floor on flat ground falls through to broken
  assert(c.ClassifySplit(150.0, 150.0, floor, 1.0) == SplitBucket::kBroken);
  assert(c.ClassifySplit(140.0, 140.0, floor, 0.0) == SplitBucket::kBroken);

  // hr exactly at the floor: not above it for quality, not below it for structural
  assert(c.ClassifySplit(165.0, 130.0, floor, 0.0) == SplitBucket::kBroken);

  assert(ThrowsInvalidMetric([&] { c.ClassifySplit(165.0, 150.0, 0.0, 0.0); }));
  assert(ThrowsInvalidMetric([&] { c.ClassifySplit(-1.0, 150.0, floor, 0.0); }));
}

void TestTrainingEffect() {
  Classifier c;

  assert(c.ClassifyTrainingEffect(2.0, 3.5) == TrainingEffectLabel::kMaxPower);
  assert(c.ClassifyTrainingEffect(4.9, 3.6) == TrainingEffectLabel::kMaxPower);

  // anaerobic needs to be close to aerobic
  assert(c.ClassifyTrainingEffect(3.0, 2.5) == TrainingEffectLabel::kAnaerobic);
  assert(c.ClassifyTrainingEffect(3.3, 2.8) == TrainingEffectLabel::kAnaerobic);
  assert(c.ClassifyTrainingEffect(4.0, 2.6) == TrainingEffectLabel::kThreshold);
  assert(c.ClassifyTrainingEffect(4.5, 2.6) == TrainingEffectLabel::kVo2Max);

  assert(c.ClassifyTrainingEffect(4.2, 0.0) == TrainingEffectLabel::kVo2Max);
  assert(c.ClassifyTrainingEffect(3.5, 1.0) == TrainingEffectLabel::kThreshold);
  assert(!c.ClassifyTrainingEffect(3.4, 1.0).has_value());
  assert(!c.ClassifyTrainingEffect(0.0, 0.0).has_value());

  assert(ThrowsInvalidMetric([&] { c.ClassifyTrainingEffect(5.1, 0.0); }));
  assert(ThrowsInvalidMetric([&] { c.ClassifyTrainingEffect(1.0, -0.1); }));
}

void TestLoadMix() {
  Classifier c;

  ZoneDistribution base{.z1_s = 3000, .z2_s = 6000, .z3_s = 600, .z4_s = 300, .z5_s = 0};
  assert(c.ClassifyLoadMix(base) == LoadMixVerdict::kZone2Base);

  ZoneDistribution addict{.z1_s = 1000, .z2_s = 3000, .z3_s = 2000, .z4_s = 2500, .z5_s = 1500};
  assert(c.ClassifyLoadMix(addict) == LoadMixVerdict::kZone4ThresholdAddict);

  ZoneDistribution junk{.z1_s = 1000, .z2_s = 3000, .z3_s = 5000, .z4_s = 1000, .z5_s = 0};
  assert(c.ClassifyLoadMix(junk) == LoadMixVerdict::kZone3Junk);

  ZoneDistribution tempo_threshold{.z1_s = 2000, .z2_s = 4000, .z3_s = 2000, .z4_s = 2000, .z5_s = 0};
  assert(c.ClassifyLoadMix(tempo_threshold) == LoadMixVerdict::kTempoThreshold);

  ZoneDistribution tempo_heavy{.z1_s = 2000, .z2_s = 5000, .z3_s = 2500, .z4_s = 500, .z5_s = 0};
  assert(c.ClassifyLoadMix(tempo_heavy) == LoadMixVerdict::kTempoHeavy);

  assert(ThrowsInvalidMetric([&] { c.ClassifyLoadMix(ZoneDistribution{}); }));
  assert(ThrowsInvalidMetric([&] { c.ClassifyLoadMix(ZoneDistribution{.z1_s = -1.0, .z2_s = 10.0}); }));
}

void TestDecouplingStatus() {
  Classifier c;

  assert(c.ClassifyDecoupling(-2.0) == DecouplingStatus::kExcellent);
  assert(c.ClassifyDecoupling(4.99) == DecouplingStatus::kExcellent);
  assert(c.ClassifyDecoupling(5.0) == DecouplingStatus::kModerate);
  assert(c.ClassifyDecoupling(10.0) == DecouplingStatus::kModerate);
  assert(c.ClassifyDecoupling(10.01) == DecouplingStatus::kHighFatigue);
}

void TestSplitTally() {
  Classifier c;

  runlens::activity::v1::ActivityMetrics metrics;
  auto add = [&](double cadence, double hr, double grade) {
    auto* split = metrics.add_splits();
    split->set_cadence_spm(cadence);
    split->set_heart_rate(hr);
    split->set_grade_pct(grade);
  };
  add(170, 150, 1);
  add(172, 152, 0);
  add(130, 150, 12);
  add(150, 150, 0);

  auto tally = c.ClassifySplits(metrics, 130.0);
  assert(tally.high_quality == 2);
  assert(tally.structural == 1);
  assert(tally.broken == 1);
}

void TestNonFiniteInputsRejected() {
  Classifier   c;
  const double nan = std::numeric_limits<double>::quiet_NaN();
  const double inf = std::numeric_limits<double>::infinity();

  assert(ThrowsInvalidMetric([&] { c.ClassifyForm(nan); }));
  assert(ThrowsInvalidMetric([&] { c.ClassifyForm(-5.0); }));
  assert(ThrowsInvalidMetric([&] { c.ClassifyLoad(inf); }));
  assert(ThrowsInvalidMetric([&] { c.ClassifyLoad(-0.5); }));
  assert(ThrowsInvalidMetric([&] { c.ClassifyDecoupling(nan); }));
}

void TestSubstitutedThresholds() {
  ClassifierThresholds t;
  t.form.elite_min_spm = 180.0;
  t.load.base_min      = 50.0;
  Classifier c(t);

  assert(c.ClassifyForm(175.0) == FormVerdict::kGoodForm);
  assert(c.ClassifyForm(180.0) == FormVerdict::kEliteForm);
  assert(c.ClassifyLoad(60.0) == LoadCategory::kBase);

  ClassifierThresholds broken;
  broken.form.good_min_spm = 175.0; // above elite
  bool threw = false;
  try {
    Classifier bad(broken);
  } catch (const runlens::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestFormBoundaries();
  TestLoadBoundaries();
  TestSplitBuckets();
  TestTrainingEffect();
  TestLoadMix();
  TestDecouplingStatus();
  TestSplitTally();
  TestNonFiniteInputsRejected();
  TestSubstitutedThresholds();

  std::cout << "runlens_unit_classifier: pass\n";
  return 0;
}
