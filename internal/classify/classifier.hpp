#pragma once

#include <cstddef>
#include <optional>

#include "internal/classify/thresholds.hpp"
#include "internal/taxonomy/verdicts.hpp"

namespace runlens::activity::v1 {
class ActivityMetrics;
class ZoneTime;
} // namespace runlens::activity::v1

namespace runlens::classify {

// Time-in-zone aggregate (seconds) over a window of activities.
struct ZoneDistribution {
  double z1_s = 0.0;
  double z2_s = 0.0;
  double z3_s = 0.0;
  double z4_s = 0.0;
  double z5_s = 0.0;

  double Total() const {
    return z1_s + z2_s + z3_s + z4_s + z5_s;
  }

  static ZoneDistribution FromProto(const runlens::activity::v1::ZoneTime& zone_time);
};

struct SplitTally {
  std::size_t high_quality = 0;
  std::size_t structural   = 0;
  std::size_t broken       = 0;
};

/*
  Maps numeric metrics to verdict keys.

  Stateless apart from the immutable thresholds; every method is const
  and safe to call concurrently. Inputs outside the documented domain
  (NaN, infinities, negative cadence / HR / load, training effect
  outside [0, 5]) throw util::InvalidMetricInput. Nothing is clamped.
*/
class Classifier {
 public:
  explicit Classifier(ClassifierThresholds thresholds = {});

  // >=170 ELITE, >=160 GOOD, <135 HIKING/REST, <155 HEAVY FEET, else PLODDING.
  taxonomy::FormVerdict ClassifyForm(double cadence_spm) const;

  // HIGH QUALITY iff cadence >= 160 and hr > zone-2 floor and grade <= 8%.
  // Otherwise STRUCTURAL iff grade > 8% or cadence < 140 or hr < floor.
  // Everything else (e.g. 140-159 spm at zone-2+ on flat ground) is BROKEN.
  taxonomy::SplitBucket ClassifySplit(double cadence_spm, double heart_rate, double zone2_floor_bpm, double grade_pct) const;

  // Anaerobic dominance is checked before aerobic; std::nullopt means the
  // session deliberately carries no label (base / recovery).
  std::optional<taxonomy::TrainingEffectLabel> ClassifyTrainingEffect(double aerobic_te, double anaerobic_te) const;

  // Bands closed on the low side: [0,75) [75,150) [150,300) [300,inf).
  taxonomy::LoadCategory ClassifyLoad(double trimp) const;

  taxonomy::LoadMixVerdict ClassifyLoadMix(const ZoneDistribution& zones) const;

  // <5% excellent, <=10% moderate, above that high fatigue.
  taxonomy::DecouplingStatus ClassifyDecoupling(double decoupling_pct) const;

  SplitTally ClassifySplits(const runlens::activity::v1::ActivityMetrics& metrics, double zone2_floor_bpm) const;

  const ClassifierThresholds& Thresholds() const {
    return thresholds_;
  }

 private:
  ClassifierThresholds thresholds_;
};

} // namespace runlens::classify
