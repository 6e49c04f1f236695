#include "internal/classify/classifier.hpp"

#include <cmath>
#include <string>

#include "internal/util/errors.hpp"
#include "runlens/activity/v1/activity.pb.h"

namespace runlens::classify {

using namespace runlens::taxonomy;

namespace {

constexpr double kMaxTrainingEffect = 5.0;

void RequireFinite(double value, const char* name) {
  if (!std::isfinite(value)) {
    throw runlens::util::InvalidMetricInput(std::string(name) + " must be a finite number");
  }
}

void RequireNonNegative(double value, const char* name) {
  RequireFinite(value, name);
  if (value < 0.0) {
    throw runlens::util::InvalidMetricInput(std::string(name) + " must not be negative, got " + std::to_string(value));
  }
}

void RequireTrainingEffect(double value, const char* name) {
  RequireNonNegative(value, name);
  if (value > kMaxTrainingEffect) {
    throw runlens::util::InvalidMetricInput(std::string(name) + " must be within [0, 5], got " + std::to_string(value));
  }
}

} // namespace

ZoneDistribution ZoneDistribution::FromProto(const runlens::activity::v1::ZoneTime& zone_time) {
  ZoneDistribution zones;
  zones.z1_s = zone_time.z1_s();
  zones.z2_s = zone_time.z2_s();
  zones.z3_s = zone_time.z3_s();
  zones.z4_s = zone_time.z4_s();
  zones.z5_s = zone_time.z5_s();
  return zones;
}

Classifier::Classifier(ClassifierThresholds thresholds) : thresholds_(thresholds) {
  ValidateThresholds(thresholds_);
}

FormVerdict Classifier::ClassifyForm(double cadence_spm) const {
  RequireNonNegative(cadence_spm, "cadence_spm");
  const auto& t = thresholds_.form;

  // Order matters: the two lower bands are only reached once both upper
  // bands have failed.
  if (cadence_spm >= t.elite_min_spm) return FormVerdict::kEliteForm;
  if (cadence_spm >= t.good_min_spm) return FormVerdict::kGoodForm;
  if (cadence_spm < t.hiking_max_spm) return FormVerdict::kHikingRest;
  if (cadence_spm < t.heavy_max_spm) return FormVerdict::kHeavyFeet;
  return FormVerdict::kPlodding;
}

SplitBucket Classifier::ClassifySplit(double cadence_spm, double heart_rate, double zone2_floor_bpm, double grade_pct) const {
  RequireNonNegative(cadence_spm, "cadence_spm");
  RequireNonNegative(heart_rate, "heart_rate");
  RequireFinite(grade_pct, "grade_pct");
  RequireFinite(zone2_floor_bpm, "zone2_floor_bpm");
  if (zone2_floor_bpm <= 0.0) {
    throw runlens::util::InvalidMetricInput("zone2_floor_bpm must be positive");
  }
  const auto& t = thresholds_.split;

  if (cadence_spm >= t.quality_min_cadence_spm && heart_rate > zone2_floor_bpm && grade_pct <= t.max_grade_pct) {
    return SplitBucket::kHighQuality;
  }
  if (grade_pct > t.max_grade_pct || cadence_spm < t.structural_max_cadence_spm || heart_rate < zone2_floor_bpm) {
    return SplitBucket::kStructural;
  }
  return SplitBucket::kBroken;
}

std::optional<TrainingEffectLabel> Classifier::ClassifyTrainingEffect(double aerobic_te, double anaerobic_te) const {
  RequireTrainingEffect(aerobic_te, "aerobic_training_effect");
  RequireTrainingEffect(anaerobic_te, "anaerobic_training_effect");
  const auto& t = thresholds_.training_effect;

  if (anaerobic_te >= t.max_power_anaerobic) return TrainingEffectLabel::kMaxPower;
  if (anaerobic_te >= t.anaerobic_min && anaerobic_te >= aerobic_te - t.anaerobic_closeness) return TrainingEffectLabel::kAnaerobic;
  if (aerobic_te >= t.vo2_max_aerobic) return TrainingEffectLabel::kVo2Max;
  if (aerobic_te >= t.threshold_aerobic) return TrainingEffectLabel::kThreshold;
  return std::nullopt;
}

LoadCategory Classifier::ClassifyLoad(double trimp) const {
  RequireNonNegative(trimp, "training_load");
  const auto& t = thresholds_.load;

  if (trimp < t.base_min) return LoadCategory::kRecovery;
  if (trimp < t.overload_min) return LoadCategory::kBase;
  if (trimp < t.overreaching_min) return LoadCategory::kOverload;
  return LoadCategory::kOverreaching;
}

LoadMixVerdict Classifier::ClassifyLoadMix(const ZoneDistribution& zones) const {
  RequireNonNegative(zones.z1_s, "zone1_seconds");
  RequireNonNegative(zones.z2_s, "zone2_seconds");
  RequireNonNegative(zones.z3_s, "zone3_seconds");
  RequireNonNegative(zones.z4_s, "zone4_seconds");
  RequireNonNegative(zones.z5_s, "zone5_seconds");

  const double total = zones.Total();
  if (total <= 0.0) {
    throw runlens::util::InvalidMetricInput("zone distribution has no recorded time");
  }

  const double easy = (zones.z1_s + zones.z2_s) / total;
  const double z3   = zones.z3_s / total;
  const double hard = (zones.z4_s + zones.z5_s) / total;
  const auto&  t    = thresholds_.load_mix;

  if (hard >= t.threshold_addict_hard_share) return LoadMixVerdict::kZone4ThresholdAddict;
  if (z3 >= t.junk_z3_share && easy < t.junk_max_easy_share) return LoadMixVerdict::kZone3Junk;
  if (easy >= t.base_easy_share) return LoadMixVerdict::kZone2Base;
  if (hard >= t.tempo_threshold_hard_share) return LoadMixVerdict::kTempoThreshold;
  return LoadMixVerdict::kTempoHeavy;
}

DecouplingStatus Classifier::ClassifyDecoupling(double decoupling_pct) const {
  RequireFinite(decoupling_pct, "decoupling_pct");
  if (decoupling_pct < 5.0) return DecouplingStatus::kExcellent;
  if (decoupling_pct <= 10.0) return DecouplingStatus::kModerate;
  return DecouplingStatus::kHighFatigue;
}

SplitTally Classifier::ClassifySplits(const runlens::activity::v1::ActivityMetrics& metrics, double zone2_floor_bpm) const {
  SplitTally tally;
  for (const auto& split : metrics.splits()) {
    switch (ClassifySplit(split.cadence_spm(), split.heart_rate(), zone2_floor_bpm, split.grade_pct())) {
      case SplitBucket::kHighQuality:
        ++tally.high_quality;
        break;
      case SplitBucket::kStructural:
        ++tally.structural;
        break;
      case SplitBucket::kBroken:
        ++tally.broken;
        break;
    }
  }
  return tally;
}

} // namespace runlens::classify
