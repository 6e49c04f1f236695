#include "internal/classify/thresholds.hpp"

#include <cmath>
#include <string>

#include "config/config.pb.h"
#include "internal/util/errors.hpp"

namespace runlens::classify {

namespace {

void Overlay(double configured, double& target) {
  if (configured != 0.0) {
    target = configured;
  }
}

void Require(bool ok, const std::string& what) {
  if (!ok) {
    throw runlens::util::InvalidArgument("invalid thresholds: " + what);
  }
}

bool IsShare(double v) {
  return std::isfinite(v) && v >= 0.0 && v <= 1.0;
}

} // namespace

ClassifierThresholds ThresholdsFromConfig(const runlens::runtime::config::ThresholdsConfig& config) {
  ClassifierThresholds t;

  Overlay(config.form().elite_min_spm(), t.form.elite_min_spm);
  Overlay(config.form().good_min_spm(), t.form.good_min_spm);
  Overlay(config.form().hiking_max_spm(), t.form.hiking_max_spm);
  Overlay(config.form().heavy_max_spm(), t.form.heavy_max_spm);

  Overlay(config.split().quality_min_cadence_spm(), t.split.quality_min_cadence_spm);
  Overlay(config.split().max_grade_pct(), t.split.max_grade_pct);
  Overlay(config.split().structural_max_cadence_spm(), t.split.structural_max_cadence_spm);

  Overlay(config.training_effect().max_power_anaerobic(), t.training_effect.max_power_anaerobic);
  Overlay(config.training_effect().anaerobic_min(), t.training_effect.anaerobic_min);
  Overlay(config.training_effect().anaerobic_closeness(), t.training_effect.anaerobic_closeness);
  Overlay(config.training_effect().vo2_max_aerobic(), t.training_effect.vo2_max_aerobic);
  Overlay(config.training_effect().threshold_aerobic(), t.training_effect.threshold_aerobic);

  Overlay(config.load().base_min(), t.load.base_min);
  Overlay(config.load().overload_min(), t.load.overload_min);
  Overlay(config.load().overreaching_min(), t.load.overreaching_min);

  Overlay(config.load_mix().threshold_addict_hard_share(), t.load_mix.threshold_addict_hard_share);
  Overlay(config.load_mix().junk_z3_share(), t.load_mix.junk_z3_share);
  Overlay(config.load_mix().junk_max_easy_share(), t.load_mix.junk_max_easy_share);
  Overlay(config.load_mix().base_easy_share(), t.load_mix.base_easy_share);
  Overlay(config.load_mix().tempo_threshold_hard_share(), t.load_mix.tempo_threshold_hard_share);

  Overlay(config.trend().stable_epsilon_per_day(), t.trend.stable_epsilon_per_day);

  ValidateThresholds(t);
  return t;
}

void ValidateThresholds(const ClassifierThresholds& t) {
  Require(t.form.hiking_max_spm > 0.0, "form.hiking_max_spm must be positive");
  Require(t.form.hiking_max_spm <= t.form.heavy_max_spm, "form.hiking_max_spm must not exceed form.heavy_max_spm");
  Require(t.form.heavy_max_spm <= t.form.good_min_spm, "form.heavy_max_spm must not exceed form.good_min_spm");
  Require(t.form.good_min_spm <= t.form.elite_min_spm, "form.good_min_spm must not exceed form.elite_min_spm");

  Require(t.split.structural_max_cadence_spm <= t.split.quality_min_cadence_spm,
          "split.structural_max_cadence_spm must not exceed split.quality_min_cadence_spm");

  Require(t.training_effect.anaerobic_min <= t.training_effect.max_power_anaerobic,
          "training_effect.anaerobic_min must not exceed training_effect.max_power_anaerobic");
  Require(t.training_effect.threshold_aerobic <= t.training_effect.vo2_max_aerobic,
          "training_effect.threshold_aerobic must not exceed training_effect.vo2_max_aerobic");
  Require(t.training_effect.anaerobic_closeness >= 0.0, "training_effect.anaerobic_closeness must be non-negative");

  Require(t.load.base_min > 0.0, "load.base_min must be positive");
  Require(t.load.base_min <= t.load.overload_min, "load.base_min must not exceed load.overload_min");
  Require(t.load.overload_min <= t.load.overreaching_min, "load.overload_min must not exceed load.overreaching_min");

  Require(IsShare(t.load_mix.threshold_addict_hard_share), "load_mix.threshold_addict_hard_share must be in [0,1]");
  Require(IsShare(t.load_mix.junk_z3_share), "load_mix.junk_z3_share must be in [0,1]");
  Require(IsShare(t.load_mix.junk_max_easy_share), "load_mix.junk_max_easy_share must be in [0,1]");
  Require(IsShare(t.load_mix.base_easy_share), "load_mix.base_easy_share must be in [0,1]");
  Require(IsShare(t.load_mix.tempo_threshold_hard_share), "load_mix.tempo_threshold_hard_share must be in [0,1]");
  Require(t.load_mix.tempo_threshold_hard_share <= t.load_mix.threshold_addict_hard_share,
          "load_mix.tempo_threshold_hard_share must not exceed load_mix.threshold_addict_hard_share");

  Require(t.trend.stable_epsilon_per_day >= 0.0, "trend.stable_epsilon_per_day must be non-negative");
}

} // namespace runlens::classify
