#pragma once

namespace runlens::runtime::config {
class ThresholdsConfig;
}

namespace runlens::classify {

/*
  Tunable classification cutoffs.

  Defaults reproduce the coaching rules documented in DESIGN.md.
  Tests substitute alternate sets by constructing a Classifier with a
  modified copy.
*/

struct FormThresholds {
  double elite_min_spm  = 170.0; // >= elite
  double good_min_spm   = 160.0; // >= good
  double hiking_max_spm = 135.0; // <  hiking / rest
  double heavy_max_spm  = 155.0; // <  heavy feet
};

struct SplitThresholds {
  double quality_min_cadence_spm    = 160.0;
  double max_grade_pct              = 8.0;
  double structural_max_cadence_spm = 140.0; // <  structural
};

struct TrainingEffectThresholds {
  double max_power_anaerobic = 3.5;
  double anaerobic_min       = 2.5;
  // anaerobic must be >= aerobic - closeness to count as ANAEROBIC
  double anaerobic_closeness = 0.5;
  double vo2_max_aerobic     = 4.2;
  double threshold_aerobic   = 3.5;
};

struct LoadThresholds {
  double base_min         = 75.0;
  double overload_min     = 150.0;
  double overreaching_min = 300.0;
};

// Shares are fractions of total zone time in [0, 1].
struct LoadMixThresholds {
  double threshold_addict_hard_share = 0.30; // Z4+Z5
  double junk_z3_share               = 0.35; // Z3
  double junk_max_easy_share         = 0.50; // Z1+Z2 must be below this
  double base_easy_share             = 0.85; // Z1+Z2
  double tempo_threshold_hard_share  = 0.15; // Z4+Z5
};

struct TrendThresholds {
  // 1e-7 EF per second expressed per day.
  double stable_epsilon_per_day = 0.00864;
};

struct ClassifierThresholds {
  FormThresholds           form;
  SplitThresholds          split;
  TrainingEffectThresholds training_effect;
  LoadThresholds           load;
  LoadMixThresholds        load_mix;
  TrendThresholds          trend;
};

// Overlays non-zero config values onto the defaults and validates the
// result. Throws util::InvalidArgument on inconsistent bands.
ClassifierThresholds ThresholdsFromConfig(const runlens::runtime::config::ThresholdsConfig& config);

void ValidateThresholds(const ClassifierThresholds& thresholds);

} // namespace runlens::classify
