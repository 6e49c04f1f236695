#include "verdicts.hpp"

#include <array>
#include <utility>

namespace runlens::taxonomy {

namespace {

template <typename E, std::size_t N>
std::optional<E> ParseKey(const std::array<E, N>& all, std::string_view key) {
  for (E v : all) {
    if (KeyOf(v) == key) return v;
  }
  return std::nullopt;
}

constexpr std::array kFormVerdicts{FormVerdict::kEliteForm, FormVerdict::kGoodForm, FormVerdict::kHikingRest, FormVerdict::kHeavyFeet,
                                   FormVerdict::kPlodding};

constexpr std::array kSplitBuckets{SplitBucket::kHighQuality, SplitBucket::kStructural, SplitBucket::kBroken};

constexpr std::array kLoadCategories{LoadCategory::kRecovery, LoadCategory::kBase, LoadCategory::kOverload, LoadCategory::kOverreaching};

constexpr std::array kTrainingEffectLabels{TrainingEffectLabel::kMaxPower, TrainingEffectLabel::kAnaerobic, TrainingEffectLabel::kVo2Max,
                                           TrainingEffectLabel::kThreshold};

constexpr std::array kLoadMixVerdicts{LoadMixVerdict::kZone2Base, LoadMixVerdict::kZone3Junk, LoadMixVerdict::kZone4ThresholdAddict,
                                      LoadMixVerdict::kTempoHeavy, LoadMixVerdict::kTempoThreshold};

constexpr std::array kQuadrantVerdicts{QuadrantVerdict::kRaceReady, QuadrantVerdict::kExpensiveSpeed, QuadrantVerdict::kBaseMaintenance,
                                       QuadrantVerdict::kStruggling};

} // namespace

std::string_view KeyOf(FormVerdict v) {
  switch (v) {
    case FormVerdict::kEliteForm:
      return "ELITE_FORM";
    case FormVerdict::kGoodForm:
      return "GOOD_FORM";
    case FormVerdict::kHikingRest:
      return "HIKING_REST";
    case FormVerdict::kHeavyFeet:
      return "HEAVY_FEET";
    case FormVerdict::kPlodding:
      return "PLODDING";
  }
  return "UNKNOWN";
}

std::string_view KeyOf(SplitBucket v) {
  switch (v) {
    case SplitBucket::kHighQuality:
      return "HIGH_QUALITY";
    case SplitBucket::kStructural:
      return "STRUCTURAL";
    case SplitBucket::kBroken:
      return "BROKEN";
  }
  return "UNKNOWN";
}

std::string_view KeyOf(LoadCategory v) {
  switch (v) {
    case LoadCategory::kRecovery:
      return "RECOVERY";
    case LoadCategory::kBase:
      return "BASE";
    case LoadCategory::kOverload:
      return "OVERLOAD";
    case LoadCategory::kOverreaching:
      return "OVERREACHING";
  }
  return "UNKNOWN";
}

std::string_view KeyOf(TrainingEffectLabel v) {
  switch (v) {
    case TrainingEffectLabel::kMaxPower:
      return "MAX_POWER";
    case TrainingEffectLabel::kAnaerobic:
      return "ANAEROBIC";
    case TrainingEffectLabel::kVo2Max:
      return "VO2_MAX";
    case TrainingEffectLabel::kThreshold:
      return "THRESHOLD";
  }
  return "UNKNOWN";
}

std::string_view KeyOf(LoadMixVerdict v) {
  switch (v) {
    case LoadMixVerdict::kZone2Base:
      return "ZONE_2_BASE";
    case LoadMixVerdict::kZone3Junk:
      return "ZONE_3_JUNK";
    case LoadMixVerdict::kZone4ThresholdAddict:
      return "ZONE_4_THRESHOLD_ADDICT";
    case LoadMixVerdict::kTempoHeavy:
      return "TEMPO_HEAVY";
    case LoadMixVerdict::kTempoThreshold:
      return "TEMPO_THRESHOLD";
  }
  return "UNKNOWN";
}

std::string_view KeyOf(QuadrantVerdict v) {
  switch (v) {
    case QuadrantVerdict::kRaceReady:
      return "RACE_READY";
    case QuadrantVerdict::kExpensiveSpeed:
      return "EXPENSIVE_SPEED";
    case QuadrantVerdict::kBaseMaintenance:
      return "BASE_MAINTENANCE";
    case QuadrantVerdict::kStruggling:
      return "STRUGGLING";
  }
  return "UNKNOWN";
}

std::string_view KeyOf(DecouplingStatus v) {
  switch (v) {
    case DecouplingStatus::kExcellent:
      return "EXCELLENT";
    case DecouplingStatus::kModerate:
      return "MODERATE";
    case DecouplingStatus::kHighFatigue:
      return "HIGH_FATIGUE";
  }
  return "UNKNOWN";
}

std::optional<FormVerdict> ParseFormVerdict(std::string_view key) {
  return ParseKey(kFormVerdicts, key);
}

std::optional<SplitBucket> ParseSplitBucket(std::string_view key) {
  return ParseKey(kSplitBuckets, key);
}

std::optional<LoadCategory> ParseLoadCategory(std::string_view key) {
  return ParseKey(kLoadCategories, key);
}

std::optional<TrainingEffectLabel> ParseTrainingEffectLabel(std::string_view key) {
  return ParseKey(kTrainingEffectLabels, key);
}

std::optional<LoadMixVerdict> ParseLoadMixVerdict(std::string_view key) {
  return ParseKey(kLoadMixVerdicts, key);
}

std::optional<QuadrantVerdict> ParseQuadrantVerdict(std::string_view key) {
  return ParseKey(kQuadrantVerdicts, key);
}

} // namespace runlens::taxonomy
