#pragma once

#include <optional>
#include <string_view>

namespace runlens::taxonomy {

/*
  Verdict keys.

  The string form returned by KeyOf() is the stable identifier that is
  persisted, logged and handed to the presentation layer. Never rename.
*/

enum class FormVerdict {
  kEliteForm,
  kGoodForm,
  kHikingRest,
  kHeavyFeet,
  kPlodding,
};

enum class SplitBucket {
  kHighQuality,
  kStructural,
  kBroken,
};

enum class LoadCategory {
  kRecovery,
  kBase,
  kOverload,
  kOverreaching,
};

// Absent (std::nullopt) for base / recovery sessions.
enum class TrainingEffectLabel {
  kMaxPower,
  kAnaerobic,
  kVo2Max,
  kThreshold,
};

enum class LoadMixVerdict {
  kZone2Base,
  kZone3Junk,
  kZone4ThresholdAddict,
  kTempoHeavy,
  kTempoThreshold,
};

enum class QuadrantVerdict {
  kRaceReady,
  kExpensiveSpeed,
  kBaseMaintenance,
  kStruggling,
};

enum class DecouplingStatus {
  kExcellent,
  kModerate,
  kHighFatigue,
};

std::string_view KeyOf(FormVerdict v);
std::string_view KeyOf(SplitBucket v);
std::string_view KeyOf(LoadCategory v);
std::string_view KeyOf(TrainingEffectLabel v);
std::string_view KeyOf(LoadMixVerdict v);
std::string_view KeyOf(QuadrantVerdict v);
std::string_view KeyOf(DecouplingStatus v);

std::optional<FormVerdict>         ParseFormVerdict(std::string_view key);
std::optional<SplitBucket>         ParseSplitBucket(std::string_view key);
std::optional<LoadCategory>        ParseLoadCategory(std::string_view key);
std::optional<TrainingEffectLabel> ParseTrainingEffectLabel(std::string_view key);
std::optional<LoadMixVerdict>      ParseLoadMixVerdict(std::string_view key);
std::optional<QuadrantVerdict>     ParseQuadrantVerdict(std::string_view key);

} // namespace runlens::taxonomy
