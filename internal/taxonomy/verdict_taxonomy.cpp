#include "internal/taxonomy/verdict_taxonomy.hpp"

#include <algorithm>
#include <stdexcept>

namespace runlens::taxonomy {

namespace {

constexpr const char* kForm           = "form";
constexpr const char* kSplit          = "split";
constexpr const char* kLoad           = "load";
constexpr const char* kTrainingEffect = "training_effect";
constexpr const char* kLoadMix        = "load_mix";
constexpr const char* kQuadrant       = "quadrant";
constexpr const char* kDecoupling     = "decoupling";

Verdict Make(std::string_view key, std::string label, std::map<std::string, std::string> presentation) {
  return Verdict{std::string(key), std::move(label), std::move(presentation)};
}

std::vector<Verdict> FormTable() {
  // Cadence bands; the prescription is the coaching cue under the form card.
  return {
      Make(KeyOf(FormVerdict::kEliteForm), "ELITE FORM",
           {{"color", "text-emerald-400"},
            {"bg", "border-emerald-500/30"},
            {"icon", "verified"},
            {"prescription", "Pro-level mechanics. Excellent turnover."}}),
      Make(KeyOf(FormVerdict::kGoodForm), "GOOD FORM",
           {{"color", "text-blue-400"},
            {"bg", "border-blue-500/30"},
            {"icon", "check_circle"},
            {"prescription", "Balanced mechanics. Solid turnover."}}),
      Make(KeyOf(FormVerdict::kHikingRest), "HIKING / REST",
           {{"color", "text-blue-400"}, {"bg", "border-blue-500/30"}, {"icon", "hiking"}, {"prescription", "Power hiking or recovery interval."}}),
      Make(KeyOf(FormVerdict::kHeavyFeet), "HEAVY FEET",
           {{"color", "text-orange-400"},
            {"bg", "border-orange-500/30"},
            {"icon", "warning"},
            {"prescription", "Cadence is low. Focus on quick turnover."}}),
      Make(KeyOf(FormVerdict::kPlodding), "PLODDING",
           {{"color", "text-yellow-400"},
            {"bg", "border-yellow-500/30"},
            {"icon", "do_not_step"},
            {"prescription", "Turnover is sluggish. Pick up your feet."}}),
  };
}

std::vector<Verdict> SplitTable() {
  return {
      Make(KeyOf(SplitBucket::kHighQuality), "High Quality", {{"color", "#10b981"}, {"subtitle", "Dialed Mechanics"}}),
      Make(KeyOf(SplitBucket::kStructural), "Structural", {{"color", "#3b82f6"}, {"subtitle", "Valid Base/Hills"}}),
      Make(KeyOf(SplitBucket::kBroken), "Broken", {{"color", "#f43f5e"}, {"subtitle", "Mechanical Failure"}}),
  };
}

std::vector<Verdict> LoadTable() {
  return {
      Make(KeyOf(LoadCategory::kRecovery), "Recovery",
           {{"color", "#60a5fa"},
            {"emoji", "🧘"},
            {"description", "Low stress, promotes adaptation"},
            {"prose", "Easy effort to promote blood flow. This facilitates repair without adding new structural damage."}}),
      Make(KeyOf(LoadCategory::kBase), "Base",
           {{"color", "#10B981"},
            {"emoji", "🔷"},
            {"description", "Steady load, builds aerobic fitness"},
            {"prose", "Low-intensity endurance work. This builds mitochondrial density and teaches your body to burn fat efficiently."}}),
      Make(KeyOf(LoadCategory::kOverload), "Overload",
           {{"color", "#f97316"},
            {"emoji", "🔥"},
            {"description", "High stimulus, needs recovery between sessions"},
            {"prose",
             "Heavy productive volume. This builds fitness fast but can't be sustained indefinitely. Plan a step-back week every 3-4 weeks."}}),
      Make(KeyOf(LoadCategory::kOverreaching), "Overreaching",
           {{"color", "#ef4444"},
            {"emoji", "🚨"},
            {"description", "Very high stress, needs recovery"},
            {"prose",
             "Too many high-stress sessions. An occasional spike is fine, but repeated overreaching leads to injury and staleness. Follow "
             "with an easy week."}}),
  };
}

std::vector<Verdict> TrainingEffectTable() {
  return {
      Make(KeyOf(TrainingEffectLabel::kMaxPower), "🚀 MAX POWER", {{"color", "text-purple-400"}, {"icon", "🚀"}}),
      Make(KeyOf(TrainingEffectLabel::kAnaerobic), "🔋 ANAEROBIC", {{"color", "text-orange-400"}, {"icon", "🔋"}}),
      Make(KeyOf(TrainingEffectLabel::kVo2Max), "🫀 VO2 MAX", {{"color", "text-red-400"}, {"icon", "🫀"}}),
      Make(KeyOf(TrainingEffectLabel::kThreshold), "📈 THRESHOLD", {{"color", "text-emerald-400"}, {"icon", "📈"}}),
  };
}

std::vector<Verdict> LoadMixTable() {
  return {
      Make(KeyOf(LoadMixVerdict::kZone2Base), "ZONE 2 BASE",
           {{"description",
             "Nearly all Zone 1-2. Great for base building: fat oxidation, capillary density, cardiac efficiency. One hard session per "
             "week rounds it out."}}),
      Make(KeyOf(LoadMixVerdict::kZone3Junk), "ZONE 3 JUNK",
           {{"description",
             "Too much time in the moderate zone without enough easy. This leads to chronic fatigue without the recovery to absorb it. "
             "Swap some tempo runs for true easy days."}}),
      Make(KeyOf(LoadMixVerdict::kZone4ThresholdAddict), "ZONE 4 THRESHOLD ADDICT",
           {{"description",
             "Too much threshold and VO2max-level effort. Zone 5 demands ~48h recovery between sessions. Back off and rebuild your "
             "aerobic base."}}),
      Make(KeyOf(LoadMixVerdict::kTempoHeavy), "TEMPO HEAVY",
           {{"description",
             "A strong fitness stimulus (Tempo/Threshold) with a higher recovery cost. Treat these as hard days and do not do them "
             "back-to-back."}}),
      Make(KeyOf(LoadMixVerdict::kTempoThreshold), "TEMPO / THRESHOLD",
           {{"description", "High intensity speed work that builds race-pace durability. Expect higher cardiac strain."}}),
  };
}

std::vector<Verdict> QuadrantTable() {
  return {
      Make(KeyOf(QuadrantVerdict::kRaceReady), "Race Ready", {{"color", "#2CC985"}, {"icon", "🟢"}, {"description", "Fast & Stable"}}),
      Make(KeyOf(QuadrantVerdict::kExpensiveSpeed), "Expensive Speed",
           {{"color", "#ff9900"}, {"icon", "🟠"}, {"description", "Fast but Drifted"}}),
      Make(KeyOf(QuadrantVerdict::kBaseMaintenance), "Base Maintenance",
           {{"color", "#e6e600"}, {"icon", "🟡"}, {"description", "Slow & Stable"}}),
      Make(KeyOf(QuadrantVerdict::kStruggling), "Struggling", {{"color", "#ff0000"}, {"icon", "🔴"}, {"description", "Slow & Drifted"}}),
  };
}

std::vector<Verdict> DecouplingTable() {
  return {
      Make(KeyOf(DecouplingStatus::kExcellent), "Excellent", {{"icon", "✅"}, {"description", "< 5%: Excellent aerobic endurance"}}),
      Make(KeyOf(DecouplingStatus::kModerate), "Moderate", {{"icon", "⚠️"}, {"description", "5-10%: Moderate cardiac drift"}}),
      Make(KeyOf(DecouplingStatus::kHighFatigue), "High Fatigue",
           {{"icon", "🛑"}, {"description", "> 10%: High Fatigue / Undeveloped Base"}}),
  };
}

} // namespace

std::shared_ptr<const VerdictTaxonomy> VerdictTaxonomy::BuildDefault() {
  std::shared_ptr<VerdictTaxonomy> taxonomy(new VerdictTaxonomy());
  taxonomy->tables_[kForm]           = FormTable();
  taxonomy->tables_[kSplit]          = SplitTable();
  taxonomy->tables_[kLoad]           = LoadTable();
  taxonomy->tables_[kTrainingEffect] = TrainingEffectTable();
  taxonomy->tables_[kLoadMix]        = LoadMixTable();
  taxonomy->tables_[kQuadrant]       = QuadrantTable();
  taxonomy->tables_[kDecoupling]     = DecouplingTable();
  return taxonomy;
}

const Verdict& VerdictTaxonomy::Lookup(const char* dimension, std::string_view key) const {
  const auto& table = Dimension(dimension);
  auto        it    = std::find_if(table.begin(), table.end(), [&](const Verdict& v) { return v.key == key; });
  if (it == table.end()) {
    throw std::out_of_range(std::string("verdict key not in taxonomy: ") + dimension + "/" + std::string(key));
  }
  return *it;
}

const Verdict& VerdictTaxonomy::Of(FormVerdict v) const {
  return Lookup(kForm, KeyOf(v));
}

const Verdict& VerdictTaxonomy::Of(SplitBucket v) const {
  return Lookup(kSplit, KeyOf(v));
}

const Verdict& VerdictTaxonomy::Of(LoadCategory v) const {
  return Lookup(kLoad, KeyOf(v));
}

const Verdict& VerdictTaxonomy::Of(TrainingEffectLabel v) const {
  return Lookup(kTrainingEffect, KeyOf(v));
}

const Verdict& VerdictTaxonomy::Of(LoadMixVerdict v) const {
  return Lookup(kLoadMix, KeyOf(v));
}

const Verdict& VerdictTaxonomy::Of(QuadrantVerdict v) const {
  return Lookup(kQuadrant, KeyOf(v));
}

const Verdict& VerdictTaxonomy::Of(DecouplingStatus v) const {
  return Lookup(kDecoupling, KeyOf(v));
}

const std::vector<Verdict>& VerdictTaxonomy::Dimension(const std::string& name) const {
  auto it = tables_.find(name);
  if (it == tables_.end()) {
    throw std::out_of_range("unknown verdict dimension: " + name);
  }
  return it->second;
}

std::vector<std::string> VerdictTaxonomy::DimensionNames() const {
  std::vector<std::string> names;
  names.reserve(tables_.size());
  for (const auto& [name, _] : tables_) {
    names.push_back(name);
  }
  std::sort(names.begin(), names.end());
  return names;
}

} // namespace runlens::taxonomy
