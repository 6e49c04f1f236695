#include "internal/taxonomy/verdict_taxonomy.hpp"

#include <cassert>
#include <iostream>
#include <set>
#include <stdexcept>
#include <string>

namespace {

using namespace runlens::taxonomy;

void TestEveryKeyHasAnEntry() {
  auto taxonomy = VerdictTaxonomy::BuildDefault();

  assert(taxonomy->Of(FormVerdict::kEliteForm).key == "ELITE_FORM");
  assert(taxonomy->Of(FormVerdict::kEliteForm).label == "ELITE FORM");
  assert(taxonomy->Of(SplitBucket::kHighQuality).label == "High Quality");
  assert(taxonomy->Of(LoadCategory::kRecovery).label == "Recovery");
  assert(taxonomy->Of(TrainingEffectLabel::kThreshold).key == "THRESHOLD");
  assert(taxonomy->Of(LoadMixVerdict::kZone2Base).label == "ZONE 2 BASE");
  assert(taxonomy->Of(QuadrantVerdict::kRaceReady).label == "Race Ready");
  assert(taxonomy->Of(DecouplingStatus::kHighFatigue).key == "HIGH_FATIGUE");

  assert(taxonomy->Dimension("form").size() == 5);
  assert(taxonomy->Dimension("split").size() == 3);
  assert(taxonomy->Dimension("load").size() == 4);
  assert(taxonomy->Dimension("training_effect").size() == 4);
  assert(taxonomy->Dimension("load_mix").size() == 5);
  assert(taxonomy->Dimension("quadrant").size() == 4);
  assert(taxonomy->Dimension("decoupling").size() == 3);
}

void TestKeysAreUniqueAndRoundTrip() {
  auto taxonomy = VerdictTaxonomy::BuildDefault();

  for (const auto& name : taxonomy->DimensionNames()) {
    std::set<std::string> keys;
    for (const auto& verdict : taxonomy->Dimension(name)) {
      assert(!verdict.label.empty());
      assert(keys.insert(verdict.key).second);
    }
  }

  for (const auto& verdict : taxonomy->Dimension("form")) {
    auto parsed = ParseFormVerdict(verdict.key);
    assert(parsed.has_value());
    assert(KeyOf(*parsed) == verdict.key);
  }
  for (const auto& verdict : taxonomy->Dimension("load_mix")) {
    auto parsed = ParseLoadMixVerdict(verdict.key);
    assert(parsed.has_value());
    assert(KeyOf(*parsed) == verdict.key);
  }

  assert(!ParseLoadCategory("NOT_A_KEY").has_value());
  assert(ParseQuadrantVerdict("STRUGGLING") == QuadrantVerdict::kStruggling);
}

void TestPresentationIsCarried() {
  auto taxonomy = VerdictTaxonomy::BuildDefault();

  const auto& race_ready = taxonomy->Of(QuadrantVerdict::kRaceReady);
  assert(race_ready.presentation.at("color") == "#2CC985");
  assert(race_ready.presentation.at("description") == "Fast & Stable");
}

void TestUnknownDimensionThrows() {
  auto taxonomy = VerdictTaxonomy::BuildDefault();

  bool threw = false;
  try {
    (void)taxonomy->Dimension("weather");
  } catch (const std::out_of_range&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestEveryKeyHasAnEntry();
  TestKeysAreUniqueAndRoundTrip();
  TestPresentationIsCarried();
  TestUnknownDimensionThrows();

  std::cout << "runlens_unit_verdict_taxonomy: pass\n";
  return 0;
}
