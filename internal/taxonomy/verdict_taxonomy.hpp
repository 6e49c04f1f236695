#pragma once

#include <map>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/taxonomy/verdicts.hpp"

namespace runlens::taxonomy {

/*
  A display entry for one verdict key.

  `presentation` is opaque to the engine (colors, icons, coaching copy);
  it is carried through to the presentation layer unchanged.
*/
struct Verdict {
  std::string                        key;
  std::string                        label;
  std::map<std::string, std::string> presentation;
};

/*
  Immutable key -> Verdict tables for every verdict dimension.

  Built once at startup and shared read-only; safe for concurrent use.
*/
class VerdictTaxonomy {
 public:
  // The built-in tables.
  static std::shared_ptr<const VerdictTaxonomy> BuildDefault();

  const Verdict& Of(FormVerdict v) const;
  const Verdict& Of(SplitBucket v) const;
  const Verdict& Of(LoadCategory v) const;
  const Verdict& Of(TrainingEffectLabel v) const;
  const Verdict& Of(LoadMixVerdict v) const;
  const Verdict& Of(QuadrantVerdict v) const;
  const Verdict& Of(DecouplingStatus v) const;

  // Full dimension table in declaration order.
  const std::vector<Verdict>& Dimension(const std::string& name) const;

  std::vector<std::string> DimensionNames() const;

 private:
  VerdictTaxonomy() = default;

  const Verdict& Lookup(const char* dimension, std::string_view key) const;

  std::unordered_map<std::string, std::vector<Verdict>> tables_;
};

} // namespace runlens::taxonomy
