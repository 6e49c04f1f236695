#pragma once

#include <string_view>
#include <vector>

#include "internal/classify/thresholds.hpp"
#include "internal/store/activity_store.hpp"
#include "internal/taxonomy/verdicts.hpp"

namespace runlens::analytics {

enum class TrendDirection {
  kImproving,
  kDeclining,
  kStable,
  kInsufficientData,
};

std::string_view TrendDirectionName(TrendDirection direction);

struct TrendResult {
  // EF change per calendar day; 0 when insufficient data.
  double         slope_per_day = 0.0;
  TrendDirection direction     = TrendDirection::kInsufficientData;
};

// Decoupling at or below this percentage counts as efficient.
inline constexpr double kQuadrantDecouplingPct = 5.0;

/*
  Least-squares slope of efficiency_factor against days elapsed since
  the earliest activity. Needs at least two distinct dates; otherwise the
  result is flagged kInsufficientData rather than reported as flat.
*/
TrendResult ComputeTrend(const std::vector<store::StoredActivity>& activities, const classify::TrendThresholds& thresholds = {});

/*
  Places one activity against the window mean EF.

    ef >= mean && decoupling <= 5  -> race ready
    ef >= mean && decoupling >  5  -> expensive speed
    ef <  mean && decoupling <= 5  -> base maintenance
    ef <  mean && decoupling >  5  -> struggling
*/
taxonomy::QuadrantVerdict ClassifyQuadrant(double efficiency_factor, double decoupling_pct, double mean_efficiency);

taxonomy::QuadrantVerdict ClassifyQuadrant(const store::StoredActivity& activity, double mean_efficiency);

} // namespace runlens::analytics
