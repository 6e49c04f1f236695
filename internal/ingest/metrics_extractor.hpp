#pragma once

#include <string>

#include "internal/util/time.hpp"
#include "runlens/activity/v1/activity.pb.h"

namespace runlens::ingest {

enum class ExtractionStatus {
  kExtracted,
  // a valid file that is not a running activity; skipped silently
  kNotApplicable,
  kFailed,
};

struct ExtractionResult {
  ExtractionStatus status = ExtractionStatus::kFailed;

  // valid only when status == kExtracted
  util::CalendarDate                     date;
  runlens::activity::v1::ActivityMetrics metrics;

  // reason for kNotApplicable / kFailed
  std::string message;

  static ExtractionResult Extracted(util::CalendarDate date, runlens::activity::v1::ActivityMetrics metrics) {
    ExtractionResult r;
    r.status  = ExtractionStatus::kExtracted;
    r.date    = date;
    r.metrics = std::move(metrics);
    return r;
  }

  static ExtractionResult NotApplicable(std::string reason) {
    ExtractionResult r;
    r.status  = ExtractionStatus::kNotApplicable;
    r.message = std::move(reason);
    return r;
  }

  static ExtractionResult Failed(std::string reason) {
    ExtractionResult r;
    r.status  = ExtractionStatus::kFailed;
    r.message = std::move(reason);
    return r;
  }
};

/*
  Boundary to the activity file decoder.

  Implementations report a bad file as kFailed. An exception thrown from
  Extract is logged and counts as kFailed too.
  Extract may be called from the import worker thread.
*/
class MetricsExtractor {
 public:
  virtual ~MetricsExtractor() = default;

  virtual ExtractionResult Extract(const std::string& path) = 0;
};

} // namespace runlens::ingest
