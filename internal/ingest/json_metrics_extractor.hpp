#pragma once

#include <set>
#include <string>

#include "internal/ingest/metrics_extractor.hpp"

namespace runlens::ingest {

/*
  Reads activities that were already decoded upstream and written as
  protobuf JSON (runlens.activity.v1.ExtractedActivity).

  Sports other than running / trail running are kNotApplicable.
*/
class JsonMetricsExtractor final : public MetricsExtractor {
 public:
  JsonMetricsExtractor();

  ExtractionResult Extract(const std::string& path) override;

 private:
  std::set<std::string> running_sports_;
};

} // namespace runlens::ingest
