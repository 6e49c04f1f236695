#include "internal/ingest/json_metrics_extractor.hpp"

#include <google/protobuf/util/json_util.h>

#include <fstream>
#include <sstream>

namespace runlens::ingest {

JsonMetricsExtractor::JsonMetricsExtractor() : running_sports_{"running", "trail_running"} {
}

ExtractionResult JsonMetricsExtractor::Extract(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return ExtractionResult::Failed("cannot open " + path);
  }
  std::stringstream buffer;
  buffer << in.rdbuf();

  runlens::activity::v1::ExtractedActivity extracted;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;
  auto status = google::protobuf::util::JsonStringToMessage(buffer.str(), &extracted, options);
  if (!status.ok()) {
    return ExtractionResult::Failed("invalid activity json: " + std::string(status.message()));
  }

  auto sport = extracted.metrics().sport();
  if (running_sports_.count(sport) == 0) {
    return ExtractionResult::NotApplicable("sport '" + sport + "' is not running");
  }

  auto date = util::ParseIsoDate(extracted.date());
  if (!date) {
    return ExtractionResult::Failed("invalid activity date '" + extracted.date() + "'");
  }

  return ExtractionResult::Extracted(*date, extracted.metrics());
}

} // namespace runlens::ingest
