#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "internal/util/time.hpp"

namespace runlens::store {
class ActivityStore;
}

namespace runlens::ingest {

class MetricsExtractor;

enum class ImportOutcome {
  kNothingToImport,
  kNoNewActivities,
  kImported,
  kCancelled,
};

std::string_view ImportOutcomeName(ImportOutcome outcome);

struct ImportReport {
  ImportOutcome outcome = ImportOutcome::kNothingToImport;

  // 0 for kNothingToImport
  int64_t session_id = 0;

  std::size_t total          = 0;
  std::size_t processed      = 0;
  std::size_t imported       = 0;
  std::size_t duplicates     = 0;
  std::size_t not_applicable = 0;
  std::size_t failed         = 0;
};

// (processed, total), called after each file.
using ProgressFn = std::function<void(std::size_t, std::size_t)>;

/*
  Drives one import batch.

  Per file: hash, skip when already stored, otherwise extract and
  persist. All rows of a batch share one session id. A file that fails
  to hash or extract is logged and skipped; storage failures abort the
  batch with util::StorageUnavailable. Cancellation is honoured between
  files only, so every started file is either fully persisted or not at
  all.
*/
class ImportController {
 public:
  using ClockFn = std::function<util::TimePoint()>;

  ImportController(std::shared_ptr<store::ActivityStore> store,
                   std::shared_ptr<MetricsExtractor>     extractor,
                   ClockFn                               clock = util::Now);

  ImportReport ImportBatch(const std::vector<std::string>& files,
                           const ProgressFn&               progress = {},
                           const std::atomic<bool>*        cancel   = nullptr);

 private:
  enum class FileResult { kImported, kDuplicate, kNotApplicable, kFailed };

  FileResult ImportFile(const std::string& path, int64_t session_id);

  std::shared_ptr<store::ActivityStore> store_;
  std::shared_ptr<MetricsExtractor>     extractor_;
  ClockFn                               clock_;
};

// Unix seconds at `now`, bumped so ids are strictly increasing for the
// life of the process.
int64_t NextSessionId(util::TimePoint now);

// Regular files directly under `folder` whose extension matches
// (case-insensitive), sorted by path. Throws util::InvalidArgument if
// `folder` is not a directory.
std::vector<std::string> ListActivityFiles(const std::string& folder, std::string_view extension);

} // namespace runlens::ingest
