#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "internal/store/time_window.hpp"
#include "internal/util/hash.hpp"
#include "internal/util/time.hpp"
#include "runlens/activity/v1/activity.pb.h"

namespace runlens::db {
class Repository;
}

namespace runlens::store {

/*
  One ingested activity as produced by the metrics extractor plus the
  batch it arrived in. Immutable once built.
*/
struct MetricRecord {
  util::ContentHash                      content_hash{};
  std::string                            filename;
  util::CalendarDate                     date;
  int64_t                                session_id = 0;
  runlens::activity::v1::ActivityMetrics metrics;
};

struct StoredActivity {
  MetricRecord record;

  // primary key, hex form of record.content_hash
  std::string key;
};

// A row that could not be decoded; the rest of the window is unaffected.
struct RowError {
  std::string key;
  std::string message;
};

struct QueryResult {
  std::vector<StoredActivity> activities; // newest date first
  std::vector<RowError>       row_errors;
};

/*
  Content-addressed activity persistence.

  Every operation maps to exactly one repository transaction. Repository
  access is serialized, so a concurrent reader never observes a
  half-written row; writes are whole-row replacements, last writer wins.
  Backend failures throw util::StorageUnavailable.
*/
class ActivityStore {
 public:
  using TodayFn = std::function<util::CalendarDate()>;

  explicit ActivityStore(std::shared_ptr<db::Repository> repository, TodayFn today = util::Today);

  bool Exists(const util::ContentHash& hash);

  // Insert or fully replace the row keyed by record.content_hash.
  void Upsert(const MetricRecord& record);

  // No-op when absent.
  void Delete(const util::ContentHash& hash);

  uint64_t Count();

  std::optional<StoredActivity> Get(const util::ContentHash& hash);

  // kLastImport requires session_id; without one the result is empty.
  QueryResult Query(TimeWindow window, std::optional<int64_t> session_id = std::nullopt);

 private:
  std::shared_ptr<db::Repository> repository_;
  TodayFn                         today_;
  std::mutex                      repository_mutex_;
};

// JSON form persisted in the json_data column.
std::string SerializeMetrics(const runlens::activity::v1::ActivityMetrics& metrics);

} // namespace runlens::store
