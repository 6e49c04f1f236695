#include "internal/store/activity_store.hpp"

#include <google/protobuf/util/json_util.h>

#include "internal/db/api/repository.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace runlens::store {

using runlens::observability::IntField;
using runlens::observability::StringField;

namespace {

void ThrowIfDbError(const db::Result& result, const std::string& context) {
  if (result) {
    return;
  }
  std::string message = context + ": " + db::ErrorCodeName(result.code);
  if (!result.message.empty()) {
    message += ": " + result.message;
  }
  throw util::StorageUnavailable(message);
}

std::optional<StoredActivity> Decode(const db::model::ActivityRecord& row, std::string& error) {
  StoredActivity activity;
  activity.key = row.hash;

  auto hash = util::ContentHashFromHex(row.hash);
  if (!hash) {
    error = "malformed content hash";
    return std::nullopt;
  }
  auto date = util::ParseIsoDate(row.date);
  if (!date) {
    error = "malformed date '" + row.date + "'";
    return std::nullopt;
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;
  auto status = google::protobuf::util::JsonStringToMessage(row.json, &activity.record.metrics, options);
  if (!status.ok()) {
    error = "malformed metrics payload: " + std::string(status.message());
    return std::nullopt;
  }

  activity.record.content_hash = *hash;
  activity.record.filename     = row.filename;
  activity.record.date         = *date;
  activity.record.session_id   = row.session_id;
  return activity;
}

} // namespace

std::string SerializeMetrics(const runlens::activity::v1::ActivityMetrics& metrics) {
  google::protobuf::util::JsonPrintOptions options;
  options.preserve_proto_field_names = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(metrics, &json, options);
  if (!status.ok()) {
    throw util::InvalidArgument("cannot serialize activity metrics: " + std::string(status.message()));
  }
  return json;
}

ActivityStore::ActivityStore(std::shared_ptr<db::Repository> repository, TodayFn today)
    : repository_(std::move(repository)), today_(std::move(today)) {
  if (!repository_) {
    throw util::InvalidArgument("activity store requires a repository");
  }
}

bool ActivityStore::Exists(const util::ContentHash& hash) {
  std::lock_guard lock(repository_mutex_);
  auto            tx     = repository_->BeginRead();
  bool            exists = false;
  ThrowIfDbError(repository_->ActivityExists(*tx, util::ToHex(hash), exists), "exists");
  return exists;
}

void ActivityStore::Upsert(const MetricRecord& record) {
  if (!record.date.ok()) {
    throw util::InvalidArgument("activity date is not a valid calendar date");
  }

  db::model::ActivityRecord row;
  row.hash       = util::ToHex(record.content_hash);
  row.filename   = record.filename;
  row.date       = util::FormatIsoDate(record.date);
  row.session_id = record.session_id;
  row.json       = SerializeMetrics(record.metrics);

  std::lock_guard lock(repository_mutex_);
  auto            tx = repository_->Begin();
  ThrowIfDbError(repository_->UpsertActivity(*tx, row), "upsert");
  tx->Commit();
}

void ActivityStore::Delete(const util::ContentHash& hash) {
  const auto key = util::ToHex(hash);

  std::lock_guard lock(repository_mutex_);
  auto            tx = repository_->Begin();
  ThrowIfDbError(repository_->DeleteActivity(*tx, key), "delete");
  tx->Commit();
  RUNLENS_LOG_INFO("activity deleted", {StringField("hash", key)});
}

uint64_t ActivityStore::Count() {
  std::lock_guard lock(repository_mutex_);
  auto            tx    = repository_->BeginRead();
  uint64_t        count = 0;
  ThrowIfDbError(repository_->CountActivities(*tx, count), "count");
  return count;
}

std::optional<StoredActivity> ActivityStore::Get(const util::ContentHash& hash) {
  const auto key = util::ToHex(hash);

  std::optional<db::model::ActivityRecord> row;
  {
    std::lock_guard lock(repository_mutex_);
    auto            tx = repository_->BeginRead();
    ThrowIfDbError(repository_->GetActivity(*tx, key, row), "get activity");
  }
  if (!row) {
    return std::nullopt;
  }

  std::string error;
  auto        activity = Decode(*row, error);
  if (!activity) {
    throw util::InvalidArgument("stored activity " + key + " is corrupt: " + error);
  }
  return activity;
}

QueryResult ActivityStore::Query(TimeWindow window, std::optional<int64_t> session_id) {
  QueryResult result;

  auto filter = WindowFilter(window, session_id, today_());
  if (!filter) {
    return result;
  }

  std::vector<db::model::ActivityRecord> rows;
  {
    std::lock_guard lock(repository_mutex_);
    auto            tx = repository_->BeginRead();
    ThrowIfDbError(repository_->ListActivities(*tx, *filter, rows), "query");
  }

  result.activities.reserve(rows.size());
  for (const auto& row : rows) {
    std::string error;
    auto        activity = Decode(row, error);
    if (!activity) {
      RUNLENS_LOG_WARN("skipping corrupt activity row", {StringField("hash", row.hash), StringField("error", error)});
      result.row_errors.push_back(RowError{row.hash, std::move(error)});
      continue;
    }
    result.activities.push_back(std::move(*activity));
  }

  RUNLENS_LOG_DEBUG("window query",
                    {StringField("window", TimeWindowName(window)), IntField("rows", static_cast<int64_t>(result.activities.size())),
                     IntField("row_errors", static_cast<int64_t>(result.row_errors.size()))});
  return result;
}

} // namespace runlens::store
