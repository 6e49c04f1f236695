#include "internal/ingest/import_controller.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <mutex>

#include "internal/ingest/metrics_extractor.hpp"
#include "internal/observability/logging.hpp"
#include "internal/store/activity_store.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/hash.hpp"

namespace runlens::ingest {

using runlens::observability::IntField;
using runlens::observability::StringField;

namespace {

std::mutex session_id_mutex;
int64_t    last_session_id = 0;

bool Cancelled(const std::atomic<bool>* cancel) {
  return cancel != nullptr && cancel->load();
}

std::string Lower(std::string_view text) {
  std::string out(text);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

} // namespace

std::string_view ImportOutcomeName(ImportOutcome outcome) {
  switch (outcome) {
    case ImportOutcome::kNothingToImport:
      return "nothing_to_import";
    case ImportOutcome::kNoNewActivities:
      return "no_new_activities";
    case ImportOutcome::kImported:
      return "imported";
    case ImportOutcome::kCancelled:
      return "cancelled";
  }
  return "unknown";
}

int64_t NextSessionId(util::TimePoint now) {
  std::lock_guard lock(session_id_mutex);
  last_session_id = std::max(util::ToUnixSeconds(now), last_session_id + 1);
  return last_session_id;
}

std::vector<std::string> ListActivityFiles(const std::string& folder, std::string_view extension) {
  namespace fs = std::filesystem;

  std::error_code ec;
  if (!fs::is_directory(folder, ec)) {
    throw util::InvalidArgument("not a directory: " + folder);
  }

  const auto wanted = Lower(extension);

  std::vector<std::string> files;
  for (const auto& entry : fs::directory_iterator(folder)) {
    if (!entry.is_regular_file()) continue;
    if (Lower(entry.path().extension().string()) != wanted) continue;
    files.push_back(entry.path().string());
  }
  std::sort(files.begin(), files.end());
  return files;
}

ImportController::ImportController(std::shared_ptr<store::ActivityStore> store,
                                   std::shared_ptr<MetricsExtractor>     extractor,
                                   ClockFn                               clock)
    : store_(std::move(store)), extractor_(std::move(extractor)), clock_(std::move(clock)) {
  if (!store_ || !extractor_) {
    throw util::InvalidArgument("import controller requires a store and an extractor");
  }
}

ImportReport ImportController::ImportBatch(const std::vector<std::string>& files, const ProgressFn& progress, const std::atomic<bool>* cancel) {
  ImportReport report;
  report.total = files.size();

  if (files.empty()) {
    RUNLENS_LOG_INFO("import skipped", {StringField("reason", "no files")});
    return report;
  }

  report.session_id = NextSessionId(clock_());
  RUNLENS_LOG_INFO("import started", {IntField("session_id", report.session_id), IntField("files", static_cast<int64_t>(files.size()))});

  bool cancelled = false;
  for (const auto& path : files) {
    if (Cancelled(cancel)) {
      cancelled = true;
      break;
    }

    switch (ImportFile(path, report.session_id)) {
      case FileResult::kImported:
        report.imported++;
        break;
      case FileResult::kDuplicate:
        report.duplicates++;
        break;
      case FileResult::kNotApplicable:
        report.not_applicable++;
        break;
      case FileResult::kFailed:
        report.failed++;
        break;
    }

    report.processed++;
    if (progress) {
      progress(report.processed, report.total);
    }
  }

  if (cancelled) {
    report.outcome = ImportOutcome::kCancelled;
  } else if (report.imported == 0) {
    report.outcome = ImportOutcome::kNoNewActivities;
  } else {
    report.outcome = ImportOutcome::kImported;
  }

  RUNLENS_LOG_INFO("import finished",
                   {IntField("session_id", report.session_id), StringField("outcome", ImportOutcomeName(report.outcome)),
                    IntField("processed", static_cast<int64_t>(report.processed)), IntField("imported", static_cast<int64_t>(report.imported)),
                    IntField("duplicates", static_cast<int64_t>(report.duplicates)),
                    IntField("not_applicable", static_cast<int64_t>(report.not_applicable)), IntField("failed", static_cast<int64_t>(report.failed))});
  return report;
}

ImportController::FileResult ImportController::ImportFile(const std::string& path, int64_t session_id) {
  RUNLENS_LOG_DEBUG("import stage", {StringField("file", path), StringField("stage", "hashing")});

  util::ContentHash hash;
  try {
    hash = util::HashFile(path);
  } catch (const std::runtime_error& e) {
    RUNLENS_LOG_WARN("import file failed", {StringField("file", path), StringField("stage", "hashing"), StringField("error", e.what())});
    return FileResult::kFailed;
  }

  if (store_->Exists(hash)) {
    RUNLENS_LOG_DEBUG("duplicate activity skipped", {StringField("file", path), StringField("hash", util::ToHex(hash))});
    return FileResult::kDuplicate;
  }

  // extractor and record failures skip the file; storage failures end the batch
  try {
    RUNLENS_LOG_DEBUG("import stage", {StringField("file", path), StringField("stage", "extracting")});
    auto extracted = extractor_->Extract(path);
    if (extracted.status == ExtractionStatus::kNotApplicable) {
      RUNLENS_LOG_DEBUG("activity not applicable", {StringField("file", path), StringField("reason", extracted.message)});
      return FileResult::kNotApplicable;
    }
    if (extracted.status == ExtractionStatus::kFailed) {
      RUNLENS_LOG_WARN("import file failed", {StringField("file", path), StringField("stage", "extracting"), StringField("error", extracted.message)});
      return FileResult::kFailed;
    }

    RUNLENS_LOG_DEBUG("import stage", {StringField("file", path), StringField("stage", "persisting")});
    store::MetricRecord record;
    record.content_hash = hash;
    record.filename     = std::filesystem::path(path).filename().string();
    record.date         = extracted.date;
    record.session_id   = session_id;
    record.metrics      = std::move(extracted.metrics);
    store_->Upsert(record);
  } catch (const util::StorageUnavailable&) {
    throw;
  } catch (const std::exception& e) {
    RUNLENS_LOG_WARN("import file failed", {StringField("file", path), StringField("error", e.what())});
    return FileResult::kFailed;
  }

  return FileResult::kImported;
}

} // namespace runlens::ingest
