#include <chrono>
#include <csignal>
#include <cstdint>
#include <cstdio>
#include <future>
#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include "internal/classify/classifier.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/ingest/import_controller.hpp"
#include "internal/ingest/import_worker.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/analytics_service.hpp"
#include "internal/session/session_state.hpp"
#include "internal/store/activity_store.hpp"
#include "internal/taxonomy/verdict_taxonomy.hpp"

using runlens::observability::StringField;

static volatile std::sig_atomic_t g_interrupted = 0;

void HandleSignal(int) {
  g_interrupted = 1;
}

static void Usage() {
  std::cout << "Usage:\n"
            << "  runlens [--config <config.yaml>] import <folder>\n"
            << "  runlens [--config <config.yaml>] list [window] [session_id]\n"
            << "  runlens [--config <config.yaml>] analyze [window] [session_id]\n"
            << "  runlens [--config <config.yaml>] delete <hash>\n"
            << "  runlens [--config <config.yaml>] count\n"
            << "\n"
            << "window: last-import | 30d | 90d | year | all (default 30d)\n";
}

static std::string Fixed(double v, int precision) {
  std::ostringstream out;
  out << std::fixed << std::setprecision(precision) << v;
  return out.str();
}

static void PrintRows(const runlens::service::WindowAnalytics& analytics, const runlens::taxonomy::VerdictTaxonomy& taxonomy) {
  for (const auto& row : analytics.rows) {
    const auto& record = row.activity.record;
    const auto& m      = record.metrics;

    std::cout << runlens::util::FormatIsoDate(record.date) << "  " << record.filename << "  " << row.activity.key.substr(0, 12)
              << "  EF " << Fixed(m.efficiency_factor(), 2) << "  decoupling " << Fixed(m.decoupling_pct(), 1) << "% ("
              << taxonomy.Of(row.decoupling).label << ")"
              << "  form " << taxonomy.Of(row.form).label << "  load " << taxonomy.Of(row.load).label;
    if (row.training_effect) {
      std::cout << "  TE " << taxonomy.Of(*row.training_effect).label;
    }
    std::cout << "  " << taxonomy.Of(row.quadrant).label << "\n";
  }
}

static void PrintAnalysis(const runlens::service::WindowAnalytics& analytics, const runlens::taxonomy::VerdictTaxonomy& taxonomy) {
  std::cout << "Window: " << runlens::store::TimeWindowName(analytics.window) << "\n";
  std::cout << "Activities: " << analytics.rows.size() << "\n";

  if (analytics.efficiency.insufficient_data) {
    std::cout << "Mean EF: insufficient data\n";
  } else {
    std::cout << "Mean EF: " << Fixed(analytics.efficiency.mean, 3) << "\n";
  }

  std::cout << "Trend: " << runlens::analytics::TrendDirectionName(analytics.trend.direction);
  if (analytics.trend.direction != runlens::analytics::TrendDirection::kInsufficientData) {
    std::cout << " (" << Fixed(analytics.trend.slope_per_day, 5) << " EF/day)";
  }
  std::cout << "\n";

  if (analytics.load_mix) {
    std::cout << "Load mix: " << taxonomy.Of(*analytics.load_mix).label << "\n";
  }

  const auto& splits = analytics.split_totals;
  std::cout << "Splits: " << splits.high_quality << " " << taxonomy.Of(runlens::taxonomy::SplitBucket::kHighQuality).label << ", "
            << splits.structural << " " << taxonomy.Of(runlens::taxonomy::SplitBucket::kStructural).label << ", " << splits.broken << " "
            << taxonomy.Of(runlens::taxonomy::SplitBucket::kBroken).label << "\n";

  if (!analytics.monthly.empty()) {
    std::cout << "\nMonthly summary:\n";
    for (const auto& month : analytics.monthly) {
      std::cout << static_cast<int>(month.month.year()) << "-" << std::setw(2) << std::setfill('0') << static_cast<unsigned>(month.month.month())
                << std::setfill(' ') << "  runs " << month.run_count << "  EF " << Fixed(month.mean_efficiency, 3) << "  decoupling "
                << Fixed(month.mean_decoupling, 1) << "%  " << Fixed(month.total_distance_mi, 1) << " mi  HR " << Fixed(month.mean_heart_rate, 0)
                << "\n";
    }
  }

  std::cout << "\n";
  PrintRows(analytics, taxonomy);

  for (const auto& error : analytics.row_errors) {
    std::cout << "skipped " << error.key << ": " << error.message << "\n";
  }
}

static std::optional<runlens::store::TimeWindow> WindowArg(int argc, char** argv, int index) {
  if (index >= argc) return runlens::store::kDefaultTimeWindow;
  return runlens::store::ParseTimeWindow(argv[index]);
}

// Absent argument is a valid "no session"; a malformed one is reported by the caller.
static bool SessionArg(int argc, char** argv, int index, std::optional<int64_t>& out) {
  out.reset();
  if (index >= argc) return true;
  out = runlens::store::ParseSessionId(argv[index]);
  return out.has_value();
}

static int RunImport(runlens::factory::Runtime& rt, const std::string& folder, const std::string& extension) {
  auto files = runlens::ingest::ListActivityFiles(folder, extension);

  rt.session->SetImportInProgress(true);
  auto pending = rt.import_worker->Submit(files, [](std::size_t processed, std::size_t total) {
    std::cerr << "\rIMPORTING... (" << processed << "/" << total << ")" << std::flush;
  });

  while (pending.wait_for(std::chrono::milliseconds(200)) != std::future_status::ready) {
    if (g_interrupted) rt.import_worker->CancelCurrent();
  }
  if (!files.empty()) std::cerr << "\n";

  auto report = pending.get();

  runlens::session::SessionUpdate update;
  update.import_in_progress = false;
  if (report.imported > 0) {
    update.session_id = report.session_id;
    update.timeframe  = runlens::store::TimeWindow::kLastImport;
  }
  rt.session->BatchSet(update);

  switch (report.outcome) {
    case runlens::ingest::ImportOutcome::kNothingToImport:
      std::cout << "No activity files found in " << folder << "\n";
      return 0;
    case runlens::ingest::ImportOutcome::kNoNewActivities:
      std::cout << "No new runs (" << report.duplicates << " duplicates, " << report.not_applicable << " not running, " << report.failed
                << " failed)\n";
      return 0;
    case runlens::ingest::ImportOutcome::kCancelled:
      std::cout << "Import cancelled after " << report.processed << "/" << report.total << " files\n";
      break;
    case runlens::ingest::ImportOutcome::kImported:
      std::cout << "Imported " << report.imported << " new (session " << report.session_id << ")\n";
      break;
  }

  auto snapshot = rt.session->Snapshot();
  if (snapshot.session_id) {
    std::cout << "\n";
    PrintAnalysis(rt.analytics->Analyze(snapshot.timeframe, snapshot.session_id), *rt.taxonomy);
  }
  return report.outcome == runlens::ingest::ImportOutcome::kCancelled ? 3 : 0;
}

int main(int argc, char** argv) {
  std::string config_path;
  int         arg = 1;
  if (argc >= 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
    arg         = 3;
  }
  if (arg >= argc) {
    Usage();
    return 1;
  }
  const std::string cmd = argv[arg++];

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = config_path.empty() ? runlens::config::ConfigLoader::Defaults() : runlens::config::ConfigLoader::LoadFromYaml(config_path);

    runlens::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build engine (dependency graph)
    // ------------------------------------------------------------
    auto rt = runlens::factory::Build(config);

    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    int rc = 0;
    if (cmd == "import") {
      if (arg >= argc) {
        Usage();
        rc = 1;
      } else {
        rc = RunImport(rt, argv[arg], runlens::config::ActivityExtension(config));
      }
    } else if (cmd == "list" || cmd == "analyze") {
      auto                   window = WindowArg(argc, argv, arg);
      std::optional<int64_t> session_id;
      if (!window) {
        std::cerr << "unknown window: " << argv[arg] << "\n";
        rc = 1;
      } else if (!SessionArg(argc, argv, arg + 1, session_id)) {
        std::cerr << "invalid session id: " << argv[arg + 1] << "\n";
        rc = 1;
      } else {
        auto analytics = rt.analytics->Analyze(*window, session_id);
        if (cmd == "list") {
          PrintRows(analytics, *rt.taxonomy);
        } else {
          PrintAnalysis(analytics, *rt.taxonomy);
        }
      }
    } else if (cmd == "delete") {
      if (arg >= argc) {
        Usage();
        rc = 1;
      } else {
        rt.analytics->Delete(argv[arg]);
        std::cout << "deleted " << argv[arg] << "\n";
      }
    } else if (cmd == "count") {
      std::cout << rt.analytics->Count() << "\n";
    } else {
      Usage();
      rc = 1;
    }

    rt.import_worker->Stop();
    runlens::observability::ShutdownLogging();
    return rc;
  } catch (const std::exception& e) {
    RUNLENS_LOG_ERROR("Fatal error", {StringField("command", cmd), StringField("error", e.what())});
    runlens::observability::ShutdownLogging();
    return 2;
  }
}
