#include "factory.hpp"

#include "internal/classify/classifier.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/ingest/import_controller.hpp"
#include "internal/ingest/import_scheduler.hpp"
#include "internal/ingest/import_worker.hpp"
#include "internal/ingest/json_metrics_extractor.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/analytics_service.hpp"
#include "internal/session/session_state.hpp"
#include "internal/store/activity_store.hpp"
#include "internal/taxonomy/verdict_taxonomy.hpp"

namespace runlens::factory {

using runlens::observability::StringField;

namespace {

std::shared_ptr<db::Repository> BuildRepository(const runlens::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(), !database.sqlite().disable_wal());
    sqlite_db->BootstrapSchema();
    RUNLENS_LOG_INFO("database opened", {StringField("backend", "sqlite"), StringField("path", sqlite_db->Path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
  }

  RUNLENS_LOG_INFO("database opened", {StringField("backend", "memory")});
  return std::make_shared<db::memory::MemoryRepository>();
}

} // namespace

/*
    Build full engine dependency graph
*/
Runtime Build(const runlens::runtime::config::RuntimeConfig& config) {
  Runtime rt;

  // ------------------------------------------------------------------
  // Persistence
  // ------------------------------------------------------------------
  rt.repository = BuildRepository(config);
  rt.store      = std::make_shared<store::ActivityStore>(rt.repository);

  // ------------------------------------------------------------------
  // Classification
  // ------------------------------------------------------------------
  rt.classifier = std::make_shared<classify::Classifier>(classify::ThresholdsFromConfig(config.thresholds()));
  rt.taxonomy   = taxonomy::VerdictTaxonomy::BuildDefault();

  // ------------------------------------------------------------------
  // Import pipeline
  // ------------------------------------------------------------------
  rt.extractor         = std::make_shared<ingest::JsonMetricsExtractor>();
  rt.import_controller = std::make_shared<ingest::ImportController>(rt.store, rt.extractor);

  auto scheduler   = std::make_shared<ingest::ImportScheduler>();
  rt.import_worker = std::make_shared<ingest::ImportWorker>(scheduler, rt.import_controller);
  rt.import_worker->Start();

  // ------------------------------------------------------------------
  // Session + services
  // ------------------------------------------------------------------
  rt.session   = std::make_shared<session::SessionState>();
  rt.analytics = std::make_shared<service::AnalyticsService>(rt.store, rt.classifier, config::Zone2FloorBpm(config));

  return rt;
}

} // namespace runlens::factory
