#pragma once

#include <memory>

#include "config/config.pb.h"

namespace runlens::db {
class Repository;
}
namespace runlens::classify {
class Classifier;
}
namespace runlens::taxonomy {
class VerdictTaxonomy;
}
namespace runlens::store {
class ActivityStore;
}
namespace runlens::ingest {
class MetricsExtractor;
class ImportController;
class ImportWorker;
} // namespace runlens::ingest
namespace runlens::session {
class SessionState;
}
namespace runlens::service {
class AnalyticsService;
}

namespace runlens::factory {

/*
  Runtime

  Owns all long-lived singletons of the engine.
  Everything here lives for the lifetime of the process.
*/
struct Runtime {
  std::shared_ptr<db::Repository>                 repository;
  std::shared_ptr<const classify::Classifier>     classifier;
  std::shared_ptr<const taxonomy::VerdictTaxonomy> taxonomy;
  std::shared_ptr<store::ActivityStore>           store;
  std::shared_ptr<ingest::MetricsExtractor>       extractor;
  std::shared_ptr<ingest::ImportController>       import_controller;
  std::shared_ptr<ingest::ImportWorker>           import_worker;
  std::shared_ptr<session::SessionState>          session;
  std::shared_ptr<service::AnalyticsService>      analytics;
};

/*
  Build

  Constructs the engine from runtime config and starts the import
  worker.

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete DB types.
*/
Runtime Build(const runlens::runtime::config::RuntimeConfig& config);

} // namespace runlens::factory
