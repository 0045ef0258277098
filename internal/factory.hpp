#pragma once

#include <memory>

#include "config/config.pb.h"

namespace collab::db {
class Repository;
}
namespace collab::core {
class CollaborationGraph;
}
namespace collab::graph {
class PathCacheWriter;
}
namespace collab::population {
class ApplyWorkerPool;
}
namespace collab::runtime {
class MaintenanceWorker;
}
namespace collab::service {
class GraphService;
}

namespace collab::factory {

/*
  Application

  Owns all long-lived components used by the server. Everything here lives
  for the lifetime of the process; Shutdown() stops the background threads
  in dependency order.
*/
struct Application {
  std::shared_ptr<db::Repository>           repository;
  std::shared_ptr<core::CollaborationGraph> graph;
  std::shared_ptr<service::GraphService>    graph_service;

  std::shared_ptr<population::ApplyWorkerPool> apply_pool;
  std::shared_ptr<graph::PathCacheWriter>      cache_writer;
  std::shared_ptr<runtime::MaintenanceWorker>  maintenance;

  void Shutdown();
};

/*
  Build

  Constructs the entire backend from the runtime config. Background workers
  are started; the maintenance worker only when start_maintenance is set.

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete DB types.
*/
Application Build(const collab::runtime::config::RuntimeConfig& config, bool start_maintenance = true);

// Opens the configured backend and creates its schema when missing.
std::shared_ptr<db::Repository> BuildRepository(const collab::runtime::config::DatabaseConfig& database);

} // namespace collab::factory
