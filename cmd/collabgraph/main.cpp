#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/grpc/graph_server.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/runtime/server.hpp"

using collab::runtime::Server;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

static void ShutdownObservability() {
  collab::observability::ShutdownLogging();
  collab::observability::ShutdownMetrics();
  collab::observability::ShutdownTracing();
}

int main(int argc, char** argv) {
  std::string config_path;
  bool        rebuild_on_start = false;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (arg == "--rebuild") {
      rebuild_on_start = true;
    } else if (config_path.empty() && arg.rfind("--", 0) != 0) {
      config_path = arg;
    } else {
      config_path.clear();
      break;
    }
  }
  if (config_path.empty()) {
    std::cerr << "Usage: collabgraph [--rebuild] <config.yaml> OR collabgraph [--rebuild] --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = collab::config::ConfigLoader::LoadFromYaml(config_path);

    collab::observability::InitializeTracing(config);
    collab::observability::InitializeMetrics(config);
    collab::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = collab::factory::Build(config);

    if (rebuild_on_start) {
      app.graph_service->RebuildAll({});
    }

    // ------------------------------------------------------------
    // Start server
    // ------------------------------------------------------------
    std::vector<std::unique_ptr<::grpc::Service>> services;
    services.push_back(std::make_unique<collab::grpc::GraphServer>(app.graph_service));
    Server server(config.server().bind_address(), std::move(services));

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    COLLAB_LOG_INFO("collabgraph started", {collab::observability::StringField("bind_address", config.server().bind_address())});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    COLLAB_LOG_INFO("shutting down collabgraph");

    server.Stop();
    app.Shutdown();
    ShutdownObservability();
  } catch (const std::exception& e) {
    COLLAB_LOG_ERROR("fatal error", {collab::observability::StringField("error", e.what())});
    ShutdownObservability();
    return 2;
  }

  return 0;
}
