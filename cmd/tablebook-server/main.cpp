#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/factory.hpp"
#include "internal/lock/lock_coordinator.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/runtime/server.hpp"

using tablebook::factory::Build;
using tablebook::runtime::Server;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    std::cerr << "Usage: tablebook-server <config.yaml> OR tablebook-server --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = tablebook::config::ConfigLoader::LoadFromYaml(config_path);

    tablebook::observability::InitializeTracing(config);
    tablebook::observability::InitializeMetrics(config);
    tablebook::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = Build(config);

    // ------------------------------------------------------------
    // Start server
    // ------------------------------------------------------------
    const std::string bind_address = config.server().bind_address().empty() ? "0.0.0.0:50051" : config.server().bind_address();
    const auto        grace = tablebook::lock::LockOptions::FromConfig(config.locking()).ttl;
    Server            server(bind_address, std::move(app.grpc_services), grace);

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    TABLEBOOK_LOG_INFO("tablebook started", {tablebook::observability::StringField("bind_address", bind_address),
                                             tablebook::observability::StringField("backend", app.repository->BackendName())});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    TABLEBOOK_LOG_INFO("Shutting down tablebook");

    server.Stop();
    app.background_workers.clear();
    tablebook::observability::ShutdownLogging();
    tablebook::observability::ShutdownMetrics();
    tablebook::observability::ShutdownTracing();
  } catch (const std::exception& e) {
    TABLEBOOK_LOG_ERROR("Fatal error", {tablebook::observability::StringField("error", e.what())});
    tablebook::observability::ShutdownLogging();
    tablebook::observability::ShutdownMetrics();
    tablebook::observability::ShutdownTracing();
    return 2;
  }

  return 0;
}
