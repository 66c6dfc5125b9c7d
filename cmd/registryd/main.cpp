#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/runtime/server.hpp"

using registry::runtime::Server;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

static void ShutdownObservability() {
  registry::observability::ShutdownLogging();
  registry::observability::ShutdownMetrics();
  registry::observability::ShutdownTracing();
}

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    std::cerr << "Usage: registryd <config.yaml> OR registryd --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = registry::config::ConfigLoader::LoadFromYaml(config_path);

    registry::observability::InitializeTracing(config);
    registry::observability::InitializeMetrics(config);
    registry::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = registry::factory::Build(config);

    // ------------------------------------------------------------
    // Start server
    // ------------------------------------------------------------
    Server server(config.server().bind_address(), std::move(app.grpc_services));

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    REGISTRY_LOG_INFO("Name registry started", {registry::observability::StringField("bind_address", config.server().bind_address()),
                                                registry::observability::StringField("ledger", config.ledger().endpoint())});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    REGISTRY_LOG_INFO("Shutting down name registry");

    server.Stop();
    ShutdownObservability();
  } catch (const std::exception& e) {
    REGISTRY_LOG_ERROR("Fatal error", {registry::observability::StringField("error", e.what())});
    ShutdownObservability();
    return 2;
  }

  return 0;
}
