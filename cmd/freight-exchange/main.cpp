#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/runtime/server.hpp"

using freight::runtime::Server;

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
    std::cerr << "Usage: freight-exchange <config.yaml> OR freight-exchange --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = freight::config::ConfigLoader::LoadFromYaml(config_path);

    freight::observability::InitializeLogging(config);
    freight::observability::InitializeMetrics(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = freight::factory::Build(config);

    // ------------------------------------------------------------
    // Start core and server
    // ------------------------------------------------------------
    Server server(config.server().bind_address().empty() ? "0.0.0.0:50061" : config.server().bind_address(), std::move(app.grpc_services));

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    app.core.Start();
    server.Start();
    FREIGHT_LOG_INFO("freight exchange started", {freight::observability::StringField("bind_address", config.server().bind_address())});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    FREIGHT_LOG_INFO("shutting down freight exchange");

    server.Stop();
    app.core.Stop();
    freight::observability::ShutdownMetrics();
    freight::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    FREIGHT_LOG_ERROR("fatal error", {freight::observability::StringField("error", e.what())});
    freight::observability::ShutdownMetrics();
    freight::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}
