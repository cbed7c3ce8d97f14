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

using settle::runtime::Server;

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
    std::cerr << "Usage: settlement-engine <config.yaml> OR settlement-engine --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = settle::config::ConfigLoader::LoadFromYaml(config_path);

    settle::observability::InitializeTracing(config);
    settle::observability::InitializeMetrics(config);
    settle::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = settle::factory::Build(config);

    // ------------------------------------------------------------
    // Start server
    // ------------------------------------------------------------
    Server server(config.server().bind_address(), std::move(app.grpc_services));

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    SETTLE_LOG_INFO("settlement engine started", {settle::observability::StringField("bind_address", config.server().bind_address())});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    SETTLE_LOG_INFO("shutting down settlement engine");

    server.Stop();
    settle::observability::ShutdownLogging();
    settle::observability::ShutdownMetrics();
    settle::observability::ShutdownTracing();
  } catch (const std::exception& e) {
    SETTLE_LOG_ERROR("fatal error", {settle::observability::StringField("error", e.what())});
    settle::observability::ShutdownLogging();
    settle::observability::ShutdownMetrics();
    settle::observability::ShutdownTracing();
    return 2;
  }

  return 0;
}
