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

using blockforge::runtime::Server;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

static void ShutdownObservability() {
  blockforge::observability::ShutdownLogging();
  blockforge::observability::ShutdownMetrics();
  blockforge::observability::ShutdownTracing();
}

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    std::cerr << "Usage: blockforge <config.yaml> OR blockforge --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = blockforge::config::ConfigLoader::LoadFromYaml(config_path);

    blockforge::observability::InitializeTracing(config);
    blockforge::observability::InitializeMetrics(config);
    blockforge::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = blockforge::factory::Build(config);

    // ------------------------------------------------------------
    // Start server
    // ------------------------------------------------------------
    Server server(config.server().bind_address(), std::move(app.grpc_services));

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    BLOCKFORGE_LOG_INFO("BlockForge started", {blockforge::observability::StringField("bind_address", config.server().bind_address())});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    BLOCKFORGE_LOG_INFO("Shutting down blockforge");

    server.Stop();
    ShutdownObservability();
  } catch (const std::exception& e) {
    BLOCKFORGE_LOG_ERROR("Fatal error", {blockforge::observability::StringField("error", e.what())});
    ShutdownObservability();
    return 2;
  }

  return 0;
}
