#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/runtime/server.hpp"

using callscribe::runtime::Server;

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
    std::cerr << "Usage: callscribe <config.yaml> OR callscribe --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = callscribe::config::ConfigLoader::LoadFromYaml(config_path);

    callscribe::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = callscribe::factory::Build(config);

    // ------------------------------------------------------------
    // Start server
    // ------------------------------------------------------------
    Server server(config.server().bind_address(), std::move(app.grpc_services));

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    CALLSCRIBE_LOG_INFO("callscribe started", {callscribe::observability::StringField("bind_address", config.server().bind_address()),
                                               callscribe::observability::IntField("port", server.SelectedPort())});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    CALLSCRIBE_LOG_INFO("Shutting down callscribe");

    server.Stop();
    app.Stop();
    callscribe::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    CALLSCRIBE_LOG_ERROR("Fatal error", {callscribe::observability::StringField("error", e.what())});
    callscribe::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}
