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

using taskorch::runtime::Server;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

static void ShutdownObservability() {
  taskorch::observability::ShutdownLogging();
  taskorch::observability::ShutdownMetrics();
  taskorch::observability::ShutdownTracing();
}

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    std::cerr << "Usage: taskorch-server <config.yaml> OR taskorch-server --config <config.yaml>" << std::endl;
    return 1;
  }

  std::signal(SIGPIPE, SIG_IGN);

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = taskorch::config::ConfigLoader::LoadFromYaml(config_path);

    taskorch::observability::InitializeTracing(config);
    taskorch::observability::InitializeMetrics(config);
    taskorch::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = taskorch::factory::Build(config);

    const auto& server_options = app.components.options.server;
    Server      server(server_options, std::move(app.grpc_services), std::move(app.background_workers));

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    TASKORCH_LOG_INFO("Task orchestrator started", {taskorch::observability::StringField("bind_address", server_options.bind_address),
                                                    taskorch::observability::IntField("port", server.Port())});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    TASKORCH_LOG_INFO("Shutting down task orchestrator");
    server.Stop();
    ShutdownObservability();
  } catch (const std::exception& e) {
    TASKORCH_LOG_ERROR("Fatal error", {taskorch::observability::StringField("error", e.what())});
    ShutdownObservability();
    return 2;
  }

  return 0;
}
