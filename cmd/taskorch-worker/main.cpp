#include <unistd.h>

#include <csignal>
#include <iostream>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/worker/worker_loop.hpp"

using taskorch::worker::CancellationToken;
using taskorch::worker::WorkerLoop;

static CancellationToken g_token;

void HandleSignal(int signal) {
  switch (signal) {
    case SIGUSR1:
      g_token.RequestPause();
      break;
    case SIGUSR2:
      g_token.RequestResume();
      break;
    default:
      g_token.RequestStop();
      break;
  }
}

static void Usage() {
  std::cerr << "Usage: taskorch-worker --config <config.yaml> --worker-id <id>\n"
            << "                       [--specialization <lane|type|general>] [--shard <shard-N>] [--model <capability>]\n";
}

static void ShutdownObservability() {
  taskorch::observability::ShutdownLogging();
  taskorch::observability::ShutdownMetrics();
  taskorch::observability::ShutdownTracing();
}

int main(int argc, char** argv) {
  std::string                         config_path;
  taskorch::pool::WorkerRegistration registration;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (i + 1 >= argc) {
      Usage();
      return 1;
    }
    const std::string value = argv[++i];
    if (arg == "--config") {
      config_path = value;
    } else if (arg == "--worker-id") {
      registration.worker_id = value;
    } else if (arg == "--specialization") {
      registration.specialization = value;
    } else if (arg == "--shard") {
      registration.shard = value;
    } else if (arg == "--model") {
      registration.model = value;
    } else {
      Usage();
      return 1;
    }
  }
  if (config_path.empty() || registration.worker_id.empty()) {
    Usage();
    return 1;
  }
  registration.pid = static_cast<int64_t>(::getpid());

  std::signal(SIGPIPE, SIG_IGN);

  try {
    auto config = taskorch::config::ConfigLoader::LoadFromYaml(config_path);

    taskorch::observability::InitializeTracing(config);
    taskorch::observability::InitializeMetrics(config);
    taskorch::observability::InitializeLogging(config, "worker");

    auto c = taskorch::factory::BuildComponents(config);

    taskorch::worker::WorkerLoopDeps deps;
    deps.pool      = c.pool;
    deps.tasks     = c.tasks;
    deps.monitor   = c.monitor;
    deps.lifecycle = c.lifecycle;
    deps.breaker   = c.breaker;
    deps.executor  = c.executor;
    deps.budget    = c.budget;

    taskorch::worker::WorkerLoopOptions options;
    options.pool      = c.options.pool;
    options.heartbeat = c.options.heartbeat;
    options.executor  = c.options.executor;

    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);
    std::signal(SIGUSR1, HandleSignal);
    std::signal(SIGUSR2, HandleSignal);

    WorkerLoop loop(registration, deps, options, g_token);
    loop.Run();

    ShutdownObservability();
  } catch (const std::exception& e) {
    TASKORCH_LOG_ERROR("Fatal error", {taskorch::observability::StringField("error", e.what()),
                                       taskorch::observability::StringField("worker_id", registration.worker_id)});
    ShutdownObservability();
    return 2;
  }

  return 0;
}
