#pragma once

#include <memory>
#include <vector>

#include <grpcpp/impl/service_type.h>

#include "config/config.pb.h"
#include "internal/config/options.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/runtime/periodic_worker.hpp"

namespace taskorch::core { class TaskStore; }
namespace taskorch::pool { class WorkerPoolManager; class ProcessControl; }
namespace taskorch::heartbeat { class HeartbeatMonitor; }
namespace taskorch::lifecycle { class LifecycleStateMachine; }
namespace taskorch::consensus { class ConsensusEngine; class ReviewCoordinator; }
namespace taskorch::breaker { class CircuitBreaker; }
namespace taskorch::budget { class BudgetGovernor; }
namespace taskorch::executor { class ModelExecutor; }

namespace taskorch::factory {

/*
  Components

  Every long-lived domain object, wired once. Shared by the server
  and the worker binaries.
*/
struct Components {
  config::Options options;

  std::shared_ptr<db::Repository>                   repository;
  std::shared_ptr<pool::ProcessControl>             process_control;
  std::shared_ptr<core::TaskStore>                  tasks;
  std::shared_ptr<pool::WorkerPoolManager>          pool;
  std::shared_ptr<heartbeat::HeartbeatMonitor>      monitor;
  std::shared_ptr<lifecycle::LifecycleStateMachine> lifecycle;
  std::shared_ptr<consensus::ConsensusEngine>       consensus;
  std::shared_ptr<breaker::CircuitBreaker>          breaker;
  std::shared_ptr<budget::BudgetGovernor>           budget;
  std::shared_ptr<executor::ModelExecutor>          executor;
};

struct Application {
  Components components;

  std::vector<std::unique_ptr<::grpc::Service>>           grpc_services;
  std::vector<std::shared_ptr<runtime::BackgroundWorker>> background_workers;
};

/*
  BuildRepository

  The ONLY place allowed to know concrete DB types. Applies the
  schema before handing the repository out.
*/
std::shared_ptr<db::Repository> BuildRepository(const taskorch::runtime::config::RuntimeConfig& config);

Components BuildComponents(const taskorch::runtime::config::RuntimeConfig& config);

// Components plus gRPC services and the background workers
// (heartbeat sweeper, budget watchdog, review worker, shard rebalancer).
Application Build(const taskorch::runtime::config::RuntimeConfig& config);

} // namespace taskorch::factory
