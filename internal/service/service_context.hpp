#pragma once

#include <memory>

namespace taskorch::db { class Repository; }
namespace taskorch::core { class TaskStore; }
namespace taskorch::pool { class WorkerPoolManager; }
namespace taskorch::heartbeat { class HeartbeatMonitor; }
namespace taskorch::lifecycle { class LifecycleStateMachine; }
namespace taskorch::consensus { class ConsensusEngine; }
namespace taskorch::breaker { class CircuitBreaker; }
namespace taskorch::budget { class BudgetGovernor; }

namespace taskorch::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<taskorch::db::Repository>                repository;
  std::shared_ptr<taskorch::core::TaskStore>               tasks;
  std::shared_ptr<taskorch::pool::WorkerPoolManager>       pool;
  std::shared_ptr<taskorch::heartbeat::HeartbeatMonitor>   monitor;
  std::shared_ptr<taskorch::lifecycle::LifecycleStateMachine> lifecycle;
  std::shared_ptr<taskorch::consensus::ConsensusEngine>    consensus;
  std::shared_ptr<taskorch::breaker::CircuitBreaker>       breaker;
  std::shared_ptr<taskorch::budget::BudgetGovernor>        budget;
};

}
