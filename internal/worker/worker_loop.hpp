#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <string>

#include "internal/config/options.hpp"
#include "internal/pool/worker_pool_manager.hpp"
#include "internal/worker/cancellation_token.hpp"

namespace taskorch::breaker {
class CircuitBreaker;
}
namespace taskorch::budget {
class BudgetGovernor;
}
namespace taskorch::executor {
class ModelExecutor;
}
namespace taskorch::heartbeat {
class HeartbeatMonitor;
}
namespace taskorch::lifecycle {
class LifecycleStateMachine;
}

namespace taskorch::worker {

struct WorkerLoopDeps {
  std::shared_ptr<pool::WorkerPoolManager>         pool;
  std::shared_ptr<core::TaskStore>                 tasks;
  std::shared_ptr<heartbeat::HeartbeatMonitor>     monitor;
  std::shared_ptr<lifecycle::LifecycleStateMachine> lifecycle;
  std::shared_ptr<breaker::CircuitBreaker>         breaker;
  std::shared_ptr<executor::ModelExecutor>         executor;
  std::shared_ptr<budget::BudgetGovernor>          budget;
};

struct WorkerLoopOptions {
  config::PoolOptions      pool;
  config::HeartbeatOptions heartbeat;
  config::ExecutorOptions  executor;
};

enum class StepResult {
  kStopped,
  kPaused,
  kIdle,
  kSubmitted,
  kFailed,
  kReleased,
};

/*
  One worker process.

    stop? -> heartbeat -> pause? -> owned | claim -> execute -> submit | fail | release

  Execution runs behind the capability's circuit breaker. While a
  task executes, heartbeats keep flowing on a side thread so the
  monitor does not declare the worker stale.

  A RUNNING task this worker already owns (assigned by an operator,
  or kept after a failed release) runs before any new claim. Any
  other error after the claim hands the task back to the queue,
  retrying the release a few times before giving up the step.
*/
class WorkerLoop {
 public:
  using SleepFn = std::function<void(std::chrono::milliseconds)>;

  WorkerLoop(pool::WorkerRegistration registration, WorkerLoopDeps deps, WorkerLoopOptions options, CancellationToken& token,
             SleepFn sleep = nullptr);

  // Registers and moves the worker to idle.
  void Join();

  StepResult RunOnce();

  // Join, loop until stop, then Shutdown.
  void Run();

  // Releases held tasks and retires the worker: stopping -> dead.
  void Shutdown();

  const std::string& WorkerId() const {
    return registration_.worker_id;
  }

 private:
  // Returns false when the pool or token asks this worker to hold.
  bool        SyncPause();
  StepResult  Execute(const db::model::TaskRecord& task);
  StepResult  Attempt(const db::model::TaskRecord& task);
  void        Release(const std::string& task_id, const std::string& reason);
  std::string Prompt(const db::model::TaskRecord& task) const;
  // Waits in slices so a stop request cuts the wait short.
  void Wait(std::chrono::milliseconds duration);

  pool::WorkerRegistration registration_;
  WorkerLoopDeps           deps_;
  WorkerLoopOptions        options_;
  CancellationToken&       token_;
  SleepFn                  sleep_;
};

} // namespace taskorch::worker
