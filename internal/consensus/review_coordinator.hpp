#pragma once

#include <memory>
#include <string>

#include "internal/config/options.hpp"
#include "internal/consensus/consensus_engine.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/runtime/periodic_worker.hpp"

namespace taskorch::breaker {
class CircuitBreaker;
}
namespace taskorch::budget {
class BudgetGovernor;
}
namespace taskorch::executor {
class ModelExecutor;
}
namespace taskorch::lifecycle {
class LifecycleStateMachine;
}

namespace taskorch::consensus {

/*
  Drives REVIEW tasks through consensus.

  Each voter is asked through the executor behind its circuit
  breaker. An open breaker or a failed call counts as ERROR, a
  timeout as TIMEOUT. The decision goes to the lifecycle.
*/
class ReviewCoordinator {
 public:
  ReviewCoordinator(std::shared_ptr<db::Repository> repository, std::shared_ptr<ConsensusEngine> engine,
                    std::shared_ptr<lifecycle::LifecycleStateMachine> lifecycle, std::shared_ptr<breaker::CircuitBreaker> breaker,
                    std::shared_ptr<executor::ModelExecutor> executor, std::shared_ptr<budget::BudgetGovernor> budget,
                    config::ConsensusOptions options);

  taskorch::v1::ConsensusResult ReviewTask(const std::string& task_id);

  // Reviews every REVIEW task; returns how many were decided.
  size_t ReviewPending();

 private:
  std::string Prompt(const db::model::TaskRecord& task) const;
  // Reuses a pending session left by an interrupted pass.
  std::string OpenSession(const db::model::TaskRecord& task);
  void        AskVoter(const db::model::TaskRecord& task, const SessionView& view, const std::string& voter);

  std::shared_ptr<db::Repository>                   repository_;
  std::shared_ptr<ConsensusEngine>                  engine_;
  std::shared_ptr<lifecycle::LifecycleStateMachine> lifecycle_;
  std::shared_ptr<breaker::CircuitBreaker>          breaker_;
  std::shared_ptr<executor::ModelExecutor>          executor_;
  std::shared_ptr<budget::BudgetGovernor>           budget_;
  config::ConsensusOptions                          options_;
};

class ReviewWorker final : public runtime::PeriodicWorker {
 public:
  ReviewWorker(std::shared_ptr<ReviewCoordinator> coordinator, std::chrono::milliseconds poll_interval)
      : runtime::PeriodicWorker("review-worker", poll_interval, [coordinator] { coordinator->ReviewPending(); }) {
  }
};

} // namespace taskorch::consensus
