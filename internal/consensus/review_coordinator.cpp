#include "review_coordinator.hpp"

#include <algorithm>
#include <chrono>

#include "internal/breaker/circuit_breaker.hpp"
#include "internal/budget/budget_governor.hpp"
#include "internal/executor/model_executor.hpp"
#include "internal/lifecycle/lifecycle_state_machine.hpp"
#include "internal/model/enums.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace taskorch::consensus {

using namespace taskorch::v1;

ReviewCoordinator::ReviewCoordinator(std::shared_ptr<db::Repository> repository, std::shared_ptr<ConsensusEngine> engine,
                                     std::shared_ptr<lifecycle::LifecycleStateMachine> lifecycle,
                                     std::shared_ptr<breaker::CircuitBreaker> breaker, std::shared_ptr<executor::ModelExecutor> executor,
                                     std::shared_ptr<budget::BudgetGovernor> budget, config::ConsensusOptions options)
    : repository_(std::move(repository)),
      engine_(std::move(engine)),
      lifecycle_(std::move(lifecycle)),
      breaker_(std::move(breaker)),
      executor_(std::move(executor)),
      budget_(std::move(budget)),
      options_(std::move(options)) {
}

std::string ReviewCoordinator::Prompt(const db::model::TaskRecord& task) const {
  return "Verify the implementation for task " + task.id + " (" + task.type + "): " + task.name + "\n\nTask:\n" + task.payload +
         "\n\nResult:\n" + task.result +
         "\n\nCheck for correctness, security issues and edge cases. Reply with APPROVE or REJECT followed by your findings.";
}

std::string ReviewCoordinator::OpenSession(const db::model::TaskRecord& task) {
  for (const auto& view : engine_->SessionsForTask(task.id)) {
    if (view.session.final_result == CONSENSUS_RESULT_PENDING) {
      return view.session.id;
    }
  }
  return engine_->CreateSession(task.id, task.assigned_model);
}

void ReviewCoordinator::AskVoter(const db::model::TaskRecord& task, const SessionView& view, const std::string& voter) {
  const auto started = std::chrono::steady_clock::now();
  Vote        vote   = VOTE_ERROR;
  std::string reason;

  try {
    auto reply = breaker_->Call(voter, [&] { return executor_->Execute(voter, Prompt(task), options_.vote_timeout); });
    vote       = ConsensusEngine::ParseVote(reply.text);
    reason     = reply.text;
    if (reply.cost_usd > 0.0) {
      budget_->RecordSpend(reply.cost_usd, voter, task.id);
    }
  } catch (const util::ExecutorTimeout& e) {
    vote   = VOTE_TIMEOUT;
    reason = e.what();
  } catch (const util::ExecutorError& e) {
    reason = e.what();
  } catch (const util::CircuitOpen& e) {
    reason = e.what();
  }

  const auto duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started).count();
  engine_->RecordVote(view.session.id, voter, vote, reason, static_cast<uint64_t>(duration_ms));
}

ConsensusResult ReviewCoordinator::ReviewTask(const std::string& task_id) {
  observability::SpanScope span("ReviewCoordinator.ReviewTask");
  span.SetAttribute("task.id", task_id);

  auto tx   = repository_->Begin();
  auto task = repository_->GetTask(*tx, task_id);
  tx->Commit();
  if (!task) {
    throw util::NotFound("task not found: " + task_id);
  }
  if (task->state != TASK_STATE_REVIEW) {
    throw util::InvalidState("task " + task_id + " is not in REVIEW");
  }

  const auto session_id = OpenSession(*task);
  const auto view       = engine_->GetSession(session_id);
  for (const auto& voter : view.voters) {
    const bool voted = std::any_of(view.votes.begin(), view.votes.end(), [&](const db::model::VoteRecord& v) { return v.voter == voter; });
    if (!voted) {
      AskVoter(*task, view, voter);
    }
  }

  auto result = engine_->Evaluate(session_id);
  if (result == CONSENSUS_RESULT_PENDING) {
    result = engine_->ExpireSession(session_id);
  }

  std::string feedback;
  for (const auto& vote : engine_->GetSession(session_id).votes) {
    if (vote.vote != VOTE_APPROVE) {
      feedback += "[" + vote.voter + " " + std::string(model::ToString(vote.vote)) + "] " + vote.reason + "\n";
    }
  }

  lifecycle_->ApplyConsensus(task_id, result, feedback);
  return result;
}

size_t ReviewCoordinator::ReviewPending() {
  auto tx      = repository_->Begin();
  auto pending = repository_->ListTasks(*tx, TASK_STATE_REVIEW, 0);
  tx->Commit();

  size_t decided = 0;
  for (const auto& task : pending) {
    try {
      if (ReviewTask(task.id) != CONSENSUS_RESULT_PENDING) {
        ++decided;
      }
    } catch (const std::exception& e) {
      TASKORCH_LOG_ERROR("Review failed", {observability::StringField("task_id", task.id), observability::StringField("error", e.what())});
    }
  }
  return decided;
}

} // namespace taskorch::consensus
