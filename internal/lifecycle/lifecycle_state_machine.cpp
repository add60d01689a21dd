#include "lifecycle_state_machine.hpp"

#include "internal/core/store_ops.hpp"
#include "internal/model/enums.hpp"
#include "internal/model/state_machine.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace taskorch::lifecycle {

using namespace taskorch::v1;
using db::model::TaskRecord;

LifecycleStateMachine::LifecycleStateMachine(std::shared_ptr<db::Repository> repository, config::LifecycleOptions options, util::ClockFn clock)
    : repository_(std::move(repository)), options_(options), clock_(std::move(clock)) {
}

TaskRecord LifecycleStateMachine::Load(db::Transaction& tx, const std::string& task_id) {
  auto task = repository_->GetTask(tx, task_id);
  if (!task) {
    throw util::NotFound("task not found: " + task_id);
  }
  return *task;
}

TaskRecord LifecycleStateMachine::LoadOwned(db::Transaction& tx, const std::string& task_id, const std::string& worker_id) {
  auto task = Load(tx, task_id);
  if (task.state != TASK_STATE_RUNNING || task.worker_id != worker_id) {
    throw util::StaleWorker("worker " + worker_id + " does not own task " + task_id);
  }
  return task;
}

void LifecycleStateMachine::Store(db::Transaction& tx, const TaskRecord& task) {
  core::ThrowIfDbError(repository_->UpdateTask(tx, task), "update task " + task.id);
}

void LifecycleStateMachine::Step(db::Transaction& tx, TaskRecord& task, TaskState to, const std::string& actor, const std::string& detail,
                                 uint64_t now_ms) {
  if (!model::CanTransition(task.state, to)) {
    TASKORCH_LOG_ERROR("Rejected task transition", {observability::StringField("task_id", task.id),
                                                    observability::StringField("from", model::ToString(task.state)),
                                                    observability::StringField("to", model::ToString(to))});
    throw util::InvalidTransition("task " + task.id + ": " + std::string(model::ToString(task.state)) + " -> " +
                                  std::string(model::ToString(to)));
  }

  task.state         = to;
  task.updated_at_ms = now_ms;
  if (to != TASK_STATE_RUNNING) {
    task.worker_id.clear();
  }
  if (model::IsTerminal(to)) {
    task.completed_at_ms = now_ms;
  }
  core::AppendEvent(*repository_, tx, task.id, "STATE_" + std::string(model::ToString(to)), actor, detail, task.trace_id, now_ms);
}

void LifecycleStateMachine::RetryOrEscalate(db::Transaction& tx, TaskRecord& task, const std::string& actor, uint64_t now_ms) {
  if (task.retry_count < task.max_retries) {
    task.retry_count++;
    task.started_at_ms   = 0;
    task.heartbeat_at_ms = 0;
    Step(tx, task, TASK_STATE_QUEUED, actor, "retry " + std::to_string(task.retry_count) + "/" + std::to_string(task.max_retries), now_ms);
    return;
  }
  Step(tx, task, TASK_STATE_ESCALATED, actor, "retry budget exhausted after " + std::to_string(task.retry_count) + " retries", now_ms);
}

TaskRecord LifecycleStateMachine::SubmitForReview(const std::string& task_id, const std::string& worker_id, const std::string& result) {
  return core::RunTransaction(*repository_, [&](db::Transaction& tx) {
    const auto now_ms = util::ToUnixMillis(clock_());
    auto       task   = LoadOwned(tx, task_id, worker_id);

    task.result = result;
    task.error.clear();
    Step(tx, task, TASK_STATE_REVIEW, worker_id, "", now_ms);
    Store(tx, task);

    if (auto worker = repository_->GetWorker(tx, worker_id)) {
      worker->tasks_completed++;
      core::ThrowIfDbError(repository_->UpdateWorker(tx, *worker), "count completion " + worker_id);
    }
    core::SettleWorker(*repository_, tx, worker_id);
    return task;
  });
}

TaskRecord LifecycleStateMachine::ApplyConsensus(const std::string& task_id, ConsensusResult result, const std::string& feedback) {
  auto task = core::RunTransaction(*repository_, [&](db::Transaction& tx) {
    const auto now_ms = util::ToUnixMillis(clock_());
    auto       task   = Load(tx, task_id);
    if (result == CONSENSUS_RESULT_PENDING) {
      return task;
    }
    if (task.state != TASK_STATE_REVIEW) {
      throw util::InvalidTransition("consensus applies to REVIEW, task " + task_id + " is " + std::string(model::ToString(task.state)));
    }

    const std::string actor = "consensus";
    switch (result) {
      case CONSENSUS_RESULT_PASS:
        Step(tx, task, TASK_STATE_APPROVED, actor, "", now_ms);
        Step(tx, task, TASK_STATE_COMPLETED, actor, "", now_ms);
        break;
      case CONSENSUS_RESULT_FAIL:
        task.feedback = feedback;
        Step(tx, task, TASK_STATE_REJECTED, actor, feedback, now_ms);
        RetryOrEscalate(tx, task, actor, now_ms);
        break;
      case CONSENSUS_RESULT_INCONCLUSIVE:
        task.feedback = feedback;
        Step(tx, task, TASK_STATE_ESCALATED, actor, "consensus inconclusive", now_ms);
        break;
      default:
        throw util::InvalidArgument("unknown consensus result " + std::to_string(static_cast<int>(result)));
    }
    Store(tx, task);
    return task;
  });

  TASKORCH_LOG_INFO("Consensus applied", {observability::StringField("task_id", task_id),
                                          observability::StringField("result", model::ToString(result)),
                                          observability::StringField("state", model::ToString(task.state))});
  return task;
}

TaskRecord LifecycleStateMachine::ReportExecutorFailure(const std::string& task_id, const std::string& worker_id, const std::string& error) {
  return core::RunTransaction(*repository_, [&](db::Transaction& tx) {
    const auto now_ms = util::ToUnixMillis(clock_());
    auto       task   = LoadOwned(tx, task_id, worker_id);

    task.error = error;
    RetryOrEscalate(tx, task, worker_id, now_ms);
    Store(tx, task);

    if (auto worker = repository_->GetWorker(tx, worker_id)) {
      worker->tasks_failed++;
      core::ThrowIfDbError(repository_->UpdateWorker(tx, *worker), "count failure " + worker_id);
    }
    core::SettleWorker(*repository_, tx, worker_id);
    return task;
  });
}

TaskRecord LifecycleStateMachine::Fail(const std::string& task_id, const std::string& error) {
  return core::RunTransaction(*repository_, [&](db::Transaction& tx) {
    const auto now_ms = util::ToUnixMillis(clock_());
    auto       task   = Load(tx, task_id);
    const auto owner  = task.worker_id;

    task.error = error;
    Step(tx, task, TASK_STATE_FAILED, "lifecycle", error, now_ms);
    Store(tx, task);
    core::SettleWorker(*repository_, tx, owner);
    return task;
  });
}

TaskRecord LifecycleStateMachine::Cancel(const std::string& task_id, const std::string& reason) {
  return core::RunTransaction(*repository_, [&](db::Transaction& tx) {
    const auto now_ms = util::ToUnixMillis(clock_());
    auto       task   = Load(tx, task_id);

    Step(tx, task, TASK_STATE_CANCELLED, "operator", reason, now_ms);
    Store(tx, task);
    return task;
  });
}

TaskRecord LifecycleStateMachine::Escalate(const std::string& task_id, const std::string& reason) {
  return core::RunTransaction(*repository_, [&](db::Transaction& tx) {
    const auto now_ms = util::ToUnixMillis(clock_());
    auto       task   = Load(tx, task_id);
    const auto owner  = task.worker_id;

    Step(tx, task, TASK_STATE_ESCALATED, "lifecycle", reason, now_ms);
    Store(tx, task);
    core::SettleWorker(*repository_, tx, owner);
    return task;
  });
}

} // namespace taskorch::lifecycle
