#include "task_store.hpp"

#include <algorithm>
#include <cctype>

#include "internal/core/store_ops.hpp"
#include "internal/model/state_machine.hpp"
#include "internal/model/worker_status.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace taskorch::core {

using namespace taskorch::v1;
using db::model::TaskRecord;

namespace {

std::string NormalizeType(std::string type) {
  std::transform(type.begin(), type.end(), type.begin(), [](unsigned char ch) { return static_cast<char>(std::toupper(ch)); });
  return type;
}

} // namespace

TaskStore::TaskStore(std::shared_ptr<db::Repository> repository, RoutingTable routing, config::PoolOptions pool,
                     config::LifecycleOptions lifecycle, util::ClockFn clock)
    : repository_(std::move(repository)), routing_(std::move(routing)), pool_(pool), lifecycle_(lifecycle), clock_(std::move(clock)) {
}

TaskRecord TaskStore::NewRecord(const TaskSpec& spec, uint64_t now_ms) const {
  TaskRecord record;
  record.id       = spec.id.empty() ? util::NewTaskId() : spec.id;
  record.name     = spec.name.empty() ? record.id : spec.name;
  record.type     = NormalizeType(spec.type);
  record.priority = spec.priority;
  record.state    = TASK_STATE_QUEUED;
  record.payload  = spec.payload;
  record.trace_id = spec.trace_id;

  const auto& route     = routing_.Resolve(record.type);
  record.lane           = route.lane;
  record.assigned_model = route.capability;
  record.shard          = spec.shard.empty() ? ShardFor(record.id, pool_.shard_count) : spec.shard;

  record.max_retries   = lifecycle_.max_retries_per_task;
  record.created_at_ms = now_ms;
  record.updated_at_ms = now_ms;
  return record;
}

bool TaskStore::EnsureTaskExists(const std::string& id, const std::string& name, const std::string& type, Priority priority,
                                 const std::string& payload) {
  if (id.empty()) {
    throw util::InvalidArgument("EnsureTaskExists requires an id");
  }

  TaskSpec spec;
  spec.id       = id;
  spec.name     = name;
  spec.type     = type;
  spec.priority = priority;
  spec.payload  = payload;

  return RunTransaction(*repository_, [&](db::Transaction& tx) {
    if (repository_->GetTask(tx, id)) {
      return false;
    }
    const auto now_ms = util::ToUnixMillis(clock_());
    auto       record = NewRecord(spec, now_ms);
    const auto result = repository_->InsertTask(tx, record);
    // lost an insert race against another watcher pass
    if (result.code == db::ErrorCode::AlreadyExists) {
      return false;
    }
    ThrowIfDbError(result, "insert task " + id);
    AppendEvent(*repository_, tx, record.id, "TASK_CREATED", "queue-watcher", "", record.trace_id, now_ms);
    return true;
  });
}

TaskRecord TaskStore::Enqueue(const TaskSpec& spec) {
  observability::SpanScope span("TaskStore.Enqueue");
  if (spec.type.empty()) {
    throw util::InvalidArgument("task type is required");
  }

  return RunTransaction(*repository_, [&](db::Transaction& tx) {
    const auto now_ms = util::ToUnixMillis(clock_());
    auto       record = NewRecord(spec, now_ms);
    ThrowIfDbError(repository_->InsertTask(tx, record), "enqueue task " + record.id);
    AppendEvent(*repository_, tx, record.id, "TASK_CREATED", "enqueue", "", record.trace_id, now_ms);
    span.SetAttribute("task.id", record.id);
    return record;
  });
}

db::Result TaskStore::ClaimInTx(db::Transaction& tx, const TaskRecord& task, const std::string& worker_id, uint64_t now_ms) {
  auto worker = repository_->GetWorker(tx, worker_id);
  if (!worker) {
    throw util::NotFound("worker not registered: " + worker_id);
  }
  if (worker->status != WORKER_STATUS_IDLE && worker->status != WORKER_STATUS_BUSY) {
    throw util::InvalidState("worker " + worker_id + " cannot claim while " + std::string(model::ToString(worker->status)));
  }
  // counted in the claiming transaction so direct assignment honours the cap too
  const auto running = repository_->ListRunningByWorker(tx, worker_id);
  if (running.size() >= pool_.max_concurrent_tasks_per_worker) {
    throw util::ClaimConflict("worker " + worker_id + " already runs " + std::to_string(running.size()) + " tasks");
  }

  auto result = repository_->MarkClaimed(tx, task.id, worker_id, now_ms);
  if (!result) {
    return result;
  }

  if (worker->status != WORKER_STATUS_BUSY) {
    worker->status = WORKER_STATUS_BUSY;
    ThrowIfDbError(repository_->UpdateWorker(tx, *worker), "mark worker busy " + worker_id);
  }
  AppendEvent(*repository_, tx, task.id, "TASK_CLAIMED", worker_id, "", task.trace_id, now_ms);
  return db::Result::Ok();
}

std::optional<TaskRecord> TaskStore::ClaimTask(const std::string& worker_id, const db::ClaimFilter& filter) {
  observability::SpanScope span("TaskStore.ClaimTask");
  const std::string        shard_label = filter.shard.value_or("");

  for (uint32_t attempt = 1; attempt <= pool_.claim_attempts; ++attempt) {
    try {
      auto tx        = repository_->Begin();
      auto candidate = repository_->NextClaimable(*tx, filter);
      if (!candidate) {
        tx->Commit();
        observability::Metrics::Instance().RecordClaim(shard_label, false);
        return std::nullopt;
      }

      const auto now_ms = util::ToUnixMillis(clock_());
      const auto result = ClaimInTx(*tx, *candidate, worker_id, now_ms);
      if (result.code == db::ErrorCode::Conflict) {
        // another worker took it between scan and update; re-scan
        tx->Rollback();
        continue;
      }
      ThrowIfDbError(result, "claim task " + candidate->id);
      tx->Commit();

      candidate->state           = TASK_STATE_RUNNING;
      candidate->worker_id       = worker_id;
      candidate->started_at_ms   = now_ms;
      candidate->heartbeat_at_ms = now_ms;
      candidate->updated_at_ms   = now_ms;

      span.SetAttribute("task.id", candidate->id);
      observability::Metrics::Instance().RecordClaim(candidate->shard, true);
      return candidate;
    } catch (const db::TransactionConflict&) {
      continue;
    } catch (const util::ClaimConflict& e) {
      span.AddEvent("concurrency_cap");
      TASKORCH_LOG_DEBUG("Claim skipped", {observability::StringField("worker_id", worker_id), observability::StringField("reason", e.what())});
      observability::Metrics::Instance().RecordClaim(shard_label, false);
      return std::nullopt;
    }
  }

  TASKORCH_LOG_WARN("Claim attempts exhausted", {observability::StringField("worker_id", worker_id),
                                                  observability::IntField("attempts", static_cast<int64_t>(pool_.claim_attempts))});
  observability::Metrics::Instance().RecordClaim(shard_label, false);
  return std::nullopt;
}

TaskRecord TaskStore::AssignTask(const std::string& task_id, const std::string& worker_id) {
  return RunTransaction(*repository_, [&](db::Transaction& tx) {
    auto task = repository_->GetTask(tx, task_id);
    if (!task) {
      throw util::NotFound("task not found: " + task_id);
    }
    if (task->state != TASK_STATE_QUEUED) {
      throw util::ClaimConflict("task " + task_id + " is " + std::string(model::ToString(task->state)));
    }

    const auto now_ms = util::ToUnixMillis(clock_());
    ThrowIfDbError(ClaimInTx(tx, *task, worker_id, now_ms), "assign task " + task_id);

    task->state           = TASK_STATE_RUNNING;
    task->worker_id       = worker_id;
    task->started_at_ms   = now_ms;
    task->heartbeat_at_ms = now_ms;
    task->updated_at_ms   = now_ms;
    return *task;
  });
}

TaskRecord TaskStore::ReleaseTask(const std::string& task_id, const std::string& reason) {
  return RunTransaction(*repository_, [&](db::Transaction& tx) {
    auto task = repository_->GetTask(tx, task_id);
    if (!task) {
      throw util::NotFound("task not found: " + task_id);
    }
    if (task->state != TASK_STATE_RUNNING) {
      throw util::InvalidTransition("release requires RUNNING, task " + task_id + " is " + std::string(model::ToString(task->state)));
    }

    const auto now_ms = util::ToUnixMillis(clock_());
    const auto owner  = task->worker_id;

    task->state           = TASK_STATE_QUEUED;
    task->worker_id.clear();
    task->started_at_ms   = 0;
    task->heartbeat_at_ms = 0;
    task->updated_at_ms   = now_ms;
    ThrowIfDbError(repository_->UpdateTask(tx, *task), "release task " + task_id);

    AppendEvent(*repository_, tx, task_id, "TASK_RELEASED", owner, reason, task->trace_id, now_ms);
    SettleWorker(*repository_, tx, owner);
    return *task;
  });
}

TaskRecord TaskStore::GetTask(const std::string& task_id) {
  auto tx   = repository_->Begin();
  auto task = repository_->GetTask(*tx, task_id);
  tx->Commit();
  if (!task) {
    throw util::NotFound("task not found: " + task_id);
  }
  return *task;
}

std::vector<TaskRecord> TaskStore::ListTasks(std::optional<TaskState> state, uint32_t limit) {
  auto tx    = repository_->Begin();
  auto tasks = repository_->ListTasks(*tx, state, limit);
  tx->Commit();
  return tasks;
}

std::vector<db::model::EventRecord> TaskStore::TaskHistory(const std::string& task_id) {
  auto tx = repository_->Begin();
  if (!repository_->GetTask(*tx, task_id)) {
    throw util::NotFound("task not found: " + task_id);
  }
  auto events = repository_->ListEvents(*tx, task_id);
  tx->Commit();
  return events;
}

std::vector<TaskRecord> TaskStore::RunningFor(const std::string& worker_id) {
  auto tx      = repository_->Begin();
  auto running = repository_->ListRunningByWorker(*tx, worker_id);
  tx->Commit();
  return running;
}

uint32_t TaskStore::CountRunning(const std::string& worker_id) {
  return static_cast<uint32_t>(RunningFor(worker_id).size());
}

std::map<std::string, uint64_t> TaskStore::QueueDepthByShard() {
  auto tx     = repository_->Begin();
  auto counts = repository_->CountQueuedByShard(*tx);
  tx->Commit();
  return counts;
}

std::map<std::string, uint64_t> TaskStore::CountByState() {
  auto tx     = repository_->Begin();
  auto counts = repository_->CountTasksByState(*tx);
  tx->Commit();
  return counts;
}

} // namespace taskorch::core
