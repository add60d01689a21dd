#include "worker_pool_manager.hpp"

#include <algorithm>
#include <cctype>
#include <csignal>
#include <cstddef>
#include <map>

#include "internal/core/store_ops.hpp"
#include "internal/model/worker_status.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace taskorch::pool {

using namespace taskorch::v1;
using db::model::PauseRecord;
using db::model::TaskRecord;
using db::model::WorkerRecord;

WorkerPoolManager::WorkerPoolManager(std::shared_ptr<db::Repository> repository, std::shared_ptr<core::TaskStore> tasks,
                                     std::shared_ptr<ProcessControl> process_control, config::PoolOptions options, util::ClockFn clock)
    : repository_(std::move(repository)),
      tasks_(std::move(tasks)),
      process_control_(std::move(process_control)),
      options_(options),
      clock_(std::move(clock)) {
}

WorkerRecord WorkerPoolManager::Register(const WorkerRegistration& registration) {
  if (registration.worker_id.empty()) {
    throw util::InvalidArgument("worker_id is required");
  }

  auto worker = core::RunTransaction(*repository_, [&](db::Transaction& tx) {
    const auto now_ms   = util::ToUnixMillis(clock_());
    auto       existing = repository_->GetWorker(tx, registration.worker_id);

    WorkerRecord record = existing.value_or(WorkerRecord{});
    record.worker_id      = registration.worker_id;
    record.pid            = registration.pid;
    record.specialization = registration.specialization;
    record.shard          = registration.shard;
    record.model          = registration.model;
    record.last_heartbeat_ms = now_ms;

    if (!existing) {
      record.status        = WORKER_STATUS_STARTING;
      record.started_at_ms = now_ms;
      core::ThrowIfDbError(repository_->InsertWorker(tx, record), "register worker " + record.worker_id);
      return record;
    }

    if (model::IsGone(existing->status)) {
      record.status        = WORKER_STATUS_STARTING;
      record.started_at_ms = now_ms;
    }
    core::ThrowIfDbError(repository_->UpdateWorker(tx, record), "re-register worker " + record.worker_id);
    return record;
  });

  TASKORCH_LOG_INFO("Worker registered", {observability::StringField("worker_id", worker.worker_id),
                                          observability::IntField("pid", worker.pid),
                                          observability::StringField("status", model::ToString(worker.status))});
  return worker;
}

WorkerRecord WorkerPoolManager::Transition(const std::string& worker_id, WorkerStatus status) {
  return core::RunTransaction(*repository_, [&](db::Transaction& tx) {
    auto worker = repository_->GetWorker(tx, worker_id);
    if (!worker) {
      throw util::NotFound("worker not found: " + worker_id);
    }
    if (status == WORKER_STATUS_BUSY && repository_->ListRunningByWorker(tx, worker_id).empty()) {
      throw util::InvalidTransition("worker " + worker_id + " owns no running task and cannot be busy");
    }
    const auto from = worker->status;
    worker->status  = status;
    const auto result = repository_->UpdateWorker(tx, *worker);
    if (result.code == db::ErrorCode::ConstraintViolation) {
      throw util::InvalidTransition("worker " + worker_id + ": " + std::string(model::ToString(from)) + " -> " +
                                    std::string(model::ToString(status)));
    }
    core::ThrowIfDbError(result, "transition worker " + worker_id);
    return *worker;
  });
}

db::ClaimFilter WorkerPoolManager::FilterFor(const WorkerRecord& worker) const {
  db::ClaimFilter filter;
  if (!worker.shard.empty()) {
    filter.shard = worker.shard;
  }
  if (!worker.model.empty()) {
    filter.model = worker.model;
  }

  if (!worker.specialization.empty() && worker.specialization != "general") {
    filter.types = tasks_->Routing().TypesForLane(worker.specialization);
    if (filter.types.empty()) {
      // a specialization that is not a lane names a task type directly
      std::string type = worker.specialization;
      std::transform(type.begin(), type.end(), type.begin(), [](unsigned char ch) { return static_cast<char>(std::toupper(ch)); });
      filter.types.push_back(type);
    }
  }
  return filter;
}

std::optional<TaskRecord> WorkerPoolManager::RequestClaim(const std::string& worker_id) {
  observability::SpanScope span("WorkerPool.RequestClaim");

  auto tx      = repository_->Begin();
  auto kill    = repository_->GetKillSwitch(*tx);
  auto pause   = repository_->GetPause(*tx);
  auto worker  = repository_->GetWorker(*tx, worker_id);
  auto running = worker ? repository_->ListRunningByWorker(*tx, worker_id) : std::vector<TaskRecord>{};
  tx->Commit();

  if (!worker) {
    throw util::NotFound("worker not registered: " + worker_id);
  }
  if (kill.active || pause.paused) {
    return std::nullopt;
  }
  if (worker->status != WORKER_STATUS_IDLE && worker->status != WORKER_STATUS_BUSY) {
    return std::nullopt;
  }
  if (running.size() >= options_.max_concurrent_tasks_per_worker) {
    span.AddEvent("concurrency_cap");
    return std::nullopt;
  }

  return tasks_->ClaimTask(worker_id, FilterFor(*worker));
}

std::string WorkerPoolManager::ShardFor(const std::string& task_key) const {
  return core::ShardFor(task_key, options_.shard_count);
}

const config::Route& WorkerPoolManager::Route(const std::string& task_type) const {
  return tasks_->Routing().Resolve(task_type);
}

PauseRecord WorkerPoolManager::RequestPause(const std::string& reason) {
  auto pause = core::RunTransaction(*repository_, [&](db::Transaction& tx) {
    auto current = repository_->GetPause(tx);
    if (current.paused) {
      return current;
    }
    PauseRecord record;
    record.paused          = true;
    record.reason          = reason;
    record.requested_at_ms = util::ToUnixMillis(clock_());
    core::ThrowIfDbError(repository_->PutPause(tx, record), "pause pool");
    return record;
  });
  TASKORCH_LOG_WARN("Pool paused", {observability::StringField("reason", pause.reason)});
  return pause;
}

PauseRecord WorkerPoolManager::Resume() {
  auto pause = core::RunTransaction(*repository_, [&](db::Transaction& tx) {
    PauseRecord record;
    record.requested_at_ms = util::ToUnixMillis(clock_());
    core::ThrowIfDbError(repository_->PutPause(tx, record), "resume pool");
    return record;
  });
  TASKORCH_LOG_INFO("Pool resumed");
  return pause;
}

PauseRecord WorkerPoolManager::PauseState() {
  auto tx    = repository_->Begin();
  auto pause = repository_->GetPause(*tx);
  tx->Commit();
  return pause;
}

size_t WorkerPoolManager::SignalWorkers(int signal) {
  size_t reached = 0;
  for (const auto& worker : ListWorkers()) {
    if (model::IsGone(worker.status) || worker.pid <= 0) {
      continue;
    }
    if (process_control_->Signal(worker.pid, signal)) {
      ++reached;
    } else {
      TASKORCH_LOG_WARN("Signal not delivered", {observability::StringField("worker_id", worker.worker_id),
                                                 observability::IntField("pid", worker.pid), observability::IntField("signal", signal)});
    }
  }
  return reached;
}

bool WorkerPoolManager::Terminate(const std::string& worker_id) {
  auto worker = GetWorker(worker_id);
  if (model::IsGone(worker.status) || worker.pid <= 0) {
    return false;
  }
  TASKORCH_LOG_WARN("Terminating worker", {observability::StringField("worker_id", worker_id), observability::IntField("pid", worker.pid)});
  return process_control_->Signal(worker.pid, SIGKILL);
}

size_t WorkerPoolManager::RebalanceShards() {
  const uint32_t shard_count = std::max<uint32_t>(options_.shard_count, 1);

  const auto moved = core::RunTransaction(*repository_, [&](db::Transaction& tx) -> size_t {
    std::map<std::string, std::vector<TaskRecord>> by_shard;
    for (uint32_t i = 0; i < shard_count; ++i) {
      by_shard["shard-" + std::to_string(i)];
    }
    uint64_t total = 0;
    for (auto& task : repository_->ListTasks(tx, TASK_STATE_QUEUED, 0)) {
      auto it = by_shard.find(task.shard);
      if (it == by_shard.end()) {
        continue;
      }
      it->second.push_back(std::move(task));
      ++total;
    }

    auto depth = [](const auto& entry) { return entry.second.size(); };
    const auto [low, high] = std::minmax_element(by_shard.begin(), by_shard.end(),
                                                 [&](const auto& a, const auto& b) { return depth(a) < depth(b); });
    if (high->second.size() - low->second.size() <= options_.rebalance_threshold) {
      return 0;
    }

    const size_t target     = total / shard_count;
    const auto   now_ms     = util::ToUnixMillis(clock_());
    size_t       reassigned = 0;

    std::vector<std::string> sources;
    for (const auto& [shard, queued] : by_shard) {
      if (queued.size() > target + 1) {
        sources.push_back(shard);
      }
    }

    for (const auto& shard : sources) {
      auto& queued = by_shard[shard];
      // lowest priority, newest first
      std::sort(queued.begin(), queued.end(), [](const TaskRecord& a, const TaskRecord& b) {
        if (a.priority != b.priority) return a.priority > b.priority;
        return a.created_at_ms > b.created_at_ms;
      });

      const size_t excess = queued.size() - target - 1;
      size_t       taken  = 0;
      for (; taken < excess; ++taken) {
        auto shallowest = std::min_element(by_shard.begin(), by_shard.end(),
                                           [&](const auto& a, const auto& b) { return depth(a) < depth(b); });
        if (shallowest->first == shard) {
          break;
        }
        auto task          = queued[taken];
        task.shard         = shallowest->first;
        task.updated_at_ms = now_ms;
        core::ThrowIfDbError(repository_->UpdateTask(tx, task), "reshard task " + task.id);
        core::AppendEvent(*repository_, tx, task.id, "TASK_RESHARDED", "pool", shard + " -> " + task.shard, task.trace_id, now_ms);
        shallowest->second.push_back(task);
      }
      queued.erase(queued.begin(), queued.begin() + static_cast<std::ptrdiff_t>(taken));
      reassigned += taken;
    }
    return reassigned;
  });

  if (moved > 0) {
    TASKORCH_LOG_INFO("Shards rebalanced", {observability::IntField("moved", static_cast<int64_t>(moved))});
  }
  return moved;
}

std::vector<WorkerRecord> WorkerPoolManager::ListWorkers() {
  auto tx      = repository_->Begin();
  auto workers = repository_->ListWorkers(*tx);
  tx->Commit();
  return workers;
}

WorkerRecord WorkerPoolManager::GetWorker(const std::string& worker_id) {
  auto tx     = repository_->Begin();
  auto worker = repository_->GetWorker(*tx, worker_id);
  tx->Commit();
  if (!worker) {
    throw util::NotFound("worker not found: " + worker_id);
  }
  return *worker;
}

} // namespace taskorch::pool
