#include "heartbeat_monitor.hpp"

#include <algorithm>

#include "internal/core/store_ops.hpp"
#include "internal/model/worker_status.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace taskorch::heartbeat {

using namespace taskorch::v1;
using std::chrono::milliseconds;

namespace {

milliseconds Scale(milliseconds base, double multiplier) {
  return milliseconds(static_cast<int64_t>(static_cast<double>(base.count()) * multiplier));
}

} // namespace

HeartbeatMonitor::HeartbeatMonitor(std::shared_ptr<db::Repository> repository, std::shared_ptr<pool::ProcessControl> process_control,
                                   config::HeartbeatOptions options, util::ClockFn clock)
    : repository_(std::move(repository)), process_control_(std::move(process_control)), options_(std::move(options)), clock_(std::move(clock)) {
}

void HeartbeatMonitor::RecordHeartbeat(const std::string& worker_id, const std::string& task_id, uint32_t progress_percent,
                                       uint64_t expected_timeout_seconds) {
  core::RunTransaction(*repository_, [&](db::Transaction& tx) {
    auto worker = repository_->GetWorker(tx, worker_id);
    if (!worker) {
      throw util::NotFound("worker not registered: " + worker_id);
    }
    if (model::IsGone(worker->status)) {
      throw util::StaleWorker("worker " + worker_id + " was recovered as " + std::string(model::ToString(worker->status)));
    }

    const auto now_ms = util::ToUnixMillis(clock_());

    if (!task_id.empty()) {
      auto task = repository_->GetTask(tx, task_id);
      if (!task) {
        throw util::NotFound("task not found: " + task_id);
      }
      if (task->state != TASK_STATE_RUNNING || task->worker_id != worker_id) {
        throw util::StaleWorker("worker " + worker_id + " no longer owns task " + task_id);
      }
      task->heartbeat_at_ms = now_ms;
      core::ThrowIfDbError(repository_->UpdateTask(tx, *task), "refresh task heartbeat " + task_id);
    }

    db::model::HeartbeatRecord beat;
    beat.worker_id                = worker_id;
    beat.timestamp_ms             = now_ms;
    beat.status                   = std::string(model::ToString(worker->status));
    beat.task_id                  = task_id;
    beat.progress_percent         = std::min<uint32_t>(progress_percent, 100);
    beat.expected_timeout_seconds = expected_timeout_seconds;
    core::ThrowIfDbError(repository_->UpsertHeartbeat(tx, beat), "record heartbeat " + worker_id);

    worker->last_heartbeat_ms = now_ms;
    core::ThrowIfDbError(repository_->UpdateWorker(tx, *worker), "bump heartbeat " + worker_id);
  });
}

milliseconds HeartbeatMonitor::ThresholdFor(db::Transaction& tx, const db::model::WorkerRecord& worker) {
  milliseconds threshold = options_.stale_threshold;

  for (const auto& task : repository_->ListRunningByWorker(tx, worker.worker_id)) {
    const auto it = options_.task_type_timeouts.find(task.type);
    if (it != options_.task_type_timeouts.end()) {
      threshold = std::max(threshold, Scale(it->second, options_.grace_multiplier));
    }
  }

  if (auto beat = repository_->GetHeartbeat(tx, worker.worker_id); beat && beat->expected_timeout_seconds > 0) {
    const milliseconds expected(static_cast<int64_t>(beat->expected_timeout_seconds) * 1000);
    threshold = std::max(threshold, Scale(expected, options_.grace_multiplier));
  }
  return threshold;
}

bool HeartbeatMonitor::IsStale(db::Transaction& tx, const db::model::WorkerRecord& worker, util::TimePoint now, milliseconds* age,
                               milliseconds* threshold) {
  if (worker.status != WORKER_STATUS_BUSY) {
    return false;
  }
  const auto last = util::FromUnixMillis(worker.last_heartbeat_ms);
  *age            = std::chrono::duration_cast<milliseconds>(now - last);
  *threshold      = ThresholdFor(tx, worker);
  return *age > *threshold;
}

std::vector<StaleWorker> HeartbeatMonitor::FindStale(util::TimePoint now) {
  std::vector<StaleWorker> stale;

  auto tx = repository_->Begin();
  for (const auto& worker : repository_->ListWorkers(*tx)) {
    milliseconds age{0};
    milliseconds threshold{0};
    if (IsStale(*tx, worker, now, &age, &threshold)) {
      stale.push_back(StaleWorker{worker.worker_id, worker.pid, age, threshold});
    }
  }
  tx->Commit();
  return stale;
}

Recovery HeartbeatMonitor::Recover(const std::string& worker_id, const std::string& reason, bool require_stale) {
  auto recovery = core::RunTransaction(*repository_, [&](db::Transaction& tx) {
    Recovery out;
    out.worker_id = worker_id;

    auto worker = repository_->GetWorker(tx, worker_id);
    if (!worker) {
      throw util::NotFound("worker not found: " + worker_id);
    }

    const auto now = clock_();
    if (require_stale) {
      milliseconds age{0};
      milliseconds threshold{0};
      // a heartbeat may have landed since the scan
      if (!IsStale(tx, *worker, now, &age, &threshold)) {
        return out;
      }
    }

    const auto now_ms  = util::ToUnixMillis(now);
    const auto running = repository_->ListRunningByWorker(tx, worker_id);
    if (model::IsGone(worker->status) && running.empty()) {
      return out;
    }

    if (!model::IsGone(worker->status)) {
      if (worker->status == WORKER_STATUS_STARTING) {
        // starting may only leave through stopping
        worker->status = WORKER_STATUS_STOPPING;
        core::ThrowIfDbError(repository_->UpdateWorker(tx, *worker), "stop worker " + worker_id);
      }
      worker->status = process_control_->IsAlive(worker->pid) ? WORKER_STATUS_CRASHED : WORKER_STATUS_DEAD;
      worker->crash_count++;
      core::ThrowIfDbError(repository_->UpdateWorker(tx, *worker), "mark worker " + worker_id);
      out.status = worker->status;
    }

    for (auto task : running) {
      task.state           = TASK_STATE_QUEUED;
      task.worker_id.clear();
      task.started_at_ms   = 0;
      task.heartbeat_at_ms = 0;
      task.updated_at_ms   = now_ms;
      core::ThrowIfDbError(repository_->UpdateTask(tx, task), "requeue task " + task.id);
      core::AppendEvent(*repository_, tx, task.id, "TASK_RECOVERED", worker_id, reason, task.trace_id, now_ms);
      out.requeued_tasks.push_back(task.id);
    }
    return out;
  });

  if (recovery.status != WORKER_STATUS_UNSPECIFIED || !recovery.requeued_tasks.empty()) {
    observability::Metrics::Instance().RecordRecovery(model::ToString(recovery.status));
    TASKORCH_LOG_WARN("Worker recovered", {observability::StringField("worker_id", worker_id),
                                           observability::StringField("status", model::ToString(recovery.status)),
                                           observability::IntField("requeued", static_cast<int64_t>(recovery.requeued_tasks.size())),
                                           observability::StringField("reason", reason)});
  }
  return recovery;
}

Recovery HeartbeatMonitor::RecoverWorker(const std::string& worker_id, const std::string& reason) {
  return Recover(worker_id, reason, false);
}

std::vector<Recovery> HeartbeatMonitor::RecoverStaleWorkers() {
  observability::SpanScope span("HeartbeatMonitor.RecoverStaleWorkers");

  std::vector<Recovery> recovered;
  for (const auto& stale : FindStale(clock_())) {
    auto recovery = Recover(stale.worker_id, "heartbeat stale for " + std::to_string(stale.age.count()) + "ms", true);
    if (recovery.status != WORKER_STATUS_UNSPECIFIED || !recovery.requeued_tasks.empty()) {
      recovered.push_back(std::move(recovery));
    }
  }
  return recovered;
}

} // namespace taskorch::heartbeat
