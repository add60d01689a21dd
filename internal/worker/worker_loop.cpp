#include "worker_loop.hpp"

#include <algorithm>
#include <thread>

#include "internal/breaker/circuit_breaker.hpp"
#include "internal/budget/budget_governor.hpp"
#include "internal/executor/model_executor.hpp"
#include "internal/heartbeat/heartbeat_monitor.hpp"
#include "internal/lifecycle/lifecycle_state_machine.hpp"
#include "internal/model/worker_status.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/runtime/periodic_worker.hpp"
#include "internal/util/errors.hpp"

namespace taskorch::worker {

using namespace taskorch::v1;
using db::model::TaskRecord;
using observability::StringField;

namespace {

constexpr std::chrono::milliseconds kWaitSlice{200};
constexpr uint32_t                  kReleaseAttempts = 3;

} // namespace

WorkerLoop::WorkerLoop(pool::WorkerRegistration registration, WorkerLoopDeps deps, WorkerLoopOptions options, CancellationToken& token,
                       SleepFn sleep)
    : registration_(std::move(registration)), deps_(std::move(deps)), options_(std::move(options)), token_(token), sleep_(std::move(sleep)) {
  if (!sleep_) {
    sleep_ = [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
  }
}

void WorkerLoop::Join() {
  auto worker = deps_.pool->Register(registration_);
  if (worker.status == WORKER_STATUS_STARTING) {
    worker = deps_.pool->Transition(WorkerId(), WORKER_STATUS_IDLE);
  }
  TASKORCH_LOG_INFO("Worker joined", {StringField("worker_id", WorkerId()), StringField("shard", worker.shard),
                                      StringField("specialization", worker.specialization), StringField("model", worker.model)});
}

bool WorkerLoop::SyncPause() {
  const bool hold   = token_.PauseRequested() || deps_.pool->PauseState().paused;
  const auto worker = deps_.pool->GetWorker(WorkerId());

  if (hold) {
    if (worker.status == WORKER_STATUS_IDLE) {
      deps_.pool->Transition(WorkerId(), WORKER_STATUS_PAUSED);
      TASKORCH_LOG_INFO("Worker paused", {StringField("worker_id", WorkerId())});
    }
    return false;
  }
  if (worker.status == WORKER_STATUS_PAUSED) {
    deps_.pool->Transition(WorkerId(), WORKER_STATUS_IDLE);
    TASKORCH_LOG_INFO("Worker resumed", {StringField("worker_id", WorkerId())});
  }
  return true;
}

StepResult WorkerLoop::RunOnce() {
  if (token_.StopRequested()) {
    return StepResult::kStopped;
  }

  try {
    deps_.monitor->RecordHeartbeat(WorkerId(), "", 0, 0);
  } catch (const util::StaleWorker& e) {
    TASKORCH_LOG_WARN("Worker was recovered, rejoining", {StringField("error", e.what())});
    Join();
  }

  if (!SyncPause()) {
    return StepResult::kPaused;
  }

  // assigned directly, or left RUNNING by a step whose release failed
  auto owned = deps_.tasks->RunningFor(WorkerId());
  if (!owned.empty()) {
    return Execute(owned.front());
  }

  auto task = deps_.pool->RequestClaim(WorkerId());
  if (!task) {
    return StepResult::kIdle;
  }
  return Execute(*task);
}

std::string WorkerLoop::Prompt(const TaskRecord& task) const {
  std::string prompt = "Task " + task.id + " (" + task.type + "): " + task.name + "\n\n" + task.payload;
  if (!task.feedback.empty()) {
    prompt += "\n\nThe previous attempt was rejected by review. Address this feedback:\n" + task.feedback;
  }
  return prompt;
}

StepResult WorkerLoop::Execute(const TaskRecord& task) {
  observability::LogContext context{StringField("task_id", task.id)};
  try {
    return Attempt(task);
  } catch (const std::exception& e) {
    // the claim is still ours; hand the task back instead of waiting for stale recovery
    TASKORCH_LOG_ERROR("Task step failed, releasing", {StringField("error", e.what())});
    Release(task.id, e.what());
    return StepResult::kReleased;
  }
}

StepResult WorkerLoop::Attempt(const TaskRecord& task) {
  observability::SpanScope span("WorkerLoop.Execute");
  span.SetAttribute("task.id", task.id);

  const auto capability      = task.assigned_model.empty() ? deps_.pool->Route(task.type).capability : task.assigned_model;
  const auto timeout         = options_.executor.timeout;
  const auto timeout_seconds = static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::seconds>(timeout).count());
  span.SetAttribute("capability", capability);

  runtime::PeriodicWorker beats("heartbeat-" + WorkerId(), options_.heartbeat.interval,
                                [this, task_id = task.id, timeout_seconds] {
                                  deps_.monitor->RecordHeartbeat(WorkerId(), task_id, 0, timeout_seconds);
                                });
  beats.Start();

  try {
    auto reply = deps_.breaker->Call(capability, [&] { return deps_.executor->Execute(capability, Prompt(task), timeout); });
    beats.Stop();

    if (reply.cost_usd > 0.0) {
      deps_.budget->RecordSpend(reply.cost_usd, capability, task.id);
    }
    deps_.lifecycle->SubmitForReview(task.id, WorkerId(), reply.text);
    TASKORCH_LOG_INFO("Task submitted for review", {StringField("capability", capability)});
    return StepResult::kSubmitted;
  } catch (const util::CircuitOpen& e) {
    beats.Stop();
    deps_.tasks->ReleaseTask(task.id, e.what());
    TASKORCH_LOG_WARN("Capability unavailable, task released", {StringField("capability", capability)});
    return StepResult::kReleased;
  } catch (const util::ExecutorError& e) {
    beats.Stop();
    span.RecordException(e.what());
    deps_.lifecycle->ReportExecutorFailure(task.id, WorkerId(), e.what());
    TASKORCH_LOG_WARN("Task execution failed", {StringField("error", e.what())});
    return StepResult::kFailed;
  } catch (const util::StaleWorker& e) {
    // recovery requeued the task while it ran
    TASKORCH_LOG_WARN("Result discarded", {StringField("error", e.what())});
    return StepResult::kIdle;
  } catch (const std::exception& e) {
    span.RecordException(e.what());
    throw;
  }
}

void WorkerLoop::Release(const std::string& task_id, const std::string& reason) {
  for (uint32_t attempt = 1;; ++attempt) {
    try {
      const auto task = deps_.tasks->GetTask(task_id);
      if (task.state != TASK_STATE_RUNNING || task.worker_id != WorkerId()) {
        // submitted, recovered or reassigned before the failure surfaced
        return;
      }
      deps_.tasks->ReleaseTask(task_id, reason);
      return;
    } catch (const util::InvalidState& e) {
      TASKORCH_LOG_WARN("Release skipped", {StringField("error", e.what())});
      return;
    } catch (const util::StoreUnavailable& e) {
      if (attempt >= kReleaseAttempts) {
        // RunOnce picks the task up again once the store answers
        throw;
      }
      TASKORCH_LOG_WARN("Release failed, retrying", {StringField("error", e.what()), observability::IntField("attempt", attempt)});
      Wait(options_.pool.poll_interval);
    }
  }
}

void WorkerLoop::Wait(std::chrono::milliseconds duration) {
  while (duration.count() > 0 && !token_.StopRequested()) {
    const auto slice = std::min(duration, kWaitSlice);
    sleep_(slice);
    duration -= slice;
  }
}

void WorkerLoop::Run() {
  observability::LogContext context{StringField("worker_id", WorkerId())};
  Join();

  auto backoff = options_.pool.poll_interval;
  while (!token_.StopRequested()) {
    try {
      const auto step = RunOnce();
      backoff         = options_.pool.poll_interval;
      if (step == StepResult::kStopped) {
        break;
      }
      if (step == StepResult::kIdle || step == StepResult::kPaused) {
        Wait(options_.pool.poll_interval);
      }
    } catch (const std::exception& e) {
      TASKORCH_LOG_ERROR("Worker step failed", {StringField("error", e.what()), observability::IntField("backoff_ms", backoff.count())});
      Wait(backoff);
      backoff = std::min(backoff * 2, options_.pool.max_backoff);
    }
  }

  Shutdown();
}

void WorkerLoop::Shutdown() {
  for (const auto& task : deps_.tasks->RunningFor(WorkerId())) {
    try {
      deps_.tasks->ReleaseTask(task.id, "worker shutdown");
    } catch (const util::InvalidState& e) {
      TASKORCH_LOG_WARN("Release on shutdown skipped", {StringField("task_id", task.id), StringField("error", e.what())});
    }
  }

  const auto worker = deps_.pool->GetWorker(WorkerId());
  if (model::IsGone(worker.status)) {
    return;
  }
  if (worker.status != WORKER_STATUS_STOPPING) {
    deps_.pool->Transition(WorkerId(), WORKER_STATUS_STOPPING);
  }
  deps_.pool->Transition(WorkerId(), WORKER_STATUS_DEAD);
  TASKORCH_LOG_INFO("Worker stopped", {StringField("worker_id", WorkerId())});
}

} // namespace taskorch::worker
