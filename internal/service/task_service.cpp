#include "task_service.hpp"

#include "internal/consensus/consensus_engine.hpp"
#include "internal/core/task_store.hpp"
#include "internal/lifecycle/lifecycle_state_machine.hpp"
#include "internal/util/errors.hpp"
#include "observe_rpc.hpp"
#include "record_mapping.hpp"

namespace taskorch::service {

using namespace taskorch::v1;

TaskService::TaskService(ServiceContext ctx) : ctx_(ctx), router_(std::move(ctx)) {
}

EnqueueTaskResponse TaskService::EnqueueTask(const EnqueueTaskRequest& req) {
  return ObserveRpc("TaskService.EnqueueTask", req.id(), [&] {
    if (req.type().empty()) {
      throw util::InvalidArgument("enqueue task: type is required");
    }
    const auto priority = req.has_priority() ? req.priority() : PRIORITY_MEDIUM;

    EnqueueTaskResponse resp;
    if (req.ensure()) {
      if (req.id().empty()) {
        throw util::InvalidArgument("enqueue task: ensure requires an id");
      }
      resp.set_created(ctx_.tasks->EnsureTaskExists(req.id(), req.name(), req.type(), priority, req.payload()));
      *resp.mutable_task() = ToProto(ctx_.tasks->GetTask(req.id()));
      return resp;
    }

    core::TaskSpec spec;
    spec.id       = req.id();
    spec.name     = req.name();
    spec.type     = req.type();
    spec.priority = priority;
    spec.payload  = req.payload();
    spec.shard    = req.shard();
    spec.trace_id = req.trace_id();

    resp.set_created(true);
    *resp.mutable_task() = ToProto(ctx_.tasks->Enqueue(spec));
    return resp;
  });
}

GetTaskResponse TaskService::GetTask(const GetTaskRequest& req) {
  return ObserveRpc("TaskService.GetTask", req.id(), [&] {
    GetTaskResponse resp;
    *resp.mutable_task() = ToProto(ctx_.tasks->GetTask(req.id()));
    for (const auto& event : ctx_.tasks->TaskHistory(req.id())) {
      *resp.add_events() = ToProto(event);
    }
    for (const auto& session : ctx_.consensus->SessionsForTask(req.id())) {
      *resp.add_sessions() = ToProto(session);
    }
    return resp;
  });
}

ListTasksResponse TaskService::ListTasks(const ListTasksRequest& req) {
  return ObserveRpc("TaskService.ListTasks", "", [&] {
    std::optional<TaskState> state;
    if (req.state() != TASK_STATE_UNSPECIFIED) {
      state = req.state();
    }

    ListTasksResponse resp;
    for (const auto& task : ctx_.tasks->ListTasks(state, req.limit())) {
      *resp.add_tasks() = ToProto(task);
    }
    return resp;
  });
}

CancelTaskResponse TaskService::CancelTask(const CancelTaskRequest& req) {
  return ObserveRpc("TaskService.CancelTask", req.id(), [&] {
    CancelTaskResponse resp;
    *resp.mutable_task() = ToProto(ctx_.lifecycle->Cancel(req.id(), req.reason().empty() ? "cancelled by operator" : req.reason()));
    return resp;
  });
}

AgentMessage TaskService::Dispatch(const AgentMessage& message) {
  return ObserveRpc("TaskService.Dispatch", message.task_id(), [&] { return router_.Dispatch(message); });
}

} // namespace taskorch::service
