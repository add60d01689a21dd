#include "admin_service.hpp"

#include "internal/breaker/circuit_breaker.hpp"
#include "internal/budget/budget_governor.hpp"
#include "internal/core/task_store.hpp"
#include "internal/model/worker_status.hpp"
#include "internal/pool/worker_pool_manager.hpp"
#include "internal/util/errors.hpp"
#include "observe_rpc.hpp"
#include "record_mapping.hpp"

namespace taskorch::service {

using namespace taskorch::v1;

AdminService::AdminService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

StatsResponse AdminService::Stats(const StatsRequest&) {
  return ObserveRpc("AdminService.Stats", "", [&] {
    StatsResponse resp;
    for (const auto& [state, count] : ctx_.tasks->CountByState()) {
      (*resp.mutable_tasks_by_state())[state] = count;
    }
    for (const auto& worker : ctx_.pool->ListWorkers()) {
      (*resp.mutable_workers_by_status())[std::string(model::ToString(worker.status))]++;
    }
    for (const auto& [shard, depth] : ctx_.tasks->QueueDepthByShard()) {
      (*resp.mutable_queued_by_shard())[shard] = depth;
    }
    resp.set_paused(ctx_.pool->PauseState().paused);
    resp.set_kill_switch(ctx_.budget->KillSwitchActive());
    return resp;
  });
}

ListWorkersResponse AdminService::ListWorkers(const ListWorkersRequest&) {
  return ObserveRpc("AdminService.ListWorkers", "", [&] {
    ListWorkersResponse resp;
    for (const auto& worker : ctx_.pool->ListWorkers()) {
      *resp.add_workers() = ToProto(worker, ctx_.tasks->CountRunning(worker.worker_id));
    }
    return resp;
  });
}

PauseResponse AdminService::Pause(const PauseRequest& req) {
  return ObserveRpc("AdminService.Pause", "", [&] {
    return ToProto(ctx_.pool->RequestPause(req.reason().empty() ? "operator pause" : req.reason()));
  });
}

PauseResponse AdminService::Resume(const ResumeRequest&) {
  return ObserveRpc("AdminService.Resume", "", [&] {
    if (ctx_.budget->KillSwitchActive()) {
      throw util::BudgetExceeded("kill switch is active; reset it before resuming");
    }
    return ToProto(ctx_.pool->Resume());
  });
}

GetBreakersResponse AdminService::GetBreakers(const GetBreakersRequest&) {
  return ObserveRpc("AdminService.GetBreakers", "", [&] {
    GetBreakersResponse resp;
    for (const auto& breaker : ctx_.breaker->Status()) {
      *resp.add_breakers() = ToProto(breaker);
    }
    return resp;
  });
}

ResetBreakerResponse AdminService::ResetBreaker(const ResetBreakerRequest& req) {
  return ObserveRpc("AdminService.ResetBreaker", "", [&] {
    if (req.capability().empty()) {
      throw util::InvalidArgument("reset breaker: capability is required");
    }
    ResetBreakerResponse resp;
    *resp.mutable_breaker() = ToProto(ctx_.breaker->Reset(req.capability()));
    return resp;
  });
}

BudgetStatus AdminService::GetBudgetStatus(const GetBudgetStatusRequest&) {
  return ObserveRpc("AdminService.GetBudgetStatus", "", [&] { return ToProto(ctx_.budget->Status()); });
}

BudgetStatus AdminService::ResetKillSwitch(const ResetKillSwitchRequest& req) {
  return ObserveRpc("AdminService.ResetKillSwitch", "", [&] { return ToProto(ctx_.budget->ResetKillSwitch(req.operator_id())); });
}

RecordSpendResponse AdminService::RecordSpend(const RecordSpendRequest& req) {
  return ObserveRpc("AdminService.RecordSpend", req.task_id(), [&] {
    ctx_.budget->RecordSpend(req.amount(), req.capability(), req.task_id());
    return RecordSpendResponse{};
  });
}

} // namespace taskorch::service
