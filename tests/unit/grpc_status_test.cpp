#include <cassert>
#include <iostream>
#include <memory>

#include <grpcpp/grpcpp.h>

#include "internal/db/api/transaction.hpp"
#include "internal/grpc/admin_server.hpp"
#include "internal/grpc/grpc_error.hpp"
#include "internal/grpc/task_server.hpp"
#include "internal/service/admin_service.hpp"
#include "internal/service/task_service.hpp"
#include "test_support.hpp"

namespace {

using namespace taskorch::v1;
using taskorch::testing::Harness;

void TestErrorMapping() {
  using namespace taskorch::util;
  using ::grpc::StatusCode;
  assert(taskorch::grpc::ToStatus(NotFound("x")).error_code() == StatusCode::NOT_FOUND);
  assert(taskorch::grpc::ToStatus(AlreadyExists("x")).error_code() == StatusCode::ALREADY_EXISTS);
  assert(taskorch::grpc::ToStatus(InvalidArgument("x")).error_code() == StatusCode::INVALID_ARGUMENT);
  assert(taskorch::grpc::ToStatus(InvalidTransition("x")).error_code() == StatusCode::FAILED_PRECONDITION);
  assert(taskorch::grpc::ToStatus(StaleWorker("x")).error_code() == StatusCode::FAILED_PRECONDITION);
  assert(taskorch::grpc::ToStatus(ClaimConflict("x")).error_code() == StatusCode::ABORTED);
  assert(taskorch::grpc::ToStatus(taskorch::db::TransactionConflict("x")).error_code() == StatusCode::ABORTED);
  assert(taskorch::grpc::ToStatus(BudgetExceeded("x")).error_code() == StatusCode::RESOURCE_EXHAUSTED);
  assert(taskorch::grpc::ToStatus(CircuitOpen("x")).error_code() == StatusCode::UNAVAILABLE);
  assert(taskorch::grpc::ToStatus(StoreUnavailable("x")).error_code() == StatusCode::UNAVAILABLE);
  assert(taskorch::grpc::ToStatus(ExecutorTimeout("x")).error_code() == StatusCode::DEADLINE_EXCEEDED);
  assert(taskorch::grpc::ToStatus(std::runtime_error("x")).error_code() == StatusCode::INTERNAL);
  assert(taskorch::grpc::ToStatus(NotFound("task T-9")).error_message() == "task T-9");
}

void TestGetMissingTaskReturnsNotFound() {
  Harness                 h;
  taskorch::grpc::TaskServer server(std::make_shared<taskorch::service::TaskService>(h.Context()));

  GetTaskRequest        req;
  GetTaskResponse       resp;
  ::grpc::ServerContext grpc_ctx;
  req.set_id("missing");

  const auto status = server.GetTask(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::NOT_FOUND);
}

void TestEnqueueStatuses() {
  Harness                 h;
  taskorch::grpc::TaskServer server(std::make_shared<taskorch::service::TaskService>(h.Context()));
  ::grpc::ServerContext   grpc_ctx;

  EnqueueTaskRequest  req;
  EnqueueTaskResponse resp;
  req.set_id("T-1");
  req.set_name("fix the parser");
  assert(server.EnqueueTask(&grpc_ctx, &req, &resp).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);

  req.set_type("FIX");
  req.set_priority(PRIORITY_HIGH);
  assert(server.EnqueueTask(&grpc_ctx, &req, &resp).ok());
  assert(resp.created());
  assert(resp.task().state() == TASK_STATE_QUEUED);
  assert(resp.task().priority() == PRIORITY_HIGH);
  assert(resp.task().assigned_model() == "claude");

  assert(server.EnqueueTask(&grpc_ctx, &req, &resp).error_code() == ::grpc::StatusCode::ALREADY_EXISTS);

  req.set_ensure(true);
  assert(server.EnqueueTask(&grpc_ctx, &req, &resp).ok());
  assert(!resp.created());
}

void TestCancelRunningReturnsFailedPrecondition() {
  Harness h;
  h.AddWorker("w-1", 100);
  h.AddTask("T-1", "FIX");
  h.tasks->AssignTask("T-1", "w-1");
  taskorch::grpc::TaskServer server(std::make_shared<taskorch::service::TaskService>(h.Context()));

  CancelTaskRequest     req;
  CancelTaskResponse    resp;
  ::grpc::ServerContext grpc_ctx;
  req.set_id("T-1");

  const auto status = server.CancelTask(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
}

void TestDispatchAssignConflictReturnsAborted() {
  Harness h;
  h.AddWorker("w-1", 100);
  h.AddWorker("w-2", 101);
  h.AddTask("T-1", "FIX");
  h.tasks->AssignTask("T-1", "w-1");
  taskorch::grpc::TaskServer server(std::make_shared<taskorch::service::TaskService>(h.Context()));

  AgentMessage req;
  req.set_type(MESSAGE_TYPE_TASK_ASSIGN);
  req.set_task_id("T-1");
  req.set_target("w-2");
  AgentMessage          resp;
  ::grpc::ServerContext grpc_ctx;

  const auto status = server.Dispatch(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::ABORTED);
}

void TestResumeUnderKillSwitchReturnsResourceExhausted() {
  Harness h;
  h.budget->RecordSpend(10.0, "claude", "");
  assert(h.budget->Check().activated);
  taskorch::grpc::AdminServer server(std::make_shared<taskorch::service::AdminService>(h.Context()));
  ::grpc::ServerContext       grpc_ctx;

  ResumeRequest req;
  PauseResponse resp;
  assert(server.Resume(&grpc_ctx, &req, &resp).error_code() == ::grpc::StatusCode::RESOURCE_EXHAUSTED);
  assert(h.pool->PauseState().paused);

  StatsRequest  stats_req;
  StatsResponse stats;
  assert(server.Stats(&grpc_ctx, &stats_req, &stats).ok());
  assert(stats.kill_switch());
  assert(stats.paused());

  ResetKillSwitchRequest reset_req;
  BudgetStatus           budget;
  assert(server.ResetKillSwitch(&grpc_ctx, &reset_req, &budget).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  reset_req.set_operator_id("oncall");
  assert(server.ResetKillSwitch(&grpc_ctx, &reset_req, &budget).ok());
  assert(server.Resume(&grpc_ctx, &req, &resp).ok());
  assert(!resp.paused());
}

void TestResetBreakerRequiresCapability() {
  Harness                     h;
  taskorch::grpc::AdminServer server(std::make_shared<taskorch::service::AdminService>(h.Context()));
  ::grpc::ServerContext       grpc_ctx;

  ResetBreakerRequest  req;
  ResetBreakerResponse resp;
  assert(server.ResetBreaker(&grpc_ctx, &req, &resp).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);

  req.set_capability("codex");
  assert(server.ResetBreaker(&grpc_ctx, &req, &resp).ok());
  assert(resp.breaker().capability() == "codex");
}

} // namespace

int main() {
  TestErrorMapping();
  TestGetMissingTaskReturnsNotFound();
  TestEnqueueStatuses();
  TestCancelRunningReturnsFailedPrecondition();
  TestDispatchAssignConflictReturnsAborted();
  TestResumeUnderKillSwitchReturnsResourceExhausted();
  TestResetBreakerRequiresCapability();

  std::cout << "taskorch_unit_grpc_status: pass\n";
  return 0;
}
