#include <cassert>
#include <iostream>
#include <string>

#include "internal/service/message_router.hpp"
#include "test_support.hpp"

namespace {

using namespace taskorch::v1;
using taskorch::service::MessageRouter;
using taskorch::testing::Harness;
using taskorch::testing::Throws;

AgentMessage Message(MessageType type, const std::string& task_id = "", const std::string& payload = "") {
  AgentMessage message;
  message.set_id("msg-1");
  message.set_type(type);
  message.set_source("supervisor");
  message.set_task_id(task_id);
  message.set_payload(payload);
  message.set_trace_id("trace-abc");
  return message;
}

void TestAssignAndAck() {
  Harness h;
  h.AddWorker("w-1", 100);
  h.AddTask("T-1", "FIX");
  MessageRouter router(h.Context());

  auto message = Message(MESSAGE_TYPE_TASK_ASSIGN, "T-1");
  message.set_target("w-1");
  auto ack = router.Dispatch(message);

  assert(ack.type() == MESSAGE_TYPE_ACK);
  assert(ack.source() == "taskorch");
  assert(ack.target() == "supervisor");
  assert(ack.task_id() == "T-1");
  assert(ack.payload() == "msg-1");
  assert(ack.trace_id() == "trace-abc");
  assert(!ack.id().empty());
  assert(ack.has_timestamp());

  auto task = h.tasks->GetTask("T-1");
  assert(task.state == TASK_STATE_RUNNING);
  assert(task.worker_id == "w-1");

  // already running
  assert(Throws<taskorch::util::ClaimConflict>([&] { router.Dispatch(message); }));
}

void TestAssignHonoursConcurrencyCap() {
  Harness h;
  assert(h.options.pool.max_concurrent_tasks_per_worker == 2);
  h.AddWorker("w-1", 100);
  MessageRouter router(h.Context());

  for (const auto& id : {"T-1", "T-2", "T-3", "T-4"}) {
    h.AddTask(id, "FIX");
  }
  for (const auto& id : {"T-1", "T-2"}) {
    auto message = Message(MESSAGE_TYPE_TASK_ASSIGN, id);
    message.set_target("w-1");
    router.Dispatch(message);
  }
  for (const auto& id : {"T-3", "T-4"}) {
    auto message = Message(MESSAGE_TYPE_TASK_ASSIGN, id);
    message.set_target("w-1");
    assert(Throws<taskorch::util::ClaimConflict>([&] { router.Dispatch(message); }));
    assert(h.tasks->GetTask(id).state == TASK_STATE_QUEUED);
  }
  assert(h.tasks->CountRunning("w-1") == 2);

  // a freed slot takes the next assignment
  h.tasks->ReleaseTask("T-1", "operator");
  auto message = Message(MESSAGE_TYPE_TASK_ASSIGN, "T-3");
  message.set_target("w-1");
  router.Dispatch(message);
  assert(h.tasks->GetTask("T-3").worker_id == "w-1");
  assert(h.tasks->CountRunning("w-1") == 2);
}

void TestAssignRequiresTaskAndTarget() {
  Harness       h;
  MessageRouter router(h.Context());

  auto no_task = Message(MESSAGE_TYPE_TASK_ASSIGN);
  no_task.set_target("w-1");
  assert(Throws<taskorch::util::InvalidArgument>([&] { router.Dispatch(no_task); }));
  assert(Throws<taskorch::util::InvalidArgument>([&] { router.Dispatch(Message(MESSAGE_TYPE_TASK_ASSIGN, "T-1")); }));
  assert(Throws<taskorch::util::InvalidArgument>([&] { router.Dispatch(Message(MESSAGE_TYPE_TASK_APPROVE)); }));
}

void TestApproveAndReject() {
  Harness h;
  h.AddWorker("w-1", 100);
  for (const auto& id : {"T-1", "T-2"}) {
    h.AddTask(id, "FIX");
    h.tasks->AssignTask(id, "w-1");
    h.lifecycle->SubmitForReview(id, "w-1", "result");
  }
  MessageRouter router(h.Context());

  router.Dispatch(Message(MESSAGE_TYPE_TASK_APPROVE, "T-1"));
  assert(h.tasks->GetTask("T-1").state == TASK_STATE_COMPLETED);

  router.Dispatch(Message(MESSAGE_TYPE_TASK_REJECT, "T-2", "handle the empty input"));
  auto rejected = h.tasks->GetTask("T-2");
  assert(rejected.state == TASK_STATE_QUEUED);
  assert(rejected.feedback == "handle the empty input");

  // not in review any more
  assert(Throws<taskorch::util::InvalidTransition>([&] { router.Dispatch(Message(MESSAGE_TYPE_TASK_APPROVE, "T-2")); }));
}

void TestHeartbeatPayload() {
  Harness h;
  h.AddWorker("w-1", 100);
  h.AddTask("T-1", "FIX");
  h.tasks->AssignTask("T-1", "w-1");
  MessageRouter router(h.Context());

  auto message = Message(MESSAGE_TYPE_HEARTBEAT, "T-1", R"({"progress_percent": 40, "expected_timeout_seconds": 600})");
  message.set_source("w-1");
  router.Dispatch(message);

  auto tx   = h.repository->Begin();
  auto beat = h.repository->GetHeartbeat(*tx, "w-1");
  tx->Commit();
  assert(beat.has_value());
  assert(beat->progress_percent == 40);
  assert(beat->expected_timeout_seconds == 600);
  assert(beat->task_id == "T-1");

  // empty payload is a bare liveness ping
  auto ping = Message(MESSAGE_TYPE_HEARTBEAT);
  ping.set_source("w-1");
  router.Dispatch(ping);

  auto bad = Message(MESSAGE_TYPE_HEARTBEAT, "", "{not json");
  bad.set_source("w-1");
  assert(Throws<taskorch::util::InvalidArgument>([&] { router.Dispatch(bad); }));

  auto unknown_field = Message(MESSAGE_TYPE_HEARTBEAT, "", R"({"mood": "great"})");
  unknown_field.set_source("w-1");
  assert(Throws<taskorch::util::InvalidArgument>([&] { router.Dispatch(unknown_field); }));

  auto anonymous = Message(MESSAGE_TYPE_HEARTBEAT);
  anonymous.set_source("");
  assert(Throws<taskorch::util::InvalidArgument>([&] { router.Dispatch(anonymous); }));
}

void TestPauseAndResume() {
  Harness       h;
  MessageRouter router(h.Context());

  router.Dispatch(Message(MESSAGE_TYPE_CONTROL_PAUSE, "", "deploy in progress"));
  auto pause = h.pool->PauseState();
  assert(pause.paused);
  assert(pause.reason == "deploy in progress");

  router.Dispatch(Message(MESSAGE_TYPE_CONTROL_RESUME));
  assert(!h.pool->PauseState().paused);

  router.Dispatch(Message(MESSAGE_TYPE_CONTROL_PAUSE));
  assert(h.pool->PauseState().reason == "paused by supervisor");
}

void TestUnsupportedTypes() {
  Harness       h;
  MessageRouter router(h.Context());
  assert(Throws<taskorch::util::InvalidArgument>([&] { router.Dispatch(Message(MESSAGE_TYPE_ACK)); }));
  assert(Throws<taskorch::util::InvalidArgument>([&] { router.Dispatch(Message(MESSAGE_TYPE_UNSPECIFIED)); }));
}

} // namespace

int main() {
  TestAssignAndAck();
  TestAssignHonoursConcurrencyCap();
  TestAssignRequiresTaskAndTarget();
  TestApproveAndReject();
  TestHeartbeatPayload();
  TestPauseAndResume();
  TestUnsupportedTypes();

  std::cout << "taskorch_unit_message_router: pass\n";
  return 0;
}
