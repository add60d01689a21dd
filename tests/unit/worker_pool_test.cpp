#include <cassert>
#include <csignal>
#include <iostream>
#include <map>
#include <string>

#include "test_support.hpp"

namespace {

using namespace taskorch::v1;
using taskorch::pool::WorkerRegistration;
using taskorch::testing::Harness;
using taskorch::testing::HasEvent;
using taskorch::testing::Throws;

void ActivateKillSwitch(Harness& h) {
  auto tx = h.repository->Begin();
  taskorch::db::model::KillSwitchRecord record;
  record.active          = true;
  record.reason          = "test";
  record.triggered_at_ms = 1;
  auto put = h.repository->PutKillSwitch(*tx, record);
  assert(put);
  tx->Commit();
}

void TestRegisterIsIdempotent() {
  Harness h;
  auto first = h.pool->Register(WorkerRegistration{"w-1", 100, "review", "shard-1", "codex"});
  assert(first.status == WORKER_STATUS_STARTING);
  assert(first.started_at_ms > 0);

  h.pool->Transition("w-1", WORKER_STATUS_IDLE);
  auto again = h.pool->Register(WorkerRegistration{"w-1", 150, "review", "shard-1", "codex"});
  assert(again.status == WORKER_STATUS_IDLE);
  assert(again.pid == 150);
  assert(h.pool->ListWorkers().size() == 1);

  assert(Throws<taskorch::util::InvalidArgument>([&] { h.pool->Register(WorkerRegistration{}); }));
}

void TestGoneWorkerRejoinsAsStarting() {
  Harness h;
  h.AddWorker("w-1", 100);
  h.pool->Transition("w-1", WORKER_STATUS_STOPPING);
  h.pool->Transition("w-1", WORKER_STATUS_DEAD);

  auto rejoined = h.pool->Register(WorkerRegistration{"w-1", 101, "", "", ""});
  assert(rejoined.status == WORKER_STATUS_STARTING);
  assert(h.pool->Transition("w-1", WORKER_STATUS_IDLE).status == WORKER_STATUS_IDLE);
}

void TestTransitionsFollowStatusGraph() {
  Harness h;
  h.AddWorker("w-1", 100);

  assert(Throws<taskorch::util::InvalidTransition>([&] { h.pool->Transition("w-1", WORKER_STATUS_STARTING); }));
  // busy is reserved for workers that own a running task
  assert(Throws<taskorch::util::InvalidTransition>([&] { h.pool->Transition("w-1", WORKER_STATUS_BUSY); }));
  assert(h.pool->Transition("w-1", WORKER_STATUS_PAUSED).status == WORKER_STATUS_PAUSED);
  assert(h.pool->Transition("w-1", WORKER_STATUS_IDLE).status == WORKER_STATUS_IDLE);
  assert(Throws<taskorch::util::NotFound>([&] { h.pool->Transition("ghost", WORKER_STATUS_IDLE); }));
}

void TestRequestClaimHonoursConcurrencyCap() {
  Harness h;
  h.AddWorker("w-1", 100);
  for (int i = 0; i < 3; ++i) {
    h.AddTask("T-" + std::to_string(i), "FIX");
  }

  assert(h.pool->RequestClaim("w-1").has_value());
  assert(h.pool->RequestClaim("w-1").has_value());
  // cap is 2
  assert(!h.pool->RequestClaim("w-1").has_value());
  assert(h.tasks->CountRunning("w-1") == 2);
  assert(h.tasks->CountByState()["QUEUED"] == 1);
}

void TestRequestClaimBlockedByPauseAndKillSwitch() {
  Harness h;
  h.AddWorker("w-1", 100);
  h.AddTask("T-1", "FIX");

  h.pool->RequestPause("maintenance");
  assert(h.pool->PauseState().paused);
  assert(h.pool->PauseState().reason == "maintenance");
  assert(!h.pool->RequestClaim("w-1").has_value());

  h.pool->Resume();
  assert(!h.pool->PauseState().paused);

  ActivateKillSwitch(h);
  assert(!h.pool->RequestClaim("w-1").has_value());
  assert(h.tasks->GetTask("T-1").state == TASK_STATE_QUEUED);
}

void TestRequestClaimNeedsClaimableWorker() {
  Harness h;
  h.AddTask("T-1", "FIX");
  assert(Throws<taskorch::util::NotFound>([&] { h.pool->RequestClaim("ghost"); }));

  h.process_control->SetAlive(100, true);
  h.pool->Register(WorkerRegistration{"w-1", 100, "", "", ""});
  assert(!h.pool->RequestClaim("w-1").has_value());

  h.pool->Transition("w-1", WORKER_STATUS_IDLE);
  h.pool->Transition("w-1", WORKER_STATUS_PAUSED);
  assert(!h.pool->RequestClaim("w-1").has_value());
}

void TestSpecializationShardAndModelFilterClaims() {
  Harness h;
  h.AddWorker("reviewer", 100, "review");
  h.AddWorker("fixer", 101, "fix");
  h.AddWorker("sharded", 102, "", "shard-2");
  h.AddWorker("gemini", 103, "", "", "gemini");

  h.AddTask("impl", "IMPLEMENTATION", PRIORITY_CRITICAL, "shard-0");
  h.AddTask("audit", "AUDIT", PRIORITY_LOW, "shard-0");
  h.AddTask("fix", "FIX", PRIORITY_LOW, "shard-0");
  h.AddTask("research", "RESEARCH", PRIORITY_LOW, "shard-1");
  h.AddTask("later", "BUILD", PRIORITY_LOW, "shard-2");

  auto claimed = h.pool->RequestClaim("reviewer");
  assert(claimed && claimed->id == "audit");

  claimed = h.pool->RequestClaim("fixer");
  assert(claimed && claimed->id == "fix");

  claimed = h.pool->RequestClaim("sharded");
  assert(claimed && claimed->id == "later");

  claimed = h.pool->RequestClaim("gemini");
  assert(claimed && claimed->id == "research");

  auto filter = h.pool->FilterFor(h.pool->GetWorker("reviewer"));
  assert(!filter.shard.has_value());
  assert(filter.types.size() == 5);
}

void TestSignalsSkipGoneWorkers() {
  Harness h;
  h.AddWorker("w-1", 100);
  h.AddWorker("w-2", 101);
  h.AddWorker("w-3", 102);
  h.pool->Transition("w-3", WORKER_STATUS_STOPPING);
  h.pool->Transition("w-3", WORKER_STATUS_DEAD);
  h.process_control->SetAlive(101, false);

  assert(h.pool->SignalWorkers(SIGUSR1) == 1);
  assert(h.process_control->CountSignals(SIGUSR1) == 1);

  assert(h.pool->Terminate("w-1"));
  assert(!h.process_control->IsAlive(100));
  assert(!h.pool->Terminate("w-3"));
  assert(Throws<taskorch::util::NotFound>([&] { h.pool->Terminate("ghost"); }));
}

void TestRebalanceMovesLowPriorityExcess() {
  Harness h;
  h.AddTask("keep-a", "FIX", PRIORITY_CRITICAL, "shard-0");
  h.AddTask("keep-b", "FIX", PRIORITY_HIGH, "shard-0");
  for (int i = 0; i < 7; ++i) {
    h.clock.Advance(std::chrono::milliseconds(1));
    h.AddTask("bulk-" + std::to_string(i), "FIX", PRIORITY_LOW, "shard-0");
  }

  assert(h.pool->RebalanceShards() == 5);

  auto depth = h.tasks->QueueDepthByShard();
  assert(depth["shard-0"] == 4);
  assert(depth["shard-1"] == 3);
  assert(depth["shard-2"] == 2);
  assert(h.tasks->GetTask("keep-a").shard == "shard-0");
  assert(h.tasks->GetTask("keep-b").shard == "shard-0");
  // oldest bulk tasks stay put
  assert(h.tasks->GetTask("bulk-0").shard == "shard-0");
  assert(h.tasks->GetTask("bulk-6").shard != "shard-0");
  assert(HasEvent(h.tasks->TaskHistory("bulk-6"), "TASK_RESHARDED"));
}

void TestRebalanceBelowThresholdIsNoop() {
  Harness h;
  for (int i = 0; i < 5; ++i) {
    h.AddTask("T-" + std::to_string(i), "FIX", PRIORITY_LOW, "shard-0");
  }
  assert(h.pool->RebalanceShards() == 0);
  assert(h.tasks->QueueDepthByShard()["shard-0"] == 5);
}

} // namespace

int main() {
  TestRegisterIsIdempotent();
  TestGoneWorkerRejoinsAsStarting();
  TestTransitionsFollowStatusGraph();
  TestRequestClaimHonoursConcurrencyCap();
  TestRequestClaimBlockedByPauseAndKillSwitch();
  TestRequestClaimNeedsClaimableWorker();
  TestSpecializationShardAndModelFilterClaims();
  TestSignalsSkipGoneWorkers();
  TestRebalanceMovesLowPriorityExcess();
  TestRebalanceBelowThresholdIsNoop();

  std::cout << "taskorch_unit_worker_pool: pass\n";
  return 0;
}
