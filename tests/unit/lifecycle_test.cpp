#include <cassert>
#include <iostream>
#include <string>

#include "test_support.hpp"

namespace {

using namespace taskorch::v1;
using taskorch::testing::Harness;
using taskorch::testing::HasEvent;
using taskorch::testing::Throws;

// Enqueued, claimed by w-1 and submitted.
void InReview(Harness& h, const std::string& id) {
  h.AddTask(id, "FIX");
  h.tasks->AssignTask(id, "w-1");
  h.lifecycle->SubmitForReview(id, "w-1", "patch for " + id);
}

void TestSubmitForReview() {
  Harness h;
  h.AddWorker("w-1", 100);
  h.AddTask("T-1", "FIX");
  h.tasks->AssignTask("T-1", "w-1");

  auto task = h.lifecycle->SubmitForReview("T-1", "w-1", "the patch");
  assert(task.state == TASK_STATE_REVIEW);
  assert(task.result == "the patch");
  assert(task.worker_id.empty());

  auto worker = h.pool->GetWorker("w-1");
  assert(worker.status == WORKER_STATUS_IDLE);
  assert(worker.tasks_completed == 1);
  assert(HasEvent(h.tasks->TaskHistory("T-1"), "STATE_REVIEW"));
}

void TestSubmitFromNonOwnerIsStale() {
  Harness h;
  h.AddWorker("w-1", 100);
  h.AddWorker("w-2", 101);
  h.AddTask("T-1", "FIX");
  h.tasks->AssignTask("T-1", "w-1");

  assert(Throws<taskorch::util::StaleWorker>([&] { h.lifecycle->SubmitForReview("T-1", "w-2", "x"); }));

  h.tasks->ReleaseTask("T-1", "test");
  assert(Throws<taskorch::util::StaleWorker>([&] { h.lifecycle->SubmitForReview("T-1", "w-1", "x"); }));
  assert(Throws<taskorch::util::NotFound>([&] { h.lifecycle->SubmitForReview("nope", "w-1", "x"); }));
}

void TestPassCompletesTask() {
  Harness h;
  h.AddWorker("w-1", 100);
  InReview(h, "T-1");

  auto task = h.lifecycle->ApplyConsensus("T-1", CONSENSUS_RESULT_PASS, "");
  assert(task.state == TASK_STATE_COMPLETED);
  assert(task.completed_at_ms > 0);

  auto events = h.tasks->TaskHistory("T-1");
  assert(HasEvent(events, "STATE_APPROVED"));
  assert(HasEvent(events, "STATE_COMPLETED"));

  // terminal rows stay put
  assert(Throws<taskorch::util::InvalidTransition>([&] { h.lifecycle->ApplyConsensus("T-1", CONSENSUS_RESULT_FAIL, "late"); }));
  assert(Throws<taskorch::util::InvalidTransition>([&] { h.lifecycle->Fail("T-1", "late"); }));
}

void TestPendingIsNoop() {
  Harness h;
  h.AddWorker("w-1", 100);
  InReview(h, "T-1");

  auto task = h.lifecycle->ApplyConsensus("T-1", CONSENSUS_RESULT_PENDING, "");
  assert(task.state == TASK_STATE_REVIEW);
  assert(h.tasks->GetTask("T-1").state == TASK_STATE_REVIEW);
}

void TestRejectionRetriesWithFeedbackThenEscalates() {
  auto options                           = taskorch::testing::TestOptions();
  options.lifecycle.max_retries_per_task = 1;
  Harness h(options);
  h.AddWorker("w-1", 100);
  InReview(h, "T-1");

  auto task = h.lifecycle->ApplyConsensus("T-1", CONSENSUS_RESULT_FAIL, "missing tests");
  assert(task.state == TASK_STATE_QUEUED);
  assert(task.retry_count == 1);
  assert(task.feedback == "missing tests");
  assert(HasEvent(h.tasks->TaskHistory("T-1"), "STATE_REJECTED"));

  h.tasks->AssignTask("T-1", "w-1");
  h.lifecycle->SubmitForReview("T-1", "w-1", "second attempt");
  task = h.lifecycle->ApplyConsensus("T-1", CONSENSUS_RESULT_FAIL, "still missing tests");
  assert(task.state == TASK_STATE_ESCALATED);
  assert(task.retry_count == 1);
  assert(task.feedback == "still missing tests");
}

void TestInconclusiveEscalates() {
  Harness h;
  h.AddWorker("w-1", 100);
  InReview(h, "T-1");

  auto task = h.lifecycle->ApplyConsensus("T-1", CONSENSUS_RESULT_INCONCLUSIVE, "split vote");
  assert(task.state == TASK_STATE_ESCALATED);
  assert(task.retry_count == 0);
}

void TestConsensusOutsideReviewIsRejected() {
  Harness h;
  h.AddTask("T-1", "FIX");
  assert(Throws<taskorch::util::InvalidTransition>([&] { h.lifecycle->ApplyConsensus("T-1", CONSENSUS_RESULT_PASS, ""); }));
  assert(h.tasks->GetTask("T-1").state == TASK_STATE_QUEUED);
}

void TestExecutorFailureRetriesUntilBudgetSpent() {
  auto options                           = taskorch::testing::TestOptions();
  options.lifecycle.max_retries_per_task = 2;
  Harness h(options);
  h.AddWorker("w-1", 100);
  h.AddTask("T-1", "FIX");

  for (uint32_t attempt = 1; attempt <= 2; ++attempt) {
    h.tasks->AssignTask("T-1", "w-1");
    auto task = h.lifecycle->ReportExecutorFailure("T-1", "w-1", "exit 1");
    assert(task.state == TASK_STATE_QUEUED);
    assert(task.retry_count == attempt);
    assert(task.error == "exit 1");
  }

  h.tasks->AssignTask("T-1", "w-1");
  auto task = h.lifecycle->ReportExecutorFailure("T-1", "w-1", "exit 1");
  assert(task.state == TASK_STATE_ESCALATED);

  auto worker = h.pool->GetWorker("w-1");
  assert(worker.tasks_failed == 3);
  assert(worker.status == WORKER_STATUS_IDLE);
}

void TestCancelOnlyFromQueued() {
  Harness h;
  h.AddWorker("w-1", 100);
  h.AddTask("queued", "FIX");
  h.AddTask("running", "FIX");
  h.tasks->AssignTask("running", "w-1");

  auto cancelled = h.lifecycle->Cancel("queued", "not needed");
  assert(cancelled.state == TASK_STATE_CANCELLED);
  assert(Throws<taskorch::util::InvalidTransition>([&] { h.lifecycle->Cancel("running", "too late"); }));
  assert(Throws<taskorch::util::InvalidTransition>([&] { h.lifecycle->Cancel("queued", "twice"); }));
}

void TestFailAndEscalateSettleOwner() {
  Harness h;
  h.AddWorker("w-1", 100);
  h.AddTask("T-1", "FIX");
  h.AddTask("T-2", "FIX");
  h.tasks->AssignTask("T-1", "w-1");
  h.tasks->AssignTask("T-2", "w-1");

  auto failed = h.lifecycle->Fail("T-1", "unrecoverable");
  assert(failed.state == TASK_STATE_FAILED);
  assert(failed.error == "unrecoverable");
  assert(h.pool->GetWorker("w-1").status == WORKER_STATUS_BUSY);

  auto escalated = h.lifecycle->Escalate("T-2", "needs a human");
  assert(escalated.state == TASK_STATE_ESCALATED);
  assert(h.pool->GetWorker("w-1").status == WORKER_STATUS_IDLE);
}

} // namespace

int main() {
  TestSubmitForReview();
  TestSubmitFromNonOwnerIsStale();
  TestPassCompletesTask();
  TestPendingIsNoop();
  TestRejectionRetriesWithFeedbackThenEscalates();
  TestInconclusiveEscalates();
  TestConsensusOutsideReviewIsRejected();
  TestExecutorFailureRetriesUntilBudgetSpent();
  TestCancelOnlyFromQueued();
  TestFailAndEscalateSettleOwner();

  std::cout << "taskorch_unit_lifecycle: pass\n";
  return 0;
}
