#include <cassert>
#include <iostream>
#include <string>

#include "internal/consensus/review_coordinator.hpp"
#include "test_support.hpp"

namespace {

using namespace taskorch::v1;
using taskorch::consensus::ConsensusEngine;
using taskorch::testing::Harness;
using taskorch::testing::HasEvent;
using taskorch::testing::Throws;

void InReview(Harness& h, const std::string& id, const std::string& type = "FIX") {
  h.AddTask(id, type);
  h.tasks->AssignTask(id, "w-1");
  h.lifecycle->SubmitForReview(id, "w-1", "result of " + id);
}

std::shared_ptr<taskorch::consensus::ReviewCoordinator> Coordinator(Harness& h) {
  return std::make_shared<taskorch::consensus::ReviewCoordinator>(h.repository, h.consensus, h.lifecycle, h.breaker, h.executor, h.budget,
                                                                  h.options.consensus);
}

void TestDecideOutcomes() {
  // 2 voters, threshold 2
  assert(ConsensusEngine::Decide(2, 0, 2, 2, 2) == CONSENSUS_RESULT_PASS);
  assert(ConsensusEngine::Decide(0, 2, 2, 2, 2) == CONSENSUS_RESULT_FAIL);
  assert(ConsensusEngine::Decide(1, 1, 2, 2, 2) == CONSENSUS_RESULT_INCONCLUSIVE);
  assert(ConsensusEngine::Decide(1, 0, 1, 2, 2) == CONSENSUS_RESULT_PENDING);
  assert(ConsensusEngine::Decide(0, 0, 2, 2, 2) == CONSENSUS_RESULT_INCONCLUSIVE);
  // 4 voters, threshold 2: early decision
  assert(ConsensusEngine::Decide(2, 0, 2, 4, 2) == CONSENSUS_RESULT_PASS);
  assert(ConsensusEngine::Decide(1, 2, 3, 4, 2) == CONSENSUS_RESULT_FAIL);
}

void TestParseVote() {
  assert(ConsensusEngine::ParseVote("APPROVE: looks good") == VOTE_APPROVE);
  assert(ConsensusEngine::ParseVote("lgtm") == VOTE_APPROVE);
  assert(ConsensusEngine::ParseVote("REJECT - tests fail") == VOTE_REJECT);
  assert(ConsensusEngine::ParseVote("this is a blocker") == VOTE_REJECT);
  assert(ConsensusEngine::ParseVote("request timed out") == VOTE_TIMEOUT);
  assert(ConsensusEngine::ParseVote("internal error") == VOTE_ERROR);
  assert(ConsensusEngine::ParseVote("no opinion") == VOTE_ABSTAIN);
  assert(ConsensusEngine::ParseVote("") == VOTE_ABSTAIN);
}

void TestVotersExcludeImplementer() {
  Harness h;
  auto    voters = h.consensus->VotersFor("claude");
  assert(voters.size() == 2);
  assert(voters[0] == "codex");
  assert(voters[1] == "gemini");

  assert(h.consensus->RequiredFor("FIX", "claude") == 2);
  assert(h.consensus->RequiredFor("SECURITY", "claude") == 2);
  assert(h.consensus->VotersFor("outsider").size() == 3);
  assert(h.consensus->RequiredFor("SECURITY", "outsider") == 3);
  assert(h.consensus->RequiredFor("FIX", "outsider") == 2);
}

void TestSessionReachesPass() {
  Harness h;
  h.AddWorker("w-1", 100);
  InReview(h, "T-1");

  const auto session_id = h.consensus->CreateSession("T-1", "claude");
  assert(session_id.rfind("CS-", 0) == 0);
  assert(session_id.find("-T-1-") != std::string::npos);

  h.consensus->RecordVote(session_id, "codex", VOTE_APPROVE, "fine", 120);
  assert(h.consensus->Evaluate(session_id) == CONSENSUS_RESULT_PENDING);
  h.consensus->RecordVote(session_id, "gemini", VOTE_APPROVE, "ship it");
  assert(h.consensus->Evaluate(session_id) == CONSENSUS_RESULT_PASS);

  auto view = h.consensus->GetSession(session_id);
  assert(view.session.final_result == CONSENSUS_RESULT_PASS);
  assert(view.session.approvals == 2);
  assert(view.session.completed_at_ms > 0);
  assert(view.votes.size() == 2);

  auto events = h.tasks->TaskHistory("T-1");
  assert(HasEvent(events, "CONSENSUS_STARTED"));
  assert(HasEvent(events, "CONSENSUS_PASS"));

  // decided sessions are closed
  assert(Throws<taskorch::util::InvalidState>([&] { h.consensus->RecordVote(session_id, "codex", VOTE_REJECT, "changed mind"); }));
  assert(h.consensus->Evaluate(session_id) == CONSENSUS_RESULT_PASS);
}

void TestSplitVoteIsInconclusive() {
  Harness h;
  h.AddWorker("w-1", 100);
  InReview(h, "T-1");

  const auto session_id = h.consensus->CreateSession("T-1", "claude");
  h.consensus->RecordVote(session_id, "codex", VOTE_APPROVE, "");
  h.consensus->RecordVote(session_id, "gemini", VOTE_REJECT, "bad");
  assert(h.consensus->Evaluate(session_id) == CONSENSUS_RESULT_INCONCLUSIVE);
}

void TestRevoteReplacesEarlierVote() {
  Harness h;
  h.AddWorker("w-1", 100);
  InReview(h, "T-1");

  const auto session_id = h.consensus->CreateSession("T-1", "claude");
  h.consensus->RecordVote(session_id, "codex", VOTE_ABSTAIN, "later");
  h.consensus->RecordVote(session_id, "codex", VOTE_REJECT, "no");
  auto view = h.consensus->GetSession(session_id);
  assert(view.votes.size() == 1);
  assert(view.votes.front().vote == VOTE_REJECT);
}

void TestInvalidVotesAreRejected() {
  Harness h;
  h.AddWorker("w-1", 100);
  InReview(h, "T-1");
  const auto session_id = h.consensus->CreateSession("T-1", "claude");

  assert(Throws<taskorch::util::InvalidArgument>([&] { h.consensus->RecordVote(session_id, "claude", VOTE_APPROVE, "mine"); }));
  assert(Throws<taskorch::util::InvalidArgument>([&] { h.consensus->RecordVote(session_id, "stranger", VOTE_APPROVE, ""); }));
  assert(Throws<taskorch::util::InvalidArgument>([&] { h.consensus->RecordVote(session_id, "codex", VOTE_UNSPECIFIED, ""); }));
  assert(Throws<taskorch::util::NotFound>([&] { h.consensus->RecordVote("CS-missing", "codex", VOTE_APPROVE, ""); }));
  assert(Throws<taskorch::util::NotFound>([&] { h.consensus->CreateSession("missing", "claude"); }));
}

void TestExpiryFillsTimeouts() {
  Harness h;
  h.AddWorker("w-1", 100);
  InReview(h, "T-1");

  const auto session_id = h.consensus->CreateSession("T-1", "claude");
  h.consensus->RecordVote(session_id, "codex", VOTE_APPROVE, "");
  assert(h.consensus->ExpireSession(session_id) == CONSENSUS_RESULT_INCONCLUSIVE);

  auto view = h.consensus->GetSession(session_id);
  assert(view.votes.size() == 2);
  bool saw_timeout = false;
  for (const auto& vote : view.votes) {
    saw_timeout = saw_timeout || (vote.voter == "gemini" && vote.vote == VOTE_TIMEOUT);
  }
  assert(saw_timeout);
  assert(h.consensus->SessionsForTask("T-1").size() == 1);
}

void TestCoordinatorApprovesTask() {
  Harness h;
  h.AddWorker("w-1", 100);
  InReview(h, "T-1");
  h.executor->Reply("codex", "APPROVE: clean", 0.25);
  h.executor->Reply("gemini", "lgtm");

  auto coordinator = Coordinator(h);
  assert(coordinator->ReviewTask("T-1") == CONSENSUS_RESULT_PASS);
  assert(h.tasks->GetTask("T-1").state == TASK_STATE_COMPLETED);
  assert(h.executor->CallsTo("claude") == 0);
  assert(h.budget->DailySpend() == 0.25);

  assert(Throws<taskorch::util::InvalidState>([&] { coordinator->ReviewTask("T-1"); }));
  assert(Throws<taskorch::util::NotFound>([&] { coordinator->ReviewTask("missing"); }));
}

void TestCoordinatorRejectionCarriesFeedback() {
  Harness h;
  h.AddWorker("w-1", 100);
  InReview(h, "T-1");
  h.executor->Reply("codex", "REJECT: no tests");
  h.executor->Reply("gemini", "reject, breaks the build");

  auto coordinator = Coordinator(h);
  assert(coordinator->ReviewTask("T-1") == CONSENSUS_RESULT_FAIL);

  auto task = h.tasks->GetTask("T-1");
  assert(task.state == TASK_STATE_QUEUED);
  assert(task.retry_count == 1);
  assert(task.feedback.find("[codex REJECT]") != std::string::npos);
  assert(task.feedback.find("[gemini REJECT]") != std::string::npos);
}

void TestCoordinatorCountsFailuresAsErrors() {
  Harness h;
  h.AddWorker("w-1", 100);
  InReview(h, "T-1");
  h.executor->Reply("codex", "approve");
  h.executor->Fail("gemini", "exit 2");

  auto coordinator = Coordinator(h);
  assert(coordinator->ReviewTask("T-1") == CONSENSUS_RESULT_INCONCLUSIVE);
  assert(h.tasks->GetTask("T-1").state == TASK_STATE_ESCALATED);
  assert(h.breaker->Get("gemini").failure_count == 1);

  auto sessions = h.consensus->SessionsForTask("T-1");
  assert(sessions.size() == 1);
  bool saw_error = false;
  for (const auto& vote : sessions.front().votes) {
    saw_error = saw_error || (vote.voter == "gemini" && vote.vote == VOTE_ERROR);
  }
  assert(saw_error);
}

void TestReviewPendingSweepsQueue() {
  Harness h;
  h.AddWorker("w-1", 100);
  InReview(h, "T-1");
  InReview(h, "T-2");
  h.executor->SetDefaultReply("approve");

  auto coordinator = Coordinator(h);
  assert(coordinator->ReviewPending() == 2);
  assert(h.tasks->GetTask("T-1").state == TASK_STATE_COMPLETED);
  assert(h.tasks->GetTask("T-2").state == TASK_STATE_COMPLETED);
  assert(coordinator->ReviewPending() == 0);
}

} // namespace

int main() {
  TestDecideOutcomes();
  TestParseVote();
  TestVotersExcludeImplementer();
  TestSessionReachesPass();
  TestSplitVoteIsInconclusive();
  TestRevoteReplacesEarlierVote();
  TestInvalidVotesAreRejected();
  TestExpiryFillsTimeouts();
  TestCoordinatorApprovesTask();
  TestCoordinatorRejectionCarriesFeedback();
  TestCoordinatorCountsFailuresAsErrors();
  TestReviewPendingSweepsQueue();

  std::cout << "taskorch_unit_consensus: pass\n";
  return 0;
}
