#pragma once

#include <map>
#include <mutex>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace taskorch::db::memory {

class MemoryTransaction;

/*
  In-process repository for tests and single-process deployments.

  Enforces the same row constraints as the SQL schema:
  terminal tasks are immutable, workers register as starting and
  only move along the worker status graph.
*/
class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result InsertTask(Transaction&, const model::TaskRecord&) override;
  std::optional<model::TaskRecord> GetTask(Transaction&, const std::string&) override;
  std::vector<model::TaskRecord> ListTasks(Transaction&, std::optional<taskorch::v1::TaskState>, uint32_t limit) override;
  Result UpdateTask(Transaction&, const model::TaskRecord&) override;
  std::optional<model::TaskRecord> NextClaimable(Transaction&, const ClaimFilter&) override;
  Result MarkClaimed(Transaction&, const std::string& task_id, const std::string& worker_id, uint64_t now_ms) override;
  std::vector<model::TaskRecord> ListRunningByWorker(Transaction&, const std::string& worker_id) override;
  std::map<std::string, uint64_t> CountTasksByState(Transaction&) override;
  std::map<std::string, uint64_t> CountQueuedByShard(Transaction&) override;

  Result AppendEvent(Transaction&, const model::EventRecord&) override;
  std::vector<model::EventRecord> ListEvents(Transaction&, const std::string& task_id) override;

  Result InsertWorker(Transaction&, const model::WorkerRecord&) override;
  std::optional<model::WorkerRecord> GetWorker(Transaction&, const std::string&) override;
  std::vector<model::WorkerRecord> ListWorkers(Transaction&) override;
  Result UpdateWorker(Transaction&, const model::WorkerRecord&) override;
  Result UpsertHeartbeat(Transaction&, const model::HeartbeatRecord&) override;
  std::optional<model::HeartbeatRecord> GetHeartbeat(Transaction&, const std::string&) override;

  Result InsertSession(Transaction&, const model::ConsensusSessionRecord&) override;
  std::optional<model::ConsensusSessionRecord> GetSession(Transaction&, const std::string&) override;
  std::vector<model::ConsensusSessionRecord> ListSessionsForTask(Transaction&, const std::string&) override;
  Result UpdateSession(Transaction&, const model::ConsensusSessionRecord&) override;
  Result UpsertVote(Transaction&, const model::VoteRecord&) override;
  std::vector<model::VoteRecord> ListVotes(Transaction&, const std::string&) override;

  std::optional<model::BreakerRecord> GetBreaker(Transaction&, const std::string&) override;
  Result UpsertBreaker(Transaction&, const model::BreakerRecord&) override;
  std::vector<model::BreakerRecord> ListBreakers(Transaction&) override;

  Result AppendLedger(Transaction&, const model::LedgerEntry&) override;
  double SumLedgerSince(Transaction&, uint64_t since_ms) override;
  model::KillSwitchRecord GetKillSwitch(Transaction&) override;
  Result PutKillSwitch(Transaction&, const model::KillSwitchRecord&) override;
  model::PauseRecord GetPause(Transaction&) override;
  Result PutPause(Transaction&, const model::PauseRecord&) override;

private:
  friend class MemoryTransaction;

  struct StoredTask {
    model::TaskRecord record;
    uint64_t          seq = 0; // insertion order, claim tie-break
  };

  struct State {
    std::unordered_map<std::string, StoredTask> tasks;
    uint64_t next_task_seq = 1;

    std::vector<model::EventRecord> events;
    uint64_t next_event_id = 1;

    std::map<std::string, model::WorkerRecord> workers;
    std::unordered_map<std::string, model::HeartbeatRecord> heartbeats;

    std::unordered_map<std::string, model::ConsensusSessionRecord> sessions;
    // session id -> voter -> vote
    std::unordered_map<std::string, std::map<std::string, model::VoteRecord>> votes;

    std::map<std::string, model::BreakerRecord> breakers;

    std::vector<model::LedgerEntry> ledger;
    uint64_t next_ledger_id = 1;

    model::KillSwitchRecord kill_switch;
    model::PauseRecord      pause;
  };

  std::mutex mutex_;
  State      committed_;
  uint64_t   committed_version_ = 0;
};

} // namespace taskorch::db::memory
