#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/api/types.hpp"
#include "internal/db/model/breaker_record.hpp"
#include "internal/db/model/consensus_record.hpp"
#include "internal/db/model/control_record.hpp"
#include "internal/db/model/event_record.hpp"
#include "internal/db/model/heartbeat_record.hpp"
#include "internal/db/model/task_record.hpp"
#include "internal/db/model/worker_record.hpp"

namespace taskorch::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - MarkClaimed is a compare-and-swap on state=QUEUED
  - Worker status changes outside the allowed graph are rejected
    by the store itself (ConstraintViolation)

  The DB is the source of truth for:
    task ownership and state
    worker status
    consensus sessions and votes
    breaker, ledger, kill switch and pause state
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Tasks
  // ---------------------------------------------------------------------

  virtual Result InsertTask(Transaction&, const model::TaskRecord&) = 0;

  virtual std::optional<model::TaskRecord> GetTask(Transaction&, const std::string& id) = 0;

  // Newest first; no state filter when state is unset. limit 0 = unbounded.
  virtual std::vector<model::TaskRecord> ListTasks(Transaction&, std::optional<taskorch::v1::TaskState> state, uint32_t limit) = 0;

  virtual Result UpdateTask(Transaction&, const model::TaskRecord&) = 0;

  // Highest priority QUEUED task matching the filter, oldest first on ties.
  virtual std::optional<model::TaskRecord> NextClaimable(Transaction&, const ClaimFilter& filter) = 0;

  // Sets RUNNING/worker_id/started_at/heartbeat_at only while the task is still QUEUED.
  // Returns Conflict when the task is no longer QUEUED.
  virtual Result MarkClaimed(Transaction&, const std::string& task_id, const std::string& worker_id, uint64_t now_ms) = 0;

  virtual std::vector<model::TaskRecord> ListRunningByWorker(Transaction&, const std::string& worker_id) = 0;

  virtual std::map<std::string, uint64_t> CountTasksByState(Transaction&) = 0;

  // Shard "" collects tasks without a shard.
  virtual std::map<std::string, uint64_t> CountQueuedByShard(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Audit events
  // ---------------------------------------------------------------------

  virtual Result AppendEvent(Transaction&, const model::EventRecord&) = 0;

  virtual std::vector<model::EventRecord> ListEvents(Transaction&, const std::string& task_id) = 0;

  // ---------------------------------------------------------------------
  // Workers
  // ---------------------------------------------------------------------

  virtual Result InsertWorker(Transaction&, const model::WorkerRecord&) = 0;

  virtual std::optional<model::WorkerRecord> GetWorker(Transaction&, const std::string& worker_id) = 0;

  virtual std::vector<model::WorkerRecord> ListWorkers(Transaction&) = 0;

  virtual Result UpdateWorker(Transaction&, const model::WorkerRecord&) = 0;

  virtual Result UpsertHeartbeat(Transaction&, const model::HeartbeatRecord&) = 0;

  virtual std::optional<model::HeartbeatRecord> GetHeartbeat(Transaction&, const std::string& worker_id) = 0;

  // ---------------------------------------------------------------------
  // Consensus
  // ---------------------------------------------------------------------

  virtual Result InsertSession(Transaction&, const model::ConsensusSessionRecord&) = 0;

  virtual std::optional<model::ConsensusSessionRecord> GetSession(Transaction&, const std::string& session_id) = 0;

  virtual std::vector<model::ConsensusSessionRecord> ListSessionsForTask(Transaction&, const std::string& task_id) = 0;

  virtual Result UpdateSession(Transaction&, const model::ConsensusSessionRecord&) = 0;

  // Replaces an earlier vote by the same voter.
  virtual Result UpsertVote(Transaction&, const model::VoteRecord&) = 0;

  virtual std::vector<model::VoteRecord> ListVotes(Transaction&, const std::string& session_id) = 0;

  // ---------------------------------------------------------------------
  // Circuit breakers
  // ---------------------------------------------------------------------

  virtual std::optional<model::BreakerRecord> GetBreaker(Transaction&, const std::string& capability) = 0;

  virtual Result UpsertBreaker(Transaction&, const model::BreakerRecord&) = 0;

  virtual std::vector<model::BreakerRecord> ListBreakers(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Budget and pool control
  // ---------------------------------------------------------------------

  virtual Result AppendLedger(Transaction&, const model::LedgerEntry&) = 0;

  virtual double SumLedgerSince(Transaction&, uint64_t since_ms) = 0;

  virtual model::KillSwitchRecord GetKillSwitch(Transaction&) = 0;

  virtual Result PutKillSwitch(Transaction&, const model::KillSwitchRecord&) = 0;

  virtual model::PauseRecord GetPause(Transaction&) = 0;

  virtual Result PutPause(Transaction&, const model::PauseRecord&) = 0;
};

} // namespace taskorch::db
