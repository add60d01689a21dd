#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>

#include "internal/db/api/repository.hpp"

namespace taskorch::testing {

/*
  Forwards to another repository; FailNext("UpsertBreaker") makes the
  next write of that name answer Busy instead of reaching the store,
  the way a locked sqlite file or a dropped postgres connection does.
*/
class FaultyRepository final : public db::Repository {
 public:
  explicit FaultyRepository(std::shared_ptr<db::Repository> inner) : inner_(std::move(inner)) {
  }

  void FailNext(const std::string& operation, int times = 1) {
    std::lock_guard<std::mutex> lock(mutex_);
    failures_[operation] += times;
  }

  std::unique_ptr<db::Transaction> Begin() override {
    return inner_->Begin();
  }

  db::Result InsertTask(db::Transaction& tx, const db::model::TaskRecord& r) override {
    return Fault("InsertTask") ? Busy() : inner_->InsertTask(tx, r);
  }
  std::optional<db::model::TaskRecord> GetTask(db::Transaction& tx, const std::string& id) override {
    return inner_->GetTask(tx, id);
  }
  std::vector<db::model::TaskRecord> ListTasks(db::Transaction& tx, std::optional<taskorch::v1::TaskState> state, uint32_t limit) override {
    return inner_->ListTasks(tx, state, limit);
  }
  db::Result UpdateTask(db::Transaction& tx, const db::model::TaskRecord& r) override {
    return Fault("UpdateTask") ? Busy() : inner_->UpdateTask(tx, r);
  }
  std::optional<db::model::TaskRecord> NextClaimable(db::Transaction& tx, const db::ClaimFilter& filter) override {
    return inner_->NextClaimable(tx, filter);
  }
  db::Result MarkClaimed(db::Transaction& tx, const std::string& task_id, const std::string& worker_id, uint64_t now_ms) override {
    return Fault("MarkClaimed") ? Busy() : inner_->MarkClaimed(tx, task_id, worker_id, now_ms);
  }
  std::vector<db::model::TaskRecord> ListRunningByWorker(db::Transaction& tx, const std::string& worker_id) override {
    return inner_->ListRunningByWorker(tx, worker_id);
  }
  std::map<std::string, uint64_t> CountTasksByState(db::Transaction& tx) override {
    return inner_->CountTasksByState(tx);
  }
  std::map<std::string, uint64_t> CountQueuedByShard(db::Transaction& tx) override {
    return inner_->CountQueuedByShard(tx);
  }

  db::Result AppendEvent(db::Transaction& tx, const db::model::EventRecord& r) override {
    return Fault("AppendEvent") ? Busy() : inner_->AppendEvent(tx, r);
  }
  std::vector<db::model::EventRecord> ListEvents(db::Transaction& tx, const std::string& task_id) override {
    return inner_->ListEvents(tx, task_id);
  }

  db::Result InsertWorker(db::Transaction& tx, const db::model::WorkerRecord& r) override {
    return Fault("InsertWorker") ? Busy() : inner_->InsertWorker(tx, r);
  }
  std::optional<db::model::WorkerRecord> GetWorker(db::Transaction& tx, const std::string& worker_id) override {
    return inner_->GetWorker(tx, worker_id);
  }
  std::vector<db::model::WorkerRecord> ListWorkers(db::Transaction& tx) override {
    return inner_->ListWorkers(tx);
  }
  db::Result UpdateWorker(db::Transaction& tx, const db::model::WorkerRecord& r) override {
    return Fault("UpdateWorker") ? Busy() : inner_->UpdateWorker(tx, r);
  }
  db::Result UpsertHeartbeat(db::Transaction& tx, const db::model::HeartbeatRecord& r) override {
    return Fault("UpsertHeartbeat") ? Busy() : inner_->UpsertHeartbeat(tx, r);
  }
  std::optional<db::model::HeartbeatRecord> GetHeartbeat(db::Transaction& tx, const std::string& worker_id) override {
    return inner_->GetHeartbeat(tx, worker_id);
  }

  db::Result InsertSession(db::Transaction& tx, const db::model::ConsensusSessionRecord& r) override {
    return Fault("InsertSession") ? Busy() : inner_->InsertSession(tx, r);
  }
  std::optional<db::model::ConsensusSessionRecord> GetSession(db::Transaction& tx, const std::string& session_id) override {
    return inner_->GetSession(tx, session_id);
  }
  std::vector<db::model::ConsensusSessionRecord> ListSessionsForTask(db::Transaction& tx, const std::string& task_id) override {
    return inner_->ListSessionsForTask(tx, task_id);
  }
  db::Result UpdateSession(db::Transaction& tx, const db::model::ConsensusSessionRecord& r) override {
    return Fault("UpdateSession") ? Busy() : inner_->UpdateSession(tx, r);
  }
  db::Result UpsertVote(db::Transaction& tx, const db::model::VoteRecord& r) override {
    return Fault("UpsertVote") ? Busy() : inner_->UpsertVote(tx, r);
  }
  std::vector<db::model::VoteRecord> ListVotes(db::Transaction& tx, const std::string& session_id) override {
    return inner_->ListVotes(tx, session_id);
  }

  std::optional<db::model::BreakerRecord> GetBreaker(db::Transaction& tx, const std::string& capability) override {
    return inner_->GetBreaker(tx, capability);
  }
  db::Result UpsertBreaker(db::Transaction& tx, const db::model::BreakerRecord& r) override {
    return Fault("UpsertBreaker") ? Busy() : inner_->UpsertBreaker(tx, r);
  }
  std::vector<db::model::BreakerRecord> ListBreakers(db::Transaction& tx) override {
    return inner_->ListBreakers(tx);
  }

  db::Result AppendLedger(db::Transaction& tx, const db::model::LedgerEntry& r) override {
    return Fault("AppendLedger") ? Busy() : inner_->AppendLedger(tx, r);
  }
  double SumLedgerSince(db::Transaction& tx, uint64_t since_ms) override {
    return inner_->SumLedgerSince(tx, since_ms);
  }
  db::model::KillSwitchRecord GetKillSwitch(db::Transaction& tx) override {
    return inner_->GetKillSwitch(tx);
  }
  db::Result PutKillSwitch(db::Transaction& tx, const db::model::KillSwitchRecord& r) override {
    return Fault("PutKillSwitch") ? Busy() : inner_->PutKillSwitch(tx, r);
  }
  db::model::PauseRecord GetPause(db::Transaction& tx) override {
    return inner_->GetPause(tx);
  }
  db::Result PutPause(db::Transaction& tx, const db::model::PauseRecord& r) override {
    return Fault("PutPause") ? Busy() : inner_->PutPause(tx, r);
  }

 private:
  static db::Result Busy() {
    return db::Result::Err(db::ErrorCode::Busy, "injected: database is locked");
  }

  bool Fault(const std::string& operation) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = failures_.find(operation);
    if (it == failures_.end() || it->second == 0) {
      return false;
    }
    --it->second;
    return true;
  }

  std::shared_ptr<db::Repository> inner_;
  std::mutex                      mutex_;
  std::map<std::string, int>      failures_;
};

} // namespace taskorch::testing
