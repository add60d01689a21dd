#include "memory_repository.hpp"

#include <algorithm>
#include <tuple>

#include "internal/model/state_machine.hpp"
#include "internal/model/worker_status.hpp"
#include "memory_tx.hpp"

namespace taskorch::db::memory {

namespace {

bool MatchesOptional(const std::optional<std::string>& wanted, const std::string& column) {
  // empty column means "any"
  return !wanted.has_value() || column.empty() || column == *wanted;
}

} // namespace

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Tasks
// ------------------------------------------------------------------

Result MemoryRepository::InsertTask(Transaction& t, const model::TaskRecord& r) {
  if (TX(t).View().tasks.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, "task " + r.id);
  auto& s       = TX(t).Mutable();
  s.tasks[r.id] = StoredTask{r, s.next_task_seq++};
  return Result::Ok();
}

std::optional<model::TaskRecord> MemoryRepository::GetTask(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.tasks.find(id);
  if (it == s.tasks.end()) return std::nullopt;
  return it->second.record;
}

std::vector<model::TaskRecord> MemoryRepository::ListTasks(Transaction& t, std::optional<taskorch::v1::TaskState> state, uint32_t limit) {
  const auto& s = TX(t).View();

  std::vector<const StoredTask*> matches;
  for (const auto& [_, stored] : s.tasks) {
    if (state && stored.record.state != *state) continue;
    matches.push_back(&stored);
  }
  std::sort(matches.begin(), matches.end(), [](const StoredTask* a, const StoredTask* b) {
    if (a->record.created_at_ms != b->record.created_at_ms) return a->record.created_at_ms > b->record.created_at_ms;
    return a->seq > b->seq;
  });

  std::vector<model::TaskRecord> out;
  for (const auto* stored : matches) {
    if (limit > 0 && out.size() >= limit) break;
    out.push_back(stored->record);
  }
  return out;
}

Result MemoryRepository::UpdateTask(Transaction& t, const model::TaskRecord& r) {
  const auto& view = TX(t).View();
  auto        it   = view.tasks.find(r.id);
  if (it == view.tasks.end()) return Result::Err(ErrorCode::NotFound, "task " + r.id);
  if (taskorch::model::IsTerminal(it->second.record.state)) {
    return Result::Err(ErrorCode::ConstraintViolation, "task is in a terminal state");
  }
  TX(t).Mutable().tasks[r.id].record = r;
  return Result::Ok();
}

std::optional<model::TaskRecord> MemoryRepository::NextClaimable(Transaction& t, const ClaimFilter& filter) {
  const auto& s = TX(t).View();

  const StoredTask* best = nullptr;
  for (const auto& [_, stored] : s.tasks) {
    const auto& r = stored.record;
    if (r.state != taskorch::v1::TASK_STATE_QUEUED) continue;
    if (!MatchesOptional(filter.shard, r.shard)) continue;
    if (!MatchesOptional(filter.model, r.assigned_model)) continue;
    if (!filter.types.empty() && std::find(filter.types.begin(), filter.types.end(), r.type) == filter.types.end()) continue;

    if (!best || std::tie(r.priority, r.created_at_ms, stored.seq) <
                     std::tie(best->record.priority, best->record.created_at_ms, best->seq)) {
      best = &stored;
    }
  }
  if (!best) return std::nullopt;
  return best->record;
}

Result MemoryRepository::MarkClaimed(Transaction& t, const std::string& task_id, const std::string& worker_id, uint64_t now_ms) {
  const auto& view = TX(t).View();
  auto        it   = view.tasks.find(task_id);
  if (it == view.tasks.end()) return Result::Err(ErrorCode::NotFound, "task " + task_id);
  if (it->second.record.state != taskorch::v1::TASK_STATE_QUEUED) {
    return Result::Err(ErrorCode::Conflict, "task " + task_id + " is no longer queued");
  }

  auto& r           = TX(t).Mutable().tasks[task_id].record;
  r.state           = taskorch::v1::TASK_STATE_RUNNING;
  r.worker_id       = worker_id;
  r.started_at_ms   = now_ms;
  r.heartbeat_at_ms = now_ms;
  r.updated_at_ms   = now_ms;
  return Result::Ok();
}

std::vector<model::TaskRecord> MemoryRepository::ListRunningByWorker(Transaction& t, const std::string& worker_id) {
  std::vector<model::TaskRecord> out;
  for (const auto& [_, stored] : TX(t).View().tasks) {
    if (stored.record.worker_id == worker_id && stored.record.state == taskorch::v1::TASK_STATE_RUNNING) {
      out.push_back(stored.record);
    }
  }
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.started_at_ms < b.started_at_ms; });
  return out;
}

std::map<std::string, uint64_t> MemoryRepository::CountTasksByState(Transaction& t) {
  std::map<std::string, uint64_t> out;
  for (const auto& [_, stored] : TX(t).View().tasks) {
    out[std::string(taskorch::model::ToString(stored.record.state))]++;
  }
  return out;
}

std::map<std::string, uint64_t> MemoryRepository::CountQueuedByShard(Transaction& t) {
  std::map<std::string, uint64_t> out;
  for (const auto& [_, stored] : TX(t).View().tasks) {
    if (stored.record.state == taskorch::v1::TASK_STATE_QUEUED) out[stored.record.shard]++;
  }
  return out;
}

// ------------------------------------------------------------------
// Events
// ------------------------------------------------------------------

Result MemoryRepository::AppendEvent(Transaction& t, const model::EventRecord& r) {
  auto& s = TX(t).Mutable();
  auto  e = r;
  e.id    = s.next_event_id++;
  s.events.push_back(std::move(e));
  return Result::Ok();
}

std::vector<model::EventRecord> MemoryRepository::ListEvents(Transaction& t, const std::string& task_id) {
  std::vector<model::EventRecord> out;
  for (const auto& e : TX(t).View().events)
    if (e.task_id == task_id) out.push_back(e);
  return out;
}

// ------------------------------------------------------------------
// Workers
// ------------------------------------------------------------------

Result MemoryRepository::InsertWorker(Transaction& t, const model::WorkerRecord& r) {
  if (TX(t).View().workers.contains(r.worker_id)) return Result::Err(ErrorCode::AlreadyExists, "worker " + r.worker_id);
  if (r.status != taskorch::v1::WORKER_STATUS_STARTING) {
    return Result::Err(ErrorCode::ConstraintViolation, "worker must register as starting");
  }
  TX(t).Mutable().workers[r.worker_id] = r;
  return Result::Ok();
}

std::optional<model::WorkerRecord> MemoryRepository::GetWorker(Transaction& t, const std::string& worker_id) {
  const auto& s  = TX(t).View();
  auto        it = s.workers.find(worker_id);
  if (it == s.workers.end()) return std::nullopt;
  return it->second;
}

std::vector<model::WorkerRecord> MemoryRepository::ListWorkers(Transaction& t) {
  std::vector<model::WorkerRecord> out;
  for (const auto& [_, w] : TX(t).View().workers) out.push_back(w);
  return out;
}

Result MemoryRepository::UpdateWorker(Transaction& t, const model::WorkerRecord& r) {
  const auto& view = TX(t).View();
  auto        it   = view.workers.find(r.worker_id);
  if (it == view.workers.end()) return Result::Err(ErrorCode::NotFound, "worker " + r.worker_id);
  if (!taskorch::model::CanTransition(it->second.status, r.status)) {
    return Result::Err(ErrorCode::ConstraintViolation, "invalid worker status transition");
  }
  TX(t).Mutable().workers[r.worker_id] = r;
  return Result::Ok();
}

Result MemoryRepository::UpsertHeartbeat(Transaction& t, const model::HeartbeatRecord& r) {
  if (!TX(t).View().workers.contains(r.worker_id)) {
    return Result::Err(ErrorCode::ConstraintViolation, "heartbeat for unknown worker " + r.worker_id);
  }
  TX(t).Mutable().heartbeats[r.worker_id] = r;
  return Result::Ok();
}

std::optional<model::HeartbeatRecord> MemoryRepository::GetHeartbeat(Transaction& t, const std::string& worker_id) {
  const auto& s  = TX(t).View();
  auto        it = s.heartbeats.find(worker_id);
  if (it == s.heartbeats.end()) return std::nullopt;
  return it->second;
}

// ------------------------------------------------------------------
// Consensus
// ------------------------------------------------------------------

Result MemoryRepository::InsertSession(Transaction& t, const model::ConsensusSessionRecord& r) {
  if (TX(t).View().sessions.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, "session " + r.id);
  TX(t).Mutable().sessions[r.id] = r;
  return Result::Ok();
}

std::optional<model::ConsensusSessionRecord> MemoryRepository::GetSession(Transaction& t, const std::string& session_id) {
  const auto& s  = TX(t).View();
  auto        it = s.sessions.find(session_id);
  if (it == s.sessions.end()) return std::nullopt;
  return it->second;
}

std::vector<model::ConsensusSessionRecord> MemoryRepository::ListSessionsForTask(Transaction& t, const std::string& task_id) {
  std::vector<model::ConsensusSessionRecord> out;
  for (const auto& [_, session] : TX(t).View().sessions)
    if (session.task_id == task_id) out.push_back(session);
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
    if (a.created_at_ms != b.created_at_ms) return a.created_at_ms < b.created_at_ms;
    return a.id < b.id;
  });
  return out;
}

Result MemoryRepository::UpdateSession(Transaction& t, const model::ConsensusSessionRecord& r) {
  if (!TX(t).View().sessions.contains(r.id)) return Result::Err(ErrorCode::NotFound, "session " + r.id);
  TX(t).Mutable().sessions[r.id] = r;
  return Result::Ok();
}

Result MemoryRepository::UpsertVote(Transaction& t, const model::VoteRecord& r) {
  if (!TX(t).View().sessions.contains(r.session_id)) {
    return Result::Err(ErrorCode::ConstraintViolation, "vote for unknown session " + r.session_id);
  }
  TX(t).Mutable().votes[r.session_id][r.voter] = r;
  return Result::Ok();
}

std::vector<model::VoteRecord> MemoryRepository::ListVotes(Transaction& t, const std::string& session_id) {
  std::vector<model::VoteRecord> out;
  const auto& s  = TX(t).View();
  auto        it = s.votes.find(session_id);
  if (it == s.votes.end()) return out;
  for (const auto& [_, v] : it->second) out.push_back(v);
  return out;
}

// ------------------------------------------------------------------
// Breakers
// ------------------------------------------------------------------

std::optional<model::BreakerRecord> MemoryRepository::GetBreaker(Transaction& t, const std::string& capability) {
  const auto& s  = TX(t).View();
  auto        it = s.breakers.find(capability);
  if (it == s.breakers.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::UpsertBreaker(Transaction& t, const model::BreakerRecord& r) {
  TX(t).Mutable().breakers[r.capability] = r;
  return Result::Ok();
}

std::vector<model::BreakerRecord> MemoryRepository::ListBreakers(Transaction& t) {
  std::vector<model::BreakerRecord> out;
  for (const auto& [_, b] : TX(t).View().breakers) out.push_back(b);
  return out;
}

// ------------------------------------------------------------------
// Budget and pool control
// ------------------------------------------------------------------

Result MemoryRepository::AppendLedger(Transaction& t, const model::LedgerEntry& r) {
  auto& s = TX(t).Mutable();
  auto  e = r;
  e.id    = s.next_ledger_id++;
  s.ledger.push_back(std::move(e));
  return Result::Ok();
}

double MemoryRepository::SumLedgerSince(Transaction& t, uint64_t since_ms) {
  double total = 0.0;
  for (const auto& e : TX(t).View().ledger)
    if (e.timestamp_ms >= since_ms) total += e.amount;
  return total;
}

model::KillSwitchRecord MemoryRepository::GetKillSwitch(Transaction& t) {
  return TX(t).View().kill_switch;
}

Result MemoryRepository::PutKillSwitch(Transaction& t, const model::KillSwitchRecord& r) {
  TX(t).Mutable().kill_switch = r;
  return Result::Ok();
}

model::PauseRecord MemoryRepository::GetPause(Transaction& t) {
  return TX(t).View().pause;
}

Result MemoryRepository::PutPause(Transaction& t, const model::PauseRecord& r) {
  TX(t).Mutable().pause = r;
  return Result::Ok();
}

} // namespace taskorch::db::memory
