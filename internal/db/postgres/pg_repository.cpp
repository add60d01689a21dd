#include "pg_repository.hpp"

#include "internal/model/enums.hpp"
#include "internal/model/state_machine.hpp"
#include "internal/model/worker_status.hpp"

namespace taskorch::db::postgres {

namespace {

// Empty string is stored as NULL.
std::optional<std::string> Opt(const std::string& s) {
  if (s.empty()) return std::nullopt;
  return s;
}

// Zero timestamp is stored as NULL.
std::optional<int64_t> OptMs(uint64_t v) {
  if (v == 0) return std::nullopt;
  return static_cast<int64_t>(v);
}

int64_t Ms(uint64_t v) {
  return static_cast<int64_t>(v);
}

std::string Text(const pqxx::field& f) {
  return f.is_null() ? "" : f.c_str();
}

uint64_t U64(const pqxx::field& f) {
  return f.is_null() ? 0 : static_cast<uint64_t>(f.as<int64_t>());
}

constexpr const char* kTaskColumns =
    "id,name,type,priority,state,lane,shard,assigned_model,worker_id,payload,result,error,feedback,trace_id,"
    "retry_count,max_retries,created_at,updated_at,started_at,heartbeat_at,completed_at";

model::TaskRecord ReadTask(const pqxx::row& row) {
  model::TaskRecord r;
  r.id              = Text(row[0]);
  r.name            = Text(row[1]);
  r.type            = Text(row[2]);
  r.priority        = static_cast<taskorch::v1::Priority>(row[3].as<int>());
  r.state           = taskorch::model::ParseTaskState(Text(row[4])).value_or(taskorch::v1::TASK_STATE_UNSPECIFIED);
  r.lane            = Text(row[5]);
  r.shard           = Text(row[6]);
  r.assigned_model  = Text(row[7]);
  r.worker_id       = Text(row[8]);
  r.payload         = Text(row[9]);
  r.result          = Text(row[10]);
  r.error           = Text(row[11]);
  r.feedback        = Text(row[12]);
  r.trace_id        = Text(row[13]);
  r.retry_count     = row[14].as<uint32_t>();
  r.max_retries     = row[15].as<uint32_t>();
  r.created_at_ms   = U64(row[16]);
  r.updated_at_ms   = U64(row[17]);
  r.started_at_ms   = U64(row[18]);
  r.heartbeat_at_ms = U64(row[19]);
  r.completed_at_ms = U64(row[20]);
  return r;
}

constexpr const char* kWorkerColumns =
    "worker_id,pid,status,shard,specialization,model,started_at,last_heartbeat,tasks_completed,tasks_failed,crash_count";

model::WorkerRecord ReadWorker(const pqxx::row& row) {
  model::WorkerRecord r;
  r.worker_id         = Text(row[0]);
  r.pid               = row[1].as<int64_t>();
  r.status            = taskorch::model::ParseWorkerStatus(Text(row[2])).value_or(taskorch::v1::WORKER_STATUS_UNSPECIFIED);
  r.shard             = Text(row[3]);
  r.specialization    = Text(row[4]);
  r.model             = Text(row[5]);
  r.started_at_ms     = U64(row[6]);
  r.last_heartbeat_ms = U64(row[7]);
  r.tasks_completed   = U64(row[8]);
  r.tasks_failed      = U64(row[9]);
  r.crash_count       = row[10].as<uint32_t>();
  return r;
}

constexpr const char* kSessionColumns = "id,task_id,implementer,final_result,required,approvals,rejections,created_at,completed_at";

model::ConsensusSessionRecord ReadSession(const pqxx::row& row) {
  model::ConsensusSessionRecord r;
  r.id              = Text(row[0]);
  r.task_id         = Text(row[1]);
  r.implementer     = Text(row[2]);
  r.final_result    = taskorch::model::ParseConsensusResult(Text(row[3])).value_or(taskorch::v1::CONSENSUS_RESULT_UNSPECIFIED);
  r.required        = row[4].as<uint32_t>();
  r.approvals       = row[5].as<uint32_t>();
  r.rejections      = row[6].as<uint32_t>();
  r.created_at_ms   = U64(row[7]);
  r.completed_at_ms = U64(row[8]);
  return r;
}

constexpr const char* kBreakerColumns = "capability,state,failure_count,half_open_calls,opened_at,last_failure,last_success";

model::BreakerRecord ReadBreaker(const pqxx::row& row) {
  model::BreakerRecord r;
  r.capability      = Text(row[0]);
  r.state           = taskorch::model::ParseBreakerState(Text(row[1]));
  r.failure_count   = row[2].as<uint32_t>();
  r.half_open_calls = row[3].as<uint32_t>();
  r.opened_at_ms    = U64(row[4]);
  r.last_failure_ms = U64(row[5]);
  r.last_success_ms = U64(row[6]);
  return r;
}

std::string Str(std::string_view v) {
  return std::string(v);
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) {
    return Result::Err(ErrorCode::AlreadyExists, e.what());
  }
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::serialization_failure*>(&e) || dynamic_cast<const pqxx::deadlock_detected*>(&e)) {
    return Result::Err(ErrorCode::SerializationFailure, e.what());
  }
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) {
    return Result::Err(ErrorCode::IOError, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

// ------------------------------------------------------------------
// Tasks
// ------------------------------------------------------------------

Result PgRepository::InsertTask(Transaction& t, const model::TaskRecord& r) {
  try {
    TX(t).Work().exec_params(std::string("INSERT INTO tasks(") + kTaskColumns +
                                 ") VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10,$11,$12,$13,$14,$15,$16,$17,$18,$19,$20,$21);",
                             r.id, r.name, r.type, static_cast<int>(r.priority), Str(taskorch::model::ToString(r.state)), Opt(r.lane),
                             Opt(r.shard), Opt(r.assigned_model), Opt(r.worker_id), Opt(r.payload), Opt(r.result), Opt(r.error),
                             Opt(r.feedback), Opt(r.trace_id), static_cast<int>(r.retry_count), static_cast<int>(r.max_retries),
                             Ms(r.created_at_ms), Ms(r.updated_at_ms), OptMs(r.started_at_ms), OptMs(r.heartbeat_at_ms),
                             OptMs(r.completed_at_ms));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::TaskRecord> PgRepository::GetTask(Transaction& t, const std::string& id) {
  auto res = TX(t).Work().exec_params(std::string("SELECT ") + kTaskColumns + " FROM tasks WHERE id=$1;", id);
  if (res.empty()) return std::nullopt;
  return ReadTask(res[0]);
}

std::vector<model::TaskRecord> PgRepository::ListTasks(Transaction& t, std::optional<taskorch::v1::TaskState> state, uint32_t limit) {
  std::optional<std::string> state_name;
  if (state) state_name = Str(taskorch::model::ToString(*state));

  std::optional<int64_t> row_limit;
  if (limit > 0) row_limit = limit;

  auto res = TX(t).Work().exec_params(std::string("SELECT ") + kTaskColumns +
                                          " FROM tasks WHERE ($1::text IS NULL OR state=$1) ORDER BY created_at DESC, seq DESC LIMIT $2;",
                                      state_name, row_limit);

  std::vector<model::TaskRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(ReadTask(row));
  return out;
}

Result PgRepository::UpdateTask(Transaction& t, const model::TaskRecord& r) {
  try {
    auto res = TX(t).Work().exec_params(
        "UPDATE tasks SET name=$2,type=$3,priority=$4,state=$5,lane=$6,shard=$7,assigned_model=$8,worker_id=$9,"
        "payload=$10,result=$11,error=$12,feedback=$13,trace_id=$14,retry_count=$15,max_retries=$16,"
        "created_at=$17,updated_at=$18,started_at=$19,heartbeat_at=$20,completed_at=$21 WHERE id=$1;",
        r.id, r.name, r.type, static_cast<int>(r.priority), Str(taskorch::model::ToString(r.state)), Opt(r.lane), Opt(r.shard),
        Opt(r.assigned_model), Opt(r.worker_id), Opt(r.payload), Opt(r.result), Opt(r.error), Opt(r.feedback), Opt(r.trace_id),
        static_cast<int>(r.retry_count), static_cast<int>(r.max_retries), Ms(r.created_at_ms), Ms(r.updated_at_ms),
        OptMs(r.started_at_ms), OptMs(r.heartbeat_at_ms), OptMs(r.completed_at_ms));
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, "task " + r.id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::TaskRecord> PgRepository::NextClaimable(Transaction& t, const ClaimFilter& filter) {
  std::optional<std::string> types;
  if (!filter.types.empty()) {
    std::string joined;
    for (const auto& type : filter.types) {
      if (!joined.empty()) joined += ",";
      joined += type;
    }
    types = joined;
  }

  auto res = TX(t).Work().exec_prepared("next_claimable", filter.shard, filter.model, types);
  if (res.empty()) return std::nullopt;
  return ReadTask(res[0]);
}

Result PgRepository::MarkClaimed(Transaction& t, const std::string& task_id, const std::string& worker_id, uint64_t now_ms) {
  try {
    auto res = TX(t).Work().exec_prepared("mark_claimed", worker_id, Ms(now_ms), task_id);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::Conflict, "task " + task_id + " is no longer queued");
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::TaskRecord> PgRepository::ListRunningByWorker(Transaction& t, const std::string& worker_id) {
  auto res = TX(t).Work().exec_params(
      std::string("SELECT ") + kTaskColumns + " FROM tasks WHERE worker_id=$1 AND state='RUNNING' ORDER BY started_at;", worker_id);

  std::vector<model::TaskRecord> out;
  for (const auto& row : res) out.push_back(ReadTask(row));
  return out;
}

std::map<std::string, uint64_t> PgRepository::CountTasksByState(Transaction& t) {
  auto res = TX(t).Work().exec("SELECT state, COUNT(*) FROM tasks GROUP BY state;");

  std::map<std::string, uint64_t> out;
  for (const auto& row : res) out[Text(row[0])] = U64(row[1]);
  return out;
}

std::map<std::string, uint64_t> PgRepository::CountQueuedByShard(Transaction& t) {
  auto res = TX(t).Work().exec("SELECT COALESCE(shard,''), COUNT(*) FROM tasks WHERE state='QUEUED' GROUP BY COALESCE(shard,'');");

  std::map<std::string, uint64_t> out;
  for (const auto& row : res) out[Text(row[0])] = U64(row[1]);
  return out;
}

// ------------------------------------------------------------------
// Events
// ------------------------------------------------------------------

Result PgRepository::AppendEvent(Transaction& t, const model::EventRecord& r) {
  try {
    TX(t).Work().exec_params("INSERT INTO events(task_id,event_type,actor,payload,trace_id,timestamp) VALUES($1,$2,$3,$4,$5,$6);",
                             Opt(r.task_id), r.event_type, Opt(r.actor), Opt(r.payload), Opt(r.trace_id), Ms(r.timestamp_ms));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::EventRecord> PgRepository::ListEvents(Transaction& t, const std::string& task_id) {
  auto res = TX(t).Work().exec_params(
      "SELECT id,task_id,event_type,actor,payload,trace_id,timestamp FROM events WHERE task_id=$1 ORDER BY id;", task_id);

  std::vector<model::EventRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    model::EventRecord e;
    e.id           = U64(row[0]);
    e.task_id      = Text(row[1]);
    e.event_type   = Text(row[2]);
    e.actor        = Text(row[3]);
    e.payload      = Text(row[4]);
    e.trace_id     = Text(row[5]);
    e.timestamp_ms = U64(row[6]);
    out.push_back(std::move(e));
  }
  return out;
}

// ------------------------------------------------------------------
// Workers
// ------------------------------------------------------------------

Result PgRepository::InsertWorker(Transaction& t, const model::WorkerRecord& r) {
  try {
    TX(t).Work().exec_params(std::string("INSERT INTO workers(") + kWorkerColumns + ") VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10,$11);",
                             r.worker_id, r.pid, Str(taskorch::model::ToString(r.status)), Opt(r.shard), Opt(r.specialization),
                             Opt(r.model), Ms(r.started_at_ms), Ms(r.last_heartbeat_ms), Ms(r.tasks_completed), Ms(r.tasks_failed),
                             static_cast<int>(r.crash_count));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::WorkerRecord> PgRepository::GetWorker(Transaction& t, const std::string& worker_id) {
  auto res = TX(t).Work().exec_params(std::string("SELECT ") + kWorkerColumns + " FROM workers WHERE worker_id=$1;", worker_id);
  if (res.empty()) return std::nullopt;
  return ReadWorker(res[0]);
}

std::vector<model::WorkerRecord> PgRepository::ListWorkers(Transaction& t) {
  auto res = TX(t).Work().exec(std::string("SELECT ") + kWorkerColumns + " FROM workers ORDER BY worker_id;");

  std::vector<model::WorkerRecord> out;
  for (const auto& row : res) out.push_back(ReadWorker(row));
  return out;
}

Result PgRepository::UpdateWorker(Transaction& t, const model::WorkerRecord& r) {
  try {
    auto res = TX(t).Work().exec_params(
        "UPDATE workers SET pid=$2,status=$3,shard=$4,specialization=$5,model=$6,started_at=$7,last_heartbeat=$8,"
        "tasks_completed=$9,tasks_failed=$10,crash_count=$11 WHERE worker_id=$1;",
        r.worker_id, r.pid, Str(taskorch::model::ToString(r.status)), Opt(r.shard), Opt(r.specialization), Opt(r.model),
        Ms(r.started_at_ms), Ms(r.last_heartbeat_ms), Ms(r.tasks_completed), Ms(r.tasks_failed), static_cast<int>(r.crash_count));
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, "worker " + r.worker_id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::UpsertHeartbeat(Transaction& t, const model::HeartbeatRecord& r) {
  try {
    TX(t).Work().exec_params(
        "INSERT INTO worker_heartbeats(worker_id,timestamp,status,task_id,progress_percent,expected_timeout) VALUES($1,$2,$3,$4,$5,$6) "
        "ON CONFLICT(worker_id) DO UPDATE SET timestamp=EXCLUDED.timestamp, status=EXCLUDED.status, task_id=EXCLUDED.task_id, "
        "progress_percent=EXCLUDED.progress_percent, expected_timeout=EXCLUDED.expected_timeout;",
        r.worker_id, Ms(r.timestamp_ms), Opt(r.status), Opt(r.task_id), static_cast<int>(r.progress_percent),
        Ms(r.expected_timeout_seconds));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::HeartbeatRecord> PgRepository::GetHeartbeat(Transaction& t, const std::string& worker_id) {
  auto res = TX(t).Work().exec_params(
      "SELECT worker_id,timestamp,status,task_id,progress_percent,expected_timeout FROM worker_heartbeats WHERE worker_id=$1;", worker_id);
  if (res.empty()) return std::nullopt;

  model::HeartbeatRecord r;
  r.worker_id                = Text(res[0][0]);
  r.timestamp_ms             = U64(res[0][1]);
  r.status                   = Text(res[0][2]);
  r.task_id                  = Text(res[0][3]);
  r.progress_percent         = res[0][4].as<uint32_t>();
  r.expected_timeout_seconds = U64(res[0][5]);
  return r;
}

// ------------------------------------------------------------------
// Consensus
// ------------------------------------------------------------------

Result PgRepository::InsertSession(Transaction& t, const model::ConsensusSessionRecord& r) {
  try {
    TX(t).Work().exec_params(std::string("INSERT INTO consensus_sessions(") + kSessionColumns + ") VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9);",
                             r.id, r.task_id, r.implementer, Str(taskorch::model::ToString(r.final_result)), static_cast<int>(r.required),
                             static_cast<int>(r.approvals), static_cast<int>(r.rejections), Ms(r.created_at_ms), OptMs(r.completed_at_ms));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::ConsensusSessionRecord> PgRepository::GetSession(Transaction& t, const std::string& session_id) {
  auto res = TX(t).Work().exec_params(std::string("SELECT ") + kSessionColumns + " FROM consensus_sessions WHERE id=$1;", session_id);
  if (res.empty()) return std::nullopt;
  return ReadSession(res[0]);
}

std::vector<model::ConsensusSessionRecord> PgRepository::ListSessionsForTask(Transaction& t, const std::string& task_id) {
  auto res = TX(t).Work().exec_params(
      std::string("SELECT ") + kSessionColumns + " FROM consensus_sessions WHERE task_id=$1 ORDER BY created_at, id;", task_id);

  std::vector<model::ConsensusSessionRecord> out;
  for (const auto& row : res) out.push_back(ReadSession(row));
  return out;
}

Result PgRepository::UpdateSession(Transaction& t, const model::ConsensusSessionRecord& r) {
  try {
    auto res = TX(t).Work().exec_params(
        "UPDATE consensus_sessions SET final_result=$2,required=$3,approvals=$4,rejections=$5,completed_at=$6 WHERE id=$1;", r.id,
        Str(taskorch::model::ToString(r.final_result)), static_cast<int>(r.required), static_cast<int>(r.approvals),
        static_cast<int>(r.rejections), OptMs(r.completed_at_ms));
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, "session " + r.id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::UpsertVote(Transaction& t, const model::VoteRecord& r) {
  try {
    TX(t).Work().exec_params(
        "INSERT INTO consensus_votes(session_id,voter,vote,reason,duration_ms,recorded_at) VALUES($1,$2,$3,$4,$5,$6) "
        "ON CONFLICT(session_id, voter) DO UPDATE SET vote=EXCLUDED.vote, reason=EXCLUDED.reason, "
        "duration_ms=EXCLUDED.duration_ms, recorded_at=EXCLUDED.recorded_at;",
        r.session_id, r.voter, Str(taskorch::model::ToString(r.vote)), Opt(r.reason), Ms(r.duration_ms), Ms(r.recorded_at_ms));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::VoteRecord> PgRepository::ListVotes(Transaction& t, const std::string& session_id) {
  auto res = TX(t).Work().exec_params(
      "SELECT session_id,voter,vote,reason,duration_ms,recorded_at FROM consensus_votes WHERE session_id=$1 ORDER BY voter;", session_id);

  std::vector<model::VoteRecord> out;
  for (const auto& row : res) {
    model::VoteRecord v;
    v.session_id     = Text(row[0]);
    v.voter          = Text(row[1]);
    v.vote           = taskorch::model::ParseVoteName(Text(row[2])).value_or(taskorch::v1::VOTE_UNSPECIFIED);
    v.reason         = Text(row[3]);
    v.duration_ms    = U64(row[4]);
    v.recorded_at_ms = U64(row[5]);
    out.push_back(std::move(v));
  }
  return out;
}

// ------------------------------------------------------------------
// Breakers
// ------------------------------------------------------------------

std::optional<model::BreakerRecord> PgRepository::GetBreaker(Transaction& t, const std::string& capability) {
  auto res = TX(t).Work().exec_params(std::string("SELECT ") + kBreakerColumns + " FROM breakers WHERE capability=$1;", capability);
  if (res.empty()) return std::nullopt;
  return ReadBreaker(res[0]);
}

Result PgRepository::UpsertBreaker(Transaction& t, const model::BreakerRecord& r) {
  try {
    TX(t).Work().exec_params(std::string("INSERT INTO breakers(") + kBreakerColumns +
                                 ") VALUES($1,$2,$3,$4,$5,$6,$7) ON CONFLICT(capability) DO UPDATE SET state=EXCLUDED.state, "
                                 "failure_count=EXCLUDED.failure_count, half_open_calls=EXCLUDED.half_open_calls, "
                                 "opened_at=EXCLUDED.opened_at, last_failure=EXCLUDED.last_failure, last_success=EXCLUDED.last_success;",
                             r.capability, Str(taskorch::model::ToString(r.state)), static_cast<int>(r.failure_count),
                             static_cast<int>(r.half_open_calls), OptMs(r.opened_at_ms), OptMs(r.last_failure_ms),
                             OptMs(r.last_success_ms));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::BreakerRecord> PgRepository::ListBreakers(Transaction& t) {
  auto res = TX(t).Work().exec(std::string("SELECT ") + kBreakerColumns + " FROM breakers ORDER BY capability;");

  std::vector<model::BreakerRecord> out;
  for (const auto& row : res) out.push_back(ReadBreaker(row));
  return out;
}

// ------------------------------------------------------------------
// Budget and pool control
// ------------------------------------------------------------------

Result PgRepository::AppendLedger(Transaction& t, const model::LedgerEntry& r) {
  try {
    TX(t).Work().exec_params("INSERT INTO budget_ledger(timestamp,amount,capability,task_id) VALUES($1,$2,$3,$4);", Ms(r.timestamp_ms),
                             r.amount, Opt(r.capability), Opt(r.task_id));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

double PgRepository::SumLedgerSince(Transaction& t, uint64_t since_ms) {
  auto res = TX(t).Work().exec_params("SELECT COALESCE(SUM(amount), 0) FROM budget_ledger WHERE timestamp >= $1;", Ms(since_ms));
  if (res.empty()) return 0.0;
  return res[0][0].as<double>();
}

model::KillSwitchRecord PgRepository::GetKillSwitch(Transaction& t) {
  auto res = TX(t).Work().exec("SELECT active,reason,triggered_at,reset_at,reset_by FROM kill_switch WHERE id=1;");

  model::KillSwitchRecord r;
  if (res.empty()) return r;
  r.active          = res[0][0].as<bool>();
  r.reason          = Text(res[0][1]);
  r.triggered_at_ms = U64(res[0][2]);
  r.reset_at_ms     = U64(res[0][3]);
  r.reset_by        = Text(res[0][4]);
  return r;
}

Result PgRepository::PutKillSwitch(Transaction& t, const model::KillSwitchRecord& r) {
  try {
    TX(t).Work().exec_params(
        "INSERT INTO kill_switch(id,active,reason,triggered_at,reset_at,reset_by) VALUES(1,$1,$2,$3,$4,$5) "
        "ON CONFLICT(id) DO UPDATE SET active=EXCLUDED.active, reason=EXCLUDED.reason, triggered_at=EXCLUDED.triggered_at, "
        "reset_at=EXCLUDED.reset_at, reset_by=EXCLUDED.reset_by;",
        r.active, Opt(r.reason), OptMs(r.triggered_at_ms), OptMs(r.reset_at_ms), Opt(r.reset_by));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

model::PauseRecord PgRepository::GetPause(Transaction& t) {
  auto res = TX(t).Work().exec("SELECT paused,reason,requested_at FROM pool_control WHERE id=1;");

  model::PauseRecord r;
  if (res.empty()) return r;
  r.paused          = res[0][0].as<bool>();
  r.reason          = Text(res[0][1]);
  r.requested_at_ms = U64(res[0][2]);
  return r;
}

Result PgRepository::PutPause(Transaction& t, const model::PauseRecord& r) {
  try {
    TX(t).Work().exec_params(
        "INSERT INTO pool_control(id,paused,reason,requested_at) VALUES(1,$1,$2,$3) "
        "ON CONFLICT(id) DO UPDATE SET paused=EXCLUDED.paused, reason=EXCLUDED.reason, requested_at=EXCLUDED.requested_at;",
        r.paused, Opt(r.reason), OptMs(r.requested_at_ms));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

} // namespace taskorch::db::postgres
