#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <stdexcept>

#include "internal/model/enums.hpp"
#include "internal/model/state_machine.hpp"
#include "internal/model/worker_status.hpp"

namespace taskorch::db::sqlite {

using taskorch::db::ErrorCode;
using taskorch::db::Result;

namespace {

// Finalizes on every return path.
struct Stmt {
  sqlite3_stmt* st = nullptr;
  ~Stmt() {
    if (st) sqlite3_finalize(st);
  }
};

bool Prepare(sqlite3* db, const std::string& sql, Stmt& stmt) {
  return sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt.st, nullptr) == SQLITE_OK;
}

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindText(sqlite3_stmt* st, int idx, std::string_view s) {
  sqlite3_bind_text(st, idx, s.data(), static_cast<int>(s.size()), SQLITE_TRANSIENT);
}

// Empty string is stored as NULL ("any shard", "no worker").
void BindOptText(sqlite3_stmt* st, int idx, const std::string& s) {
  if (s.empty()) {
    sqlite3_bind_null(st, idx);
  } else {
    BindText(st, idx, s);
  }
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

// Zero timestamp is stored as NULL.
void BindOptU64(sqlite3_stmt* st, int idx, uint64_t v) {
  if (v == 0) {
    sqlite3_bind_null(st, idx);
  } else {
    BindU64(st, idx, v);
  }
}

void BindI64(sqlite3_stmt* st, int idx, int64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindI32(sqlite3_stmt* st, int idx, int v) {
  sqlite3_bind_int(st, idx, v);
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

int64_t ColI64(sqlite3_stmt* st, int col) {
  return static_cast<int64_t>(sqlite3_column_int64(st, col));
}

int ColI32(sqlite3_stmt* st, int col) {
  return sqlite3_column_int(st, col);
}

constexpr const char* kTaskColumns =
    "id,name,type,priority,state,lane,shard,assigned_model,worker_id,payload,result,error,feedback,trace_id,"
    "retry_count,max_retries,created_at,updated_at,started_at,heartbeat_at,completed_at";

model::TaskRecord ReadTask(sqlite3_stmt* st) {
  model::TaskRecord r;
  r.id              = ColText(st, 0);
  r.name            = ColText(st, 1);
  r.type            = ColText(st, 2);
  r.priority        = static_cast<taskorch::v1::Priority>(ColI32(st, 3));
  r.state           = taskorch::model::ParseTaskState(ColText(st, 4)).value_or(taskorch::v1::TASK_STATE_UNSPECIFIED);
  r.lane            = ColText(st, 5);
  r.shard           = ColText(st, 6);
  r.assigned_model  = ColText(st, 7);
  r.worker_id       = ColText(st, 8);
  r.payload         = ColText(st, 9);
  r.result          = ColText(st, 10);
  r.error           = ColText(st, 11);
  r.feedback        = ColText(st, 12);
  r.trace_id        = ColText(st, 13);
  r.retry_count     = static_cast<uint32_t>(ColI32(st, 14));
  r.max_retries     = static_cast<uint32_t>(ColI32(st, 15));
  r.created_at_ms   = ColU64(st, 16);
  r.updated_at_ms   = ColU64(st, 17);
  r.started_at_ms   = ColU64(st, 18);
  r.heartbeat_at_ms = ColU64(st, 19);
  r.completed_at_ms = ColU64(st, 20);
  return r;
}

constexpr const char* kWorkerColumns =
    "worker_id,pid,status,shard,specialization,model,started_at,last_heartbeat,tasks_completed,tasks_failed,crash_count";

model::WorkerRecord ReadWorker(sqlite3_stmt* st) {
  model::WorkerRecord r;
  r.worker_id         = ColText(st, 0);
  r.pid               = ColI64(st, 1);
  r.status            = taskorch::model::ParseWorkerStatus(ColText(st, 2)).value_or(taskorch::v1::WORKER_STATUS_UNSPECIFIED);
  r.shard             = ColText(st, 3);
  r.specialization    = ColText(st, 4);
  r.model             = ColText(st, 5);
  r.started_at_ms     = ColU64(st, 6);
  r.last_heartbeat_ms = ColU64(st, 7);
  r.tasks_completed   = ColU64(st, 8);
  r.tasks_failed      = ColU64(st, 9);
  r.crash_count       = static_cast<uint32_t>(ColI32(st, 10));
  return r;
}

constexpr const char* kSessionColumns = "id,task_id,implementer,final_result,required,approvals,rejections,created_at,completed_at";

model::ConsensusSessionRecord ReadSession(sqlite3_stmt* st) {
  model::ConsensusSessionRecord r;
  r.id              = ColText(st, 0);
  r.task_id         = ColText(st, 1);
  r.implementer     = ColText(st, 2);
  r.final_result    = taskorch::model::ParseConsensusResult(ColText(st, 3)).value_or(taskorch::v1::CONSENSUS_RESULT_UNSPECIFIED);
  r.required        = static_cast<uint32_t>(ColI32(st, 4));
  r.approvals       = static_cast<uint32_t>(ColI32(st, 5));
  r.rejections      = static_cast<uint32_t>(ColI32(st, 6));
  r.created_at_ms   = ColU64(st, 7);
  r.completed_at_ms = ColU64(st, 8);
  return r;
}

constexpr const char* kBreakerColumns = "capability,state,failure_count,half_open_calls,opened_at,last_failure,last_success";

model::BreakerRecord ReadBreaker(sqlite3_stmt* st) {
  model::BreakerRecord r;
  r.capability      = ColText(st, 0);
  r.state           = taskorch::model::ParseBreakerState(ColText(st, 1));
  r.failure_count   = static_cast<uint32_t>(ColI32(st, 2));
  r.half_open_calls = static_cast<uint32_t>(ColI32(st, 3));
  r.opened_at_ms    = ColU64(st, 4);
  r.last_failure_ms = ColU64(st, 5);
  r.last_success_ms = ColU64(st, 6);
  return r;
}

// Binds the 21 task columns in kTaskColumns order starting at idx 1.
void BindTask(sqlite3_stmt* st, const model::TaskRecord& r) {
  BindText(st, 1, r.id);
  BindText(st, 2, r.name);
  BindText(st, 3, r.type);
  BindI32(st, 4, static_cast<int>(r.priority));
  BindText(st, 5, taskorch::model::ToString(r.state));
  BindOptText(st, 6, r.lane);
  BindOptText(st, 7, r.shard);
  BindOptText(st, 8, r.assigned_model);
  BindOptText(st, 9, r.worker_id);
  BindOptText(st, 10, r.payload);
  BindOptText(st, 11, r.result);
  BindOptText(st, 12, r.error);
  BindOptText(st, 13, r.feedback);
  BindOptText(st, 14, r.trace_id);
  BindI32(st, 15, static_cast<int>(r.retry_count));
  BindI32(st, 16, static_cast<int>(r.max_retries));
  BindU64(st, 17, r.created_at_ms);
  BindU64(st, 18, r.updated_at_ms);
  BindOptU64(st, 19, r.started_at_ms);
  BindOptU64(st, 20, r.heartbeat_at_ms);
  BindOptU64(st, 21, r.completed_at_ms);
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
    return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
        return Result::Ok();

    switch (rc & 0xFF) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT: {
            // duplicate primary key vs. CHECK / trigger rejection
            const int ext = sqlite3_extended_errcode(db);
            if (ext == SQLITE_CONSTRAINT_PRIMARYKEY || ext == SQLITE_CONSTRAINT_UNIQUE)
                return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
            return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
        }
        case SQLITE_IOERR:
            return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
        case SQLITE_CORRUPT:
            return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
}

// ------------------------------------------------------------------
// Tasks
// ------------------------------------------------------------------

Result SqliteRepository::InsertTask(Transaction& t, const model::TaskRecord& r) {
    auto* db = TX(t).Handle();

    const std::string sql = std::string("INSERT INTO tasks(") + kTaskColumns +
                            ") VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?);";

    Stmt stmt;
    if (!Prepare(db, sql, stmt)) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindTask(stmt.st, r);
    return Translate(db, sqlite3_step(stmt.st));
}

std::optional<model::TaskRecord> SqliteRepository::GetTask(Transaction& t, const std::string& id) {
    auto* db = TX(t).Handle();

    Stmt stmt;
    if (!Prepare(db, std::string("SELECT ") + kTaskColumns + " FROM tasks WHERE id=?;", stmt))
        return std::nullopt;

    BindText(stmt.st, 1, id);
    if (sqlite3_step(stmt.st) != SQLITE_ROW) return std::nullopt;
    return ReadTask(stmt.st);
}

std::vector<model::TaskRecord> SqliteRepository::ListTasks(Transaction& t, std::optional<taskorch::v1::TaskState> state, uint32_t limit) {
    auto* db = TX(t).Handle();

    std::string sql = std::string("SELECT ") + kTaskColumns + " FROM tasks";
    if (state) sql += " WHERE state=?1";
    sql += " ORDER BY created_at DESC, rowid DESC";
    if (limit > 0) sql += " LIMIT " + std::to_string(limit);
    sql += ";";

    std::vector<model::TaskRecord> out;
    Stmt stmt;
    if (!Prepare(db, sql, stmt)) return out;
    if (state) BindText(stmt.st, 1, taskorch::model::ToString(*state));

    while (sqlite3_step(stmt.st) == SQLITE_ROW) out.push_back(ReadTask(stmt.st));
    return out;
}

Result SqliteRepository::UpdateTask(Transaction& t, const model::TaskRecord& r) {
    auto* db = TX(t).Handle();

    const char* sql =
        "UPDATE tasks SET name=?2,type=?3,priority=?4,state=?5,lane=?6,shard=?7,assigned_model=?8,worker_id=?9,"
        "payload=?10,result=?11,error=?12,feedback=?13,trace_id=?14,retry_count=?15,max_retries=?16,"
        "created_at=?17,updated_at=?18,started_at=?19,heartbeat_at=?20,completed_at=?21 WHERE id=?1;";

    Stmt stmt;
    if (!Prepare(db, sql, stmt)) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindTask(stmt.st, r);
    int rc = sqlite3_step(stmt.st);
    if (rc != SQLITE_DONE) return Translate(db, rc);
    if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "task " + r.id);
    return Result::Ok();
}

std::optional<model::TaskRecord> SqliteRepository::NextClaimable(Transaction& t, const ClaimFilter& filter) {
    auto* db = TX(t).Handle();

    std::string sql = std::string("SELECT ") + kTaskColumns +
                      " FROM tasks WHERE state='QUEUED'"
                      " AND (?1 IS NULL OR shard IS NULL OR shard=?1)"
                      " AND (?2 IS NULL OR assigned_model IS NULL OR assigned_model=?2)";
    if (!filter.types.empty()) {
        sql += " AND type IN (";
        for (size_t i = 0; i < filter.types.size(); ++i) {
            sql += (i == 0 ? "?" : ",?") + std::to_string(i + 3);
        }
        sql += ")";
    }
    sql += " ORDER BY priority ASC, created_at ASC, rowid ASC LIMIT 1;";

    Stmt stmt;
    if (!Prepare(db, sql, stmt)) return std::nullopt;

    if (filter.shard) BindText(stmt.st, 1, *filter.shard);
    else sqlite3_bind_null(stmt.st, 1);
    if (filter.model) BindText(stmt.st, 2, *filter.model);
    else sqlite3_bind_null(stmt.st, 2);
    for (size_t i = 0; i < filter.types.size(); ++i) {
        BindText(stmt.st, static_cast<int>(i + 3), filter.types[i]);
    }

    if (sqlite3_step(stmt.st) != SQLITE_ROW) return std::nullopt;
    return ReadTask(stmt.st);
}

Result SqliteRepository::MarkClaimed(Transaction& t, const std::string& task_id, const std::string& worker_id, uint64_t now_ms) {
    auto* db = TX(t).Handle();

    const char* sql =
        "UPDATE tasks SET state='RUNNING', worker_id=?1, started_at=?2, heartbeat_at=?2, updated_at=?2"
        " WHERE id=?3 AND state='QUEUED';";

    Stmt stmt;
    if (!Prepare(db, sql, stmt)) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(stmt.st, 1, worker_id);
    BindU64(stmt.st, 2, now_ms);
    BindText(stmt.st, 3, task_id);

    int rc = sqlite3_step(stmt.st);
    if (rc != SQLITE_DONE) return Translate(db, rc);
    if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::Conflict, "task " + task_id + " is no longer queued");
    return Result::Ok();
}

std::vector<model::TaskRecord> SqliteRepository::ListRunningByWorker(Transaction& t, const std::string& worker_id) {
    auto* db = TX(t).Handle();

    std::vector<model::TaskRecord> out;
    Stmt stmt;
    if (!Prepare(db, std::string("SELECT ") + kTaskColumns + " FROM tasks WHERE worker_id=? AND state='RUNNING' ORDER BY started_at;", stmt))
        return out;

    BindText(stmt.st, 1, worker_id);
    while (sqlite3_step(stmt.st) == SQLITE_ROW) out.push_back(ReadTask(stmt.st));
    return out;
}

std::map<std::string, uint64_t> SqliteRepository::CountTasksByState(Transaction& t) {
    auto* db = TX(t).Handle();

    std::map<std::string, uint64_t> out;
    Stmt stmt;
    if (!Prepare(db, "SELECT state, COUNT(*) FROM tasks GROUP BY state;", stmt)) return out;
    while (sqlite3_step(stmt.st) == SQLITE_ROW) out[ColText(stmt.st, 0)] = ColU64(stmt.st, 1);
    return out;
}

std::map<std::string, uint64_t> SqliteRepository::CountQueuedByShard(Transaction& t) {
    auto* db = TX(t).Handle();

    std::map<std::string, uint64_t> out;
    Stmt stmt;
    if (!Prepare(db, "SELECT COALESCE(shard,''), COUNT(*) FROM tasks WHERE state='QUEUED' GROUP BY COALESCE(shard,'');", stmt))
        return out;
    while (sqlite3_step(stmt.st) == SQLITE_ROW) out[ColText(stmt.st, 0)] = ColU64(stmt.st, 1);
    return out;
}

// ------------------------------------------------------------------
// Events
// ------------------------------------------------------------------

Result SqliteRepository::AppendEvent(Transaction& t, const model::EventRecord& r) {
    auto* db = TX(t).Handle();

    Stmt stmt;
    if (!Prepare(db, "INSERT INTO events(task_id,event_type,actor,payload,trace_id,timestamp) VALUES(?,?,?,?,?,?);", stmt))
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindOptText(stmt.st, 1, r.task_id);
    BindText(stmt.st, 2, r.event_type);
    BindOptText(stmt.st, 3, r.actor);
    BindOptText(stmt.st, 4, r.payload);
    BindOptText(stmt.st, 5, r.trace_id);
    BindU64(stmt.st, 6, r.timestamp_ms);
    return Translate(db, sqlite3_step(stmt.st));
}

std::vector<model::EventRecord> SqliteRepository::ListEvents(Transaction& t, const std::string& task_id) {
    auto* db = TX(t).Handle();

    std::vector<model::EventRecord> out;
    Stmt stmt;
    if (!Prepare(db, "SELECT id,task_id,event_type,actor,payload,trace_id,timestamp FROM events WHERE task_id=? ORDER BY id;", stmt))
        return out;

    BindText(stmt.st, 1, task_id);
    while (sqlite3_step(stmt.st) == SQLITE_ROW) {
        model::EventRecord e;
        e.id           = ColU64(stmt.st, 0);
        e.task_id      = ColText(stmt.st, 1);
        e.event_type   = ColText(stmt.st, 2);
        e.actor        = ColText(stmt.st, 3);
        e.payload      = ColText(stmt.st, 4);
        e.trace_id     = ColText(stmt.st, 5);
        e.timestamp_ms = ColU64(stmt.st, 6);
        out.push_back(std::move(e));
    }
    return out;
}

// ------------------------------------------------------------------
// Workers
// ------------------------------------------------------------------

Result SqliteRepository::InsertWorker(Transaction& t, const model::WorkerRecord& r) {
    auto* db = TX(t).Handle();

    const std::string sql = std::string("INSERT INTO workers(") + kWorkerColumns + ") VALUES(?,?,?,?,?,?,?,?,?,?,?);";
    Stmt stmt;
    if (!Prepare(db, sql, stmt)) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(stmt.st, 1, r.worker_id);
    BindI64(stmt.st, 2, r.pid);
    BindText(stmt.st, 3, taskorch::model::ToString(r.status));
    BindOptText(stmt.st, 4, r.shard);
    BindOptText(stmt.st, 5, r.specialization);
    BindOptText(stmt.st, 6, r.model);
    BindU64(stmt.st, 7, r.started_at_ms);
    BindU64(stmt.st, 8, r.last_heartbeat_ms);
    BindU64(stmt.st, 9, r.tasks_completed);
    BindU64(stmt.st, 10, r.tasks_failed);
    BindI32(stmt.st, 11, static_cast<int>(r.crash_count));
    return Translate(db, sqlite3_step(stmt.st));
}

std::optional<model::WorkerRecord> SqliteRepository::GetWorker(Transaction& t, const std::string& worker_id) {
    auto* db = TX(t).Handle();

    Stmt stmt;
    if (!Prepare(db, std::string("SELECT ") + kWorkerColumns + " FROM workers WHERE worker_id=?;", stmt)) return std::nullopt;

    BindText(stmt.st, 1, worker_id);
    if (sqlite3_step(stmt.st) != SQLITE_ROW) return std::nullopt;
    return ReadWorker(stmt.st);
}

std::vector<model::WorkerRecord> SqliteRepository::ListWorkers(Transaction& t) {
    auto* db = TX(t).Handle();

    std::vector<model::WorkerRecord> out;
    Stmt stmt;
    if (!Prepare(db, std::string("SELECT ") + kWorkerColumns + " FROM workers ORDER BY worker_id;", stmt)) return out;
    while (sqlite3_step(stmt.st) == SQLITE_ROW) out.push_back(ReadWorker(stmt.st));
    return out;
}

Result SqliteRepository::UpdateWorker(Transaction& t, const model::WorkerRecord& r) {
    auto* db = TX(t).Handle();

    const char* sql =
        "UPDATE workers SET pid=?2,status=?3,shard=?4,specialization=?5,model=?6,started_at=?7,last_heartbeat=?8,"
        "tasks_completed=?9,tasks_failed=?10,crash_count=?11 WHERE worker_id=?1;";

    Stmt stmt;
    if (!Prepare(db, sql, stmt)) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(stmt.st, 1, r.worker_id);
    BindI64(stmt.st, 2, r.pid);
    BindText(stmt.st, 3, taskorch::model::ToString(r.status));
    BindOptText(stmt.st, 4, r.shard);
    BindOptText(stmt.st, 5, r.specialization);
    BindOptText(stmt.st, 6, r.model);
    BindU64(stmt.st, 7, r.started_at_ms);
    BindU64(stmt.st, 8, r.last_heartbeat_ms);
    BindU64(stmt.st, 9, r.tasks_completed);
    BindU64(stmt.st, 10, r.tasks_failed);
    BindI32(stmt.st, 11, static_cast<int>(r.crash_count));

    int rc = sqlite3_step(stmt.st);
    if (rc != SQLITE_DONE) return Translate(db, rc);
    if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "worker " + r.worker_id);
    return Result::Ok();
}

Result SqliteRepository::UpsertHeartbeat(Transaction& t, const model::HeartbeatRecord& r) {
    auto* db = TX(t).Handle();

    const char* sql =
        "INSERT INTO worker_heartbeats(worker_id,timestamp,status,task_id,progress_percent,expected_timeout) VALUES(?,?,?,?,?,?) "
        "ON CONFLICT(worker_id) DO UPDATE SET timestamp=excluded.timestamp, status=excluded.status, task_id=excluded.task_id, "
        "progress_percent=excluded.progress_percent, expected_timeout=excluded.expected_timeout;";

    Stmt stmt;
    if (!Prepare(db, sql, stmt)) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(stmt.st, 1, r.worker_id);
    BindU64(stmt.st, 2, r.timestamp_ms);
    BindOptText(stmt.st, 3, r.status);
    BindOptText(stmt.st, 4, r.task_id);
    BindI32(stmt.st, 5, static_cast<int>(r.progress_percent));
    BindU64(stmt.st, 6, r.expected_timeout_seconds);
    return Translate(db, sqlite3_step(stmt.st));
}

std::optional<model::HeartbeatRecord> SqliteRepository::GetHeartbeat(Transaction& t, const std::string& worker_id) {
    auto* db = TX(t).Handle();

    Stmt stmt;
    if (!Prepare(db, "SELECT worker_id,timestamp,status,task_id,progress_percent,expected_timeout FROM worker_heartbeats WHERE worker_id=?;", stmt))
        return std::nullopt;

    BindText(stmt.st, 1, worker_id);
    if (sqlite3_step(stmt.st) != SQLITE_ROW) return std::nullopt;

    model::HeartbeatRecord r;
    r.worker_id                = ColText(stmt.st, 0);
    r.timestamp_ms             = ColU64(stmt.st, 1);
    r.status                   = ColText(stmt.st, 2);
    r.task_id                  = ColText(stmt.st, 3);
    r.progress_percent         = static_cast<uint32_t>(ColI32(stmt.st, 4));
    r.expected_timeout_seconds = ColU64(stmt.st, 5);
    return r;
}

// ------------------------------------------------------------------
// Consensus
// ------------------------------------------------------------------

Result SqliteRepository::InsertSession(Transaction& t, const model::ConsensusSessionRecord& r) {
    auto* db = TX(t).Handle();

    const std::string sql = std::string("INSERT INTO consensus_sessions(") + kSessionColumns + ") VALUES(?,?,?,?,?,?,?,?,?);";
    Stmt stmt;
    if (!Prepare(db, sql, stmt)) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(stmt.st, 1, r.id);
    BindText(stmt.st, 2, r.task_id);
    BindText(stmt.st, 3, r.implementer);
    BindText(stmt.st, 4, taskorch::model::ToString(r.final_result));
    BindI32(stmt.st, 5, static_cast<int>(r.required));
    BindI32(stmt.st, 6, static_cast<int>(r.approvals));
    BindI32(stmt.st, 7, static_cast<int>(r.rejections));
    BindU64(stmt.st, 8, r.created_at_ms);
    BindOptU64(stmt.st, 9, r.completed_at_ms);
    return Translate(db, sqlite3_step(stmt.st));
}

std::optional<model::ConsensusSessionRecord> SqliteRepository::GetSession(Transaction& t, const std::string& session_id) {
    auto* db = TX(t).Handle();

    Stmt stmt;
    if (!Prepare(db, std::string("SELECT ") + kSessionColumns + " FROM consensus_sessions WHERE id=?;", stmt)) return std::nullopt;

    BindText(stmt.st, 1, session_id);
    if (sqlite3_step(stmt.st) != SQLITE_ROW) return std::nullopt;
    return ReadSession(stmt.st);
}

std::vector<model::ConsensusSessionRecord> SqliteRepository::ListSessionsForTask(Transaction& t, const std::string& task_id) {
    auto* db = TX(t).Handle();

    std::vector<model::ConsensusSessionRecord> out;
    Stmt stmt;
    if (!Prepare(db, std::string("SELECT ") + kSessionColumns + " FROM consensus_sessions WHERE task_id=? ORDER BY created_at, rowid;", stmt))
        return out;

    BindText(stmt.st, 1, task_id);
    while (sqlite3_step(stmt.st) == SQLITE_ROW) out.push_back(ReadSession(stmt.st));
    return out;
}

Result SqliteRepository::UpdateSession(Transaction& t, const model::ConsensusSessionRecord& r) {
    auto* db = TX(t).Handle();

    const char* sql = "UPDATE consensus_sessions SET final_result=?2,required=?3,approvals=?4,rejections=?5,completed_at=?6 WHERE id=?1;";
    Stmt stmt;
    if (!Prepare(db, sql, stmt)) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(stmt.st, 1, r.id);
    BindText(stmt.st, 2, taskorch::model::ToString(r.final_result));
    BindI32(stmt.st, 3, static_cast<int>(r.required));
    BindI32(stmt.st, 4, static_cast<int>(r.approvals));
    BindI32(stmt.st, 5, static_cast<int>(r.rejections));
    BindOptU64(stmt.st, 6, r.completed_at_ms);

    int rc = sqlite3_step(stmt.st);
    if (rc != SQLITE_DONE) return Translate(db, rc);
    if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "session " + r.id);
    return Result::Ok();
}

Result SqliteRepository::UpsertVote(Transaction& t, const model::VoteRecord& r) {
    auto* db = TX(t).Handle();

    const char* sql =
        "INSERT INTO consensus_votes(session_id,voter,vote,reason,duration_ms,recorded_at) VALUES(?,?,?,?,?,?) "
        "ON CONFLICT(session_id, voter) DO UPDATE SET vote=excluded.vote, reason=excluded.reason, "
        "duration_ms=excluded.duration_ms, recorded_at=excluded.recorded_at;";

    Stmt stmt;
    if (!Prepare(db, sql, stmt)) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(stmt.st, 1, r.session_id);
    BindText(stmt.st, 2, r.voter);
    BindText(stmt.st, 3, taskorch::model::ToString(r.vote));
    BindOptText(stmt.st, 4, r.reason);
    BindU64(stmt.st, 5, r.duration_ms);
    BindU64(stmt.st, 6, r.recorded_at_ms);
    return Translate(db, sqlite3_step(stmt.st));
}

std::vector<model::VoteRecord> SqliteRepository::ListVotes(Transaction& t, const std::string& session_id) {
    auto* db = TX(t).Handle();

    std::vector<model::VoteRecord> out;
    Stmt stmt;
    if (!Prepare(db, "SELECT session_id,voter,vote,reason,duration_ms,recorded_at FROM consensus_votes WHERE session_id=? ORDER BY voter;", stmt))
        return out;

    BindText(stmt.st, 1, session_id);
    while (sqlite3_step(stmt.st) == SQLITE_ROW) {
        model::VoteRecord v;
        v.session_id     = ColText(stmt.st, 0);
        v.voter          = ColText(stmt.st, 1);
        v.vote           = taskorch::model::ParseVoteName(ColText(stmt.st, 2)).value_or(taskorch::v1::VOTE_UNSPECIFIED);
        v.reason         = ColText(stmt.st, 3);
        v.duration_ms    = ColU64(stmt.st, 4);
        v.recorded_at_ms = ColU64(stmt.st, 5);
        out.push_back(std::move(v));
    }
    return out;
}

// ------------------------------------------------------------------
// Breakers
// ------------------------------------------------------------------

std::optional<model::BreakerRecord> SqliteRepository::GetBreaker(Transaction& t, const std::string& capability) {
    auto* db = TX(t).Handle();

    Stmt stmt;
    if (!Prepare(db, std::string("SELECT ") + kBreakerColumns + " FROM breakers WHERE capability=?;", stmt)) return std::nullopt;

    BindText(stmt.st, 1, capability);
    if (sqlite3_step(stmt.st) != SQLITE_ROW) return std::nullopt;
    return ReadBreaker(stmt.st);
}

Result SqliteRepository::UpsertBreaker(Transaction& t, const model::BreakerRecord& r) {
    auto* db = TX(t).Handle();

    const std::string sql = std::string("INSERT INTO breakers(") + kBreakerColumns +
                            ") VALUES(?,?,?,?,?,?,?) ON CONFLICT(capability) DO UPDATE SET state=excluded.state, "
                            "failure_count=excluded.failure_count, half_open_calls=excluded.half_open_calls, "
                            "opened_at=excluded.opened_at, last_failure=excluded.last_failure, last_success=excluded.last_success;";

    Stmt stmt;
    if (!Prepare(db, sql, stmt)) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(stmt.st, 1, r.capability);
    BindText(stmt.st, 2, taskorch::model::ToString(r.state));
    BindI32(stmt.st, 3, static_cast<int>(r.failure_count));
    BindI32(stmt.st, 4, static_cast<int>(r.half_open_calls));
    BindOptU64(stmt.st, 5, r.opened_at_ms);
    BindOptU64(stmt.st, 6, r.last_failure_ms);
    BindOptU64(stmt.st, 7, r.last_success_ms);
    return Translate(db, sqlite3_step(stmt.st));
}

std::vector<model::BreakerRecord> SqliteRepository::ListBreakers(Transaction& t) {
    auto* db = TX(t).Handle();

    std::vector<model::BreakerRecord> out;
    Stmt stmt;
    if (!Prepare(db, std::string("SELECT ") + kBreakerColumns + " FROM breakers ORDER BY capability;", stmt)) return out;
    while (sqlite3_step(stmt.st) == SQLITE_ROW) out.push_back(ReadBreaker(stmt.st));
    return out;
}

// ------------------------------------------------------------------
// Budget and pool control
// ------------------------------------------------------------------

Result SqliteRepository::AppendLedger(Transaction& t, const model::LedgerEntry& r) {
    auto* db = TX(t).Handle();

    Stmt stmt;
    if (!Prepare(db, "INSERT INTO budget_ledger(timestamp,amount,capability,task_id) VALUES(?,?,?,?);", stmt))
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindU64(stmt.st, 1, r.timestamp_ms);
    sqlite3_bind_double(stmt.st, 2, r.amount);
    BindOptText(stmt.st, 3, r.capability);
    BindOptText(stmt.st, 4, r.task_id);
    return Translate(db, sqlite3_step(stmt.st));
}

double SqliteRepository::SumLedgerSince(Transaction& t, uint64_t since_ms) {
    auto* db = TX(t).Handle();

    Stmt stmt;
    if (!Prepare(db, "SELECT COALESCE(SUM(amount), 0) FROM budget_ledger WHERE timestamp >= ?;", stmt))
        throw std::runtime_error(std::string("sum ledger: ") + sqlite3_errmsg(db));

    BindU64(stmt.st, 1, since_ms);
    if (sqlite3_step(stmt.st) != SQLITE_ROW) return 0.0;
    return sqlite3_column_double(stmt.st, 0);
}

model::KillSwitchRecord SqliteRepository::GetKillSwitch(Transaction& t) {
    auto* db = TX(t).Handle();

    model::KillSwitchRecord r;
    Stmt stmt;
    if (!Prepare(db, "SELECT active,reason,triggered_at,reset_at,reset_by FROM kill_switch WHERE id=1;", stmt))
        throw std::runtime_error(std::string("read kill switch: ") + sqlite3_errmsg(db));

    if (sqlite3_step(stmt.st) == SQLITE_ROW) {
        r.active          = ColI32(stmt.st, 0) != 0;
        r.reason          = ColText(stmt.st, 1);
        r.triggered_at_ms = ColU64(stmt.st, 2);
        r.reset_at_ms     = ColU64(stmt.st, 3);
        r.reset_by        = ColText(stmt.st, 4);
    }
    return r;
}

Result SqliteRepository::PutKillSwitch(Transaction& t, const model::KillSwitchRecord& r) {
    auto* db = TX(t).Handle();

    const char* sql =
        "INSERT INTO kill_switch(id,active,reason,triggered_at,reset_at,reset_by) VALUES(1,?,?,?,?,?) "
        "ON CONFLICT(id) DO UPDATE SET active=excluded.active, reason=excluded.reason, triggered_at=excluded.triggered_at, "
        "reset_at=excluded.reset_at, reset_by=excluded.reset_by;";

    Stmt stmt;
    if (!Prepare(db, sql, stmt)) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindI32(stmt.st, 1, r.active ? 1 : 0);
    BindOptText(stmt.st, 2, r.reason);
    BindOptU64(stmt.st, 3, r.triggered_at_ms);
    BindOptU64(stmt.st, 4, r.reset_at_ms);
    BindOptText(stmt.st, 5, r.reset_by);
    return Translate(db, sqlite3_step(stmt.st));
}

model::PauseRecord SqliteRepository::GetPause(Transaction& t) {
    auto* db = TX(t).Handle();

    model::PauseRecord r;
    Stmt stmt;
    if (!Prepare(db, "SELECT paused,reason,requested_at FROM pool_control WHERE id=1;", stmt))
        throw std::runtime_error(std::string("read pause flag: ") + sqlite3_errmsg(db));

    if (sqlite3_step(stmt.st) == SQLITE_ROW) {
        r.paused          = ColI32(stmt.st, 0) != 0;
        r.reason          = ColText(stmt.st, 1);
        r.requested_at_ms = ColU64(stmt.st, 2);
    }
    return r;
}

Result SqliteRepository::PutPause(Transaction& t, const model::PauseRecord& r) {
    auto* db = TX(t).Handle();

    const char* sql =
        "INSERT INTO pool_control(id,paused,reason,requested_at) VALUES(1,?,?,?) "
        "ON CONFLICT(id) DO UPDATE SET paused=excluded.paused, reason=excluded.reason, requested_at=excluded.requested_at;";

    Stmt stmt;
    if (!Prepare(db, sql, stmt)) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindI32(stmt.st, 1, r.paused ? 1 : 0);
    BindOptText(stmt.st, 2, r.reason);
    BindOptU64(stmt.st, 3, r.requested_at_ms);
    return Translate(db, sqlite3_step(stmt.st));
}

} // namespace taskorch::db::sqlite
