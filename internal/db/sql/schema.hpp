#pragma once

#include <string>
#include <vector>

namespace taskorch::db::sql {

/*
  Canonical schema, one statement per entry.

  Every statement is idempotent so it can run on each startup.
  Timestamps are unix milliseconds. States are stored by name
  (see internal/model) so the audit trail reads without a decoder.

  The workers trigger mirrors model::CanTransition(WorkerStatus, WorkerStatus);
  the tasks trigger makes terminal rows immutable.
*/

inline const std::vector<std::string>& SqliteSchema() {
  static const std::vector<std::string> kSchema = {
      "CREATE TABLE IF NOT EXISTS tasks ("
      " id TEXT PRIMARY KEY, name TEXT NOT NULL, type TEXT NOT NULL,"
      " priority INTEGER NOT NULL DEFAULT 2 CHECK (priority BETWEEN 0 AND 3),"
      " state TEXT NOT NULL DEFAULT 'QUEUED' CHECK (state IN"
      " ('QUEUED','RUNNING','REVIEW','APPROVED','REJECTED','COMPLETED','FAILED','ESCALATED','CANCELLED')),"
      " lane TEXT, shard TEXT, assigned_model TEXT, worker_id TEXT,"
      " payload TEXT, result TEXT, error TEXT, feedback TEXT, trace_id TEXT,"
      " retry_count INTEGER NOT NULL DEFAULT 0, max_retries INTEGER NOT NULL DEFAULT 3,"
      " created_at INTEGER NOT NULL, updated_at INTEGER NOT NULL,"
      " started_at INTEGER, heartbeat_at INTEGER, completed_at INTEGER);",
      "CREATE INDEX IF NOT EXISTS idx_tasks_claim ON tasks(state, priority, created_at);",
      "CREATE INDEX IF NOT EXISTS idx_tasks_worker ON tasks(worker_id, state);",
      "CREATE TRIGGER IF NOT EXISTS tasks_terminal_immutable BEFORE UPDATE ON tasks"
      " WHEN OLD.state IN ('COMPLETED','FAILED','ESCALATED','CANCELLED')"
      " BEGIN SELECT RAISE(ABORT, 'task is in a terminal state'); END;",

      "CREATE TABLE IF NOT EXISTS workers ("
      " worker_id TEXT PRIMARY KEY, pid INTEGER NOT NULL DEFAULT 0,"
      " status TEXT NOT NULL DEFAULT 'starting' CHECK (status IN"
      " ('starting','idle','busy','paused','stopping','dead','crashed')),"
      " shard TEXT, specialization TEXT, model TEXT,"
      " started_at INTEGER NOT NULL, last_heartbeat INTEGER NOT NULL,"
      " tasks_completed INTEGER NOT NULL DEFAULT 0, tasks_failed INTEGER NOT NULL DEFAULT 0,"
      " crash_count INTEGER NOT NULL DEFAULT 0);",
      "CREATE TRIGGER IF NOT EXISTS workers_initial_status BEFORE INSERT ON workers"
      " WHEN NEW.status <> 'starting'"
      " BEGIN SELECT RAISE(ABORT, 'worker must register as starting'); END;",
      "CREATE TRIGGER IF NOT EXISTS workers_status_transition BEFORE UPDATE OF status ON workers"
      " WHEN OLD.status <> NEW.status AND NOT ("
      " (OLD.status = 'starting' AND NEW.status IN ('idle','stopping')) OR"
      " (OLD.status = 'idle' AND NEW.status IN ('busy','paused','stopping','dead','crashed')) OR"
      " (OLD.status = 'busy' AND NEW.status IN ('idle','stopping','dead','crashed')) OR"
      " (OLD.status = 'paused' AND NEW.status IN ('idle','stopping','dead','crashed')) OR"
      " (OLD.status = 'stopping' AND NEW.status IN ('dead','crashed')) OR"
      " (OLD.status IN ('dead','crashed') AND NEW.status = 'starting'))"
      " BEGIN SELECT RAISE(ABORT, 'invalid worker status transition'); END;",

      "CREATE TABLE IF NOT EXISTS worker_heartbeats ("
      " worker_id TEXT PRIMARY KEY REFERENCES workers(worker_id), timestamp INTEGER NOT NULL,"
      " status TEXT, task_id TEXT, progress_percent INTEGER NOT NULL DEFAULT 0,"
      " expected_timeout INTEGER NOT NULL DEFAULT 0);",

      "CREATE TABLE IF NOT EXISTS events ("
      " id INTEGER PRIMARY KEY AUTOINCREMENT, task_id TEXT, event_type TEXT NOT NULL,"
      " actor TEXT, payload TEXT, trace_id TEXT, timestamp INTEGER NOT NULL);",
      "CREATE INDEX IF NOT EXISTS idx_events_task ON events(task_id, id);",

      "CREATE TABLE IF NOT EXISTS consensus_sessions ("
      " id TEXT PRIMARY KEY, task_id TEXT NOT NULL, implementer TEXT NOT NULL,"
      " final_result TEXT NOT NULL DEFAULT 'PENDING' CHECK (final_result IN ('PENDING','PASS','FAIL','INCONCLUSIVE')),"
      " required INTEGER NOT NULL, approvals INTEGER NOT NULL DEFAULT 0, rejections INTEGER NOT NULL DEFAULT 0,"
      " created_at INTEGER NOT NULL, completed_at INTEGER);",
      "CREATE INDEX IF NOT EXISTS idx_sessions_task ON consensus_sessions(task_id);",
      "CREATE TABLE IF NOT EXISTS consensus_votes ("
      " session_id TEXT NOT NULL REFERENCES consensus_sessions(id), voter TEXT NOT NULL,"
      " vote TEXT NOT NULL CHECK (vote IN ('APPROVE','REJECT','ABSTAIN','TIMEOUT','ERROR')),"
      " reason TEXT, duration_ms INTEGER NOT NULL DEFAULT 0, recorded_at INTEGER NOT NULL,"
      " UNIQUE(session_id, voter));",

      "CREATE TABLE IF NOT EXISTS breakers ("
      " capability TEXT PRIMARY KEY,"
      " state TEXT NOT NULL DEFAULT 'CLOSED' CHECK (state IN ('CLOSED','OPEN','HALF_OPEN')),"
      " failure_count INTEGER NOT NULL DEFAULT 0, half_open_calls INTEGER NOT NULL DEFAULT 0,"
      " opened_at INTEGER, last_failure INTEGER, last_success INTEGER);",

      "CREATE TABLE IF NOT EXISTS budget_ledger ("
      " id INTEGER PRIMARY KEY AUTOINCREMENT, timestamp INTEGER NOT NULL, amount REAL NOT NULL,"
      " capability TEXT, task_id TEXT);",
      "CREATE INDEX IF NOT EXISTS idx_ledger_time ON budget_ledger(timestamp);",

      "CREATE TABLE IF NOT EXISTS kill_switch ("
      " id INTEGER PRIMARY KEY CHECK (id = 1), active INTEGER NOT NULL, reason TEXT,"
      " triggered_at INTEGER, reset_at INTEGER, reset_by TEXT);",
      "CREATE TABLE IF NOT EXISTS pool_control ("
      " id INTEGER PRIMARY KEY CHECK (id = 1), paused INTEGER NOT NULL, reason TEXT, requested_at INTEGER);"};
  return kSchema;
}

inline const std::vector<std::string>& PostgresSchema() {
  static const std::vector<std::string> kSchema = {
      "CREATE TABLE IF NOT EXISTS tasks ("
      " seq BIGSERIAL, id TEXT PRIMARY KEY, name TEXT NOT NULL, type TEXT NOT NULL,"
      " priority SMALLINT NOT NULL DEFAULT 2 CHECK (priority BETWEEN 0 AND 3),"
      " state TEXT NOT NULL DEFAULT 'QUEUED' CHECK (state IN"
      " ('QUEUED','RUNNING','REVIEW','APPROVED','REJECTED','COMPLETED','FAILED','ESCALATED','CANCELLED')),"
      " lane TEXT, shard TEXT, assigned_model TEXT, worker_id TEXT,"
      " payload TEXT, result TEXT, error TEXT, feedback TEXT, trace_id TEXT,"
      " retry_count INTEGER NOT NULL DEFAULT 0, max_retries INTEGER NOT NULL DEFAULT 3,"
      " created_at BIGINT NOT NULL, updated_at BIGINT NOT NULL,"
      " started_at BIGINT, heartbeat_at BIGINT, completed_at BIGINT);",
      "CREATE INDEX IF NOT EXISTS idx_tasks_claim ON tasks(state, priority, created_at);",
      "CREATE INDEX IF NOT EXISTS idx_tasks_worker ON tasks(worker_id, state);",
      "CREATE OR REPLACE FUNCTION tasks_terminal_immutable() RETURNS trigger AS $$"
      " BEGIN"
      "  IF OLD.state IN ('COMPLETED','FAILED','ESCALATED','CANCELLED') THEN"
      "   RAISE EXCEPTION 'task is in a terminal state' USING ERRCODE = 'check_violation';"
      "  END IF;"
      "  RETURN NEW;"
      " END $$ LANGUAGE plpgsql;",
      "DROP TRIGGER IF EXISTS tasks_terminal_immutable ON tasks;",
      "CREATE TRIGGER tasks_terminal_immutable BEFORE UPDATE ON tasks"
      " FOR EACH ROW EXECUTE FUNCTION tasks_terminal_immutable();",

      "CREATE TABLE IF NOT EXISTS workers ("
      " worker_id TEXT PRIMARY KEY, pid BIGINT NOT NULL DEFAULT 0,"
      " status TEXT NOT NULL DEFAULT 'starting' CHECK (status IN"
      " ('starting','idle','busy','paused','stopping','dead','crashed')),"
      " shard TEXT, specialization TEXT, model TEXT,"
      " started_at BIGINT NOT NULL, last_heartbeat BIGINT NOT NULL,"
      " tasks_completed BIGINT NOT NULL DEFAULT 0, tasks_failed BIGINT NOT NULL DEFAULT 0,"
      " crash_count INTEGER NOT NULL DEFAULT 0);",
      "CREATE OR REPLACE FUNCTION workers_status_transition() RETURNS trigger AS $$"
      " BEGIN"
      "  IF TG_OP = 'INSERT' THEN"
      "   IF NEW.status <> 'starting' THEN"
      "    RAISE EXCEPTION 'worker must register as starting' USING ERRCODE = 'check_violation';"
      "   END IF;"
      "   RETURN NEW;"
      "  END IF;"
      "  IF OLD.status <> NEW.status AND NOT ("
      "   (OLD.status = 'starting' AND NEW.status IN ('idle','stopping')) OR"
      "   (OLD.status = 'idle' AND NEW.status IN ('busy','paused','stopping','dead','crashed')) OR"
      "   (OLD.status = 'busy' AND NEW.status IN ('idle','stopping','dead','crashed')) OR"
      "   (OLD.status = 'paused' AND NEW.status IN ('idle','stopping','dead','crashed')) OR"
      "   (OLD.status = 'stopping' AND NEW.status IN ('dead','crashed')) OR"
      "   (OLD.status IN ('dead','crashed') AND NEW.status = 'starting')) THEN"
      "   RAISE EXCEPTION 'invalid worker status transition' USING ERRCODE = 'check_violation';"
      "  END IF;"
      "  RETURN NEW;"
      " END $$ LANGUAGE plpgsql;",
      "DROP TRIGGER IF EXISTS workers_status_transition ON workers;",
      "CREATE TRIGGER workers_status_transition BEFORE INSERT OR UPDATE ON workers"
      " FOR EACH ROW EXECUTE FUNCTION workers_status_transition();",

      "CREATE TABLE IF NOT EXISTS worker_heartbeats ("
      " worker_id TEXT PRIMARY KEY REFERENCES workers(worker_id), timestamp BIGINT NOT NULL,"
      " status TEXT, task_id TEXT, progress_percent INTEGER NOT NULL DEFAULT 0,"
      " expected_timeout BIGINT NOT NULL DEFAULT 0);",

      "CREATE TABLE IF NOT EXISTS events ("
      " id BIGSERIAL PRIMARY KEY, task_id TEXT, event_type TEXT NOT NULL,"
      " actor TEXT, payload TEXT, trace_id TEXT, timestamp BIGINT NOT NULL);",
      "CREATE INDEX IF NOT EXISTS idx_events_task ON events(task_id, id);",

      "CREATE TABLE IF NOT EXISTS consensus_sessions ("
      " id TEXT PRIMARY KEY, task_id TEXT NOT NULL, implementer TEXT NOT NULL,"
      " final_result TEXT NOT NULL DEFAULT 'PENDING' CHECK (final_result IN ('PENDING','PASS','FAIL','INCONCLUSIVE')),"
      " required INTEGER NOT NULL, approvals INTEGER NOT NULL DEFAULT 0, rejections INTEGER NOT NULL DEFAULT 0,"
      " created_at BIGINT NOT NULL, completed_at BIGINT);",
      "CREATE INDEX IF NOT EXISTS idx_sessions_task ON consensus_sessions(task_id);",
      "CREATE TABLE IF NOT EXISTS consensus_votes ("
      " session_id TEXT NOT NULL REFERENCES consensus_sessions(id), voter TEXT NOT NULL,"
      " vote TEXT NOT NULL CHECK (vote IN ('APPROVE','REJECT','ABSTAIN','TIMEOUT','ERROR')),"
      " reason TEXT, duration_ms BIGINT NOT NULL DEFAULT 0, recorded_at BIGINT NOT NULL,"
      " UNIQUE(session_id, voter));",

      "CREATE TABLE IF NOT EXISTS breakers ("
      " capability TEXT PRIMARY KEY,"
      " state TEXT NOT NULL DEFAULT 'CLOSED' CHECK (state IN ('CLOSED','OPEN','HALF_OPEN')),"
      " failure_count INTEGER NOT NULL DEFAULT 0, half_open_calls INTEGER NOT NULL DEFAULT 0,"
      " opened_at BIGINT, last_failure BIGINT, last_success BIGINT);",

      "CREATE TABLE IF NOT EXISTS budget_ledger ("
      " id BIGSERIAL PRIMARY KEY, timestamp BIGINT NOT NULL, amount DOUBLE PRECISION NOT NULL,"
      " capability TEXT, task_id TEXT);",
      "CREATE INDEX IF NOT EXISTS idx_ledger_time ON budget_ledger(timestamp);",

      "CREATE TABLE IF NOT EXISTS kill_switch ("
      " id INTEGER PRIMARY KEY CHECK (id = 1), active BOOLEAN NOT NULL, reason TEXT,"
      " triggered_at BIGINT, reset_at BIGINT, reset_by TEXT);",
      "CREATE TABLE IF NOT EXISTS pool_control ("
      " id INTEGER PRIMARY KEY CHECK (id = 1), paused BOOLEAN NOT NULL, reason TEXT, requested_at BIGINT);"};
  return kSchema;
}

} // namespace taskorch::db::sql
