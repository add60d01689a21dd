#include <cassert>
#include <chrono>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/schema.hpp"

#if TASKORCH_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

#if TASKORCH_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace {

using taskorch::db::ClaimFilter;
using taskorch::db::ErrorCode;
using taskorch::db::Repository;
using taskorch::db::TransactionConflict;
using taskorch::db::memory::MemoryRepository;
using taskorch::db::model::BreakerRecord;
using taskorch::db::model::ConsensusSessionRecord;
using taskorch::db::model::EventRecord;
using taskorch::db::model::HeartbeatRecord;
using taskorch::db::model::KillSwitchRecord;
using taskorch::db::model::LedgerEntry;
using taskorch::db::model::PauseRecord;
using taskorch::db::model::TaskRecord;
using taskorch::db::model::VoteRecord;
using taskorch::db::model::WorkerRecord;
using namespace taskorch::v1;

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                  name;
  std::function<std::shared_ptr<Repository>()> make_repository;
  // A second handle on the same store, as another process would open it.
  std::function<std::shared_ptr<Repository>()> open_connection;
  std::function<bool()>                         supports_restart;
  std::function<void()>                         cleanup;
};

TaskRecord MakeTask(const std::string& id, const std::string& type, Priority priority, uint64_t created_at_ms) {
  TaskRecord task;
  task.id            = id;
  task.name          = "task " + id;
  task.type          = type;
  task.priority      = priority;
  task.payload       = "payload";
  task.trace_id      = "trace-" + id;
  task.created_at_ms = created_at_ms;
  task.updated_at_ms = created_at_ms;
  return task;
}

WorkerRecord MakeWorker(const std::string& id) {
  WorkerRecord worker;
  worker.worker_id         = id;
  worker.pid               = 4242;
  worker.started_at_ms     = NowMs();
  worker.last_heartbeat_ms = worker.started_at_ms;
  return worker;
}

void VerifyTaskReadWrite(Repository& repo, const std::string& prefix) {
  const auto base = NowMs();
  auto       tx   = repo.Begin();

  auto task           = MakeTask(prefix + "-a", prefix + "-FIX", PRIORITY_HIGH, base);
  task.shard          = "shard-1";
  task.assigned_model = "claude";
  assert(repo.InsertTask(*tx, task));
  assert(repo.InsertTask(*tx, MakeTask(prefix + "-b", prefix + "-FIX", PRIORITY_LOW, base + 1)));

  auto read = repo.GetTask(*tx, task.id);
  assert(read.has_value());
  assert(read->name == task.name);
  assert(read->priority == PRIORITY_HIGH);
  assert(read->state == TASK_STATE_QUEUED);
  assert(read->shard == "shard-1");
  assert(read->assigned_model == "claude");
  assert(read->created_at_ms == base);
  assert(!repo.GetTask(*tx, prefix + "-missing").has_value());

  read->feedback      = "needs tests";
  read->retry_count   = 1;
  read->updated_at_ms = base + 5;
  assert(repo.UpdateTask(*tx, *read));
  auto updated = repo.GetTask(*tx, task.id);
  assert(updated->feedback == "needs tests");
  assert(updated->retry_count == 1);
  tx->Commit();

  // a failed statement poisons a postgres transaction, so each expected
  // failure below gets its own
  auto dup_tx    = repo.Begin();
  auto duplicate = repo.InsertTask(*dup_tx, task);
  assert(!duplicate);
  assert(duplicate.code == ErrorCode::AlreadyExists);
  dup_tx->Rollback();
}

void VerifyClaimOrderingAndFilters(Repository& repo, const std::string& prefix) {
  const auto base = NowMs();
  const auto type = prefix + "-CLAIM";
  {
    auto tx = repo.Begin();
    assert(repo.InsertTask(*tx, MakeTask(prefix + "-low", type, PRIORITY_LOW, base)));
    assert(repo.InsertTask(*tx, MakeTask(prefix + "-crit-old", type, PRIORITY_CRITICAL, base + 1)));
    assert(repo.InsertTask(*tx, MakeTask(prefix + "-crit-new", type, PRIORITY_CRITICAL, base + 2)));
    auto sharded  = MakeTask(prefix + "-sharded", type, PRIORITY_CRITICAL, base);
    sharded.shard = "shard-2";
    assert(repo.InsertTask(*tx, sharded));
    tx->Commit();
  }

  auto tx = repo.Begin();

  ClaimFilter only_type;
  only_type.types = {type};
  only_type.shard = "shard-0";
  auto next       = repo.NextClaimable(*tx, only_type);
  assert(next.has_value());
  assert(next->id == prefix + "-crit-old");

  // unsharded tasks match every shard filter
  ClaimFilter shard_two = only_type;
  shard_two.shard       = "shard-2";
  next                  = repo.NextClaimable(*tx, shard_two);
  assert(next.has_value());
  assert(next->id == prefix + "-sharded");

  ClaimFilter other_type;
  other_type.types = {prefix + "-NOTHING"};
  assert(!repo.NextClaimable(*tx, other_type).has_value());

  const auto now = NowMs();
  assert(repo.MarkClaimed(*tx, prefix + "-crit-old", "w-parity", now));
  auto again = repo.MarkClaimed(*tx, prefix + "-crit-old", "w-other", now);
  assert(!again);
  assert(again.code == ErrorCode::Conflict);

  auto claimed = repo.GetTask(*tx, prefix + "-crit-old");
  assert(claimed->state == TASK_STATE_RUNNING);
  assert(claimed->worker_id == "w-parity");
  assert(claimed->started_at_ms == now);
  assert(claimed->heartbeat_at_ms == now);

  auto running = repo.ListRunningByWorker(*tx, "w-parity");
  assert(running.size() == 1);
  assert(running.front().id == prefix + "-crit-old");

  next = repo.NextClaimable(*tx, only_type);
  assert(next.has_value());
  assert(next->id == prefix + "-crit-new");

  tx->Commit();
}

void VerifyTerminalTasksAreImmutable(Repository& repo, const std::string& prefix) {
  auto tx   = repo.Begin();
  auto task = MakeTask(prefix + "-done", prefix + "-FIX", PRIORITY_MEDIUM, NowMs());
  assert(repo.InsertTask(*tx, task));
  task.state           = TASK_STATE_COMPLETED;
  task.completed_at_ms = NowMs();
  assert(repo.UpdateTask(*tx, task));
  tx->Commit();

  auto tx2 = repo.Begin();
  task.state = TASK_STATE_QUEUED;
  auto reopened = repo.UpdateTask(*tx2, task);
  assert(!reopened);
  assert(reopened.code == ErrorCode::ConstraintViolation);
  tx2->Rollback();

  auto check = repo.Begin();
  assert(repo.GetTask(*check, task.id)->state == TASK_STATE_COMPLETED);
  check->Commit();
}

void VerifyListingAndCounts(Repository& repo) {
  auto tx = repo.Begin();

  const auto counts = repo.CountTasksByState(*tx);
  assert(counts.count("QUEUED") == 1);
  assert(counts.at("RUNNING") >= 1);
  assert(counts.at("COMPLETED") >= 1);

  auto queued = repo.ListTasks(*tx, TASK_STATE_QUEUED, 0);
  for (const auto& task : queued) {
    assert(task.state == TASK_STATE_QUEUED);
  }
  for (size_t i = 1; i < queued.size(); ++i) {
    assert(queued[i - 1].created_at_ms >= queued[i].created_at_ms);
  }

  auto limited = repo.ListTasks(*tx, std::nullopt, 2);
  assert(limited.size() == 2);

  const auto by_shard = repo.CountQueuedByShard(*tx);
  assert(by_shard.count("shard-2") == 1);
  assert(by_shard.at("shard-2") >= 1);

  tx->Commit();
}

void VerifyEvents(Repository& repo, const std::string& prefix) {
  auto       tx      = repo.Begin();
  const auto task_id = prefix + "-a";
  for (const auto& type : {"TASK_CREATED", "TASK_CLAIMED", "STATE_REVIEW"}) {
    EventRecord event;
    event.task_id      = task_id;
    event.event_type   = type;
    event.actor        = "parity";
    event.payload      = "detail";
    event.trace_id     = "trace-" + task_id;
    event.timestamp_ms = NowMs();
    assert(repo.AppendEvent(*tx, event));
  }

  auto events = repo.ListEvents(*tx, task_id);
  assert(events.size() == 3);
  assert(events[0].event_type == "TASK_CREATED");
  assert(events[2].event_type == "STATE_REVIEW");
  assert(events[0].id < events[1].id);
  assert(events[1].trace_id == "trace-" + task_id);
  assert(repo.ListEvents(*tx, prefix + "-missing").empty());
  tx->Commit();
}

void VerifyWorkerGraph(Repository& repo, const std::string& prefix) {
  const auto id     = prefix + "-worker";
  auto       worker = MakeWorker(id);

  auto tx      = repo.Begin();
  auto eager   = MakeWorker(prefix + "-eager");
  eager.status = WORKER_STATUS_IDLE;
  assert(!repo.InsertWorker(*tx, eager));
  tx->Rollback();

  tx = repo.Begin();
  assert(repo.InsertWorker(*tx, worker));
  tx->Commit();

  tx = repo.Begin();
  assert(repo.InsertWorker(*tx, worker).code == ErrorCode::AlreadyExists);
  tx->Rollback();

  tx            = repo.Begin();
  worker.status = WORKER_STATUS_BUSY;
  auto skipped  = repo.UpdateWorker(*tx, worker);
  assert(!skipped);
  assert(skipped.code == ErrorCode::ConstraintViolation);
  tx->Rollback();

  tx            = repo.Begin();
  worker.status = WORKER_STATUS_IDLE;
  assert(repo.UpdateWorker(*tx, worker));
  worker.status          = WORKER_STATUS_BUSY;
  worker.tasks_completed = 4;
  assert(repo.UpdateWorker(*tx, worker));

  HeartbeatRecord beat;
  beat.worker_id                = id;
  beat.timestamp_ms             = NowMs();
  beat.status                   = "busy";
  beat.task_id                  = prefix + "-a";
  beat.progress_percent         = 10;
  beat.expected_timeout_seconds = 600;
  assert(repo.UpsertHeartbeat(*tx, beat));
  beat.progress_percent = 70;
  assert(repo.UpsertHeartbeat(*tx, beat));

  auto read = repo.GetHeartbeat(*tx, id);
  assert(read.has_value());
  assert(read->progress_percent == 70);
  assert(read->expected_timeout_seconds == 600);

  auto stored = repo.GetWorker(*tx, id);
  assert(stored.has_value());
  assert(stored->status == WORKER_STATUS_BUSY);
  assert(stored->tasks_completed == 4);
  assert(stored->pid == 4242);
  tx->Commit();

  // a recovered worker re-registers through starting
  tx            = repo.Begin();
  worker.status = WORKER_STATUS_CRASHED;
  assert(repo.UpdateWorker(*tx, worker));
  worker.status = WORKER_STATUS_STARTING;
  assert(repo.UpdateWorker(*tx, worker));
  tx->Commit();
}

void VerifyConsensusRecords(Repository& repo, const std::string& prefix) {
  auto tx = repo.Begin();

  ConsensusSessionRecord session;
  session.id            = "CS-" + prefix;
  session.task_id       = prefix + "-a";
  session.implementer   = "claude";
  session.required      = 2;
  session.created_at_ms = NowMs();
  assert(repo.InsertSession(*tx, session));

  VoteRecord vote;
  vote.session_id     = session.id;
  vote.voter          = "codex";
  vote.vote           = VOTE_ABSTAIN;
  vote.recorded_at_ms = NowMs();
  assert(repo.UpsertVote(*tx, vote));
  vote.vote   = VOTE_APPROVE;
  vote.reason = "fine";
  assert(repo.UpsertVote(*tx, vote));
  vote.voter = "gemini";
  assert(repo.UpsertVote(*tx, vote));

  auto votes = repo.ListVotes(*tx, session.id);
  assert(votes.size() == 2);
  for (const auto& stored : votes) {
    assert(stored.vote == VOTE_APPROVE);
  }

  session.approvals       = 2;
  session.final_result    = CONSENSUS_RESULT_PASS;
  session.completed_at_ms = NowMs();
  assert(repo.UpdateSession(*tx, session));

  auto read = repo.GetSession(*tx, session.id);
  assert(read.has_value());
  assert(read->final_result == CONSENSUS_RESULT_PASS);
  assert(read->approvals == 2);
  assert(repo.ListSessionsForTask(*tx, session.task_id).size() == 1);
  tx->Commit();
}

void VerifyControlState(Repository& repo, const std::string& prefix) {
  auto tx = repo.Begin();

  BreakerRecord breaker;
  breaker.capability    = prefix + "-cap";
  breaker.state         = BREAKER_STATE_OPEN;
  breaker.failure_count = 3;
  breaker.opened_at_ms  = NowMs();
  assert(repo.UpsertBreaker(*tx, breaker));
  breaker.state = BREAKER_STATE_HALF_OPEN;
  assert(repo.UpsertBreaker(*tx, breaker));
  auto read_breaker = repo.GetBreaker(*tx, breaker.capability);
  assert(read_breaker.has_value());
  assert(read_breaker->state == BREAKER_STATE_HALF_OPEN);
  assert(read_breaker->failure_count == 3);
  assert(!repo.GetBreaker(*tx, prefix + "-none").has_value());

  // baselines keep this valid against a store shared with earlier runs
  const auto   since       = NowMs() + 60'000;
  const double before      = repo.SumLedgerSince(*tx, since);
  const double before_next = repo.SumLedgerSince(*tx, since + 2);
  for (double amount : {0.25, 0.5}) {
    LedgerEntry entry;
    entry.timestamp_ms = since + 1;
    entry.amount       = amount;
    entry.capability   = "claude";
    entry.task_id      = prefix + "-a";
    assert(repo.AppendLedger(*tx, entry));
  }
  assert(std::fabs(repo.SumLedgerSince(*tx, since) - before - 0.75) < 1e-9);
  assert(std::fabs(repo.SumLedgerSince(*tx, since + 2) - before_next) < 1e-9);

  KillSwitchRecord kill;
  kill.active          = true;
  kill.reason          = "daily spend";
  kill.triggered_at_ms = NowMs();
  assert(repo.PutKillSwitch(*tx, kill));
  kill.active   = false;
  kill.reset_by = "oncall";
  assert(repo.PutKillSwitch(*tx, kill));
  auto read_kill = repo.GetKillSwitch(*tx);
  assert(!read_kill.active);
  assert(read_kill.reason == "daily spend");
  assert(read_kill.reset_by == "oncall");

  PauseRecord pause;
  pause.paused = true;
  pause.reason = "deploy";
  assert(repo.PutPause(*tx, pause));
  assert(repo.GetPause(*tx).paused);
  pause.paused = false;
  assert(repo.PutPause(*tx, pause));
  assert(!repo.GetPause(*tx).paused);

  tx->Commit();
}

void VerifyRollbackBehavior(Repository& repo, const std::string& prefix) {
  {
    auto tx = repo.Begin();
    assert(repo.InsertTask(*tx, MakeTask(prefix + "-rolled-back", prefix + "-FIX", PRIORITY_MEDIUM, NowMs())));
    tx->Rollback();
  }
  {
    // dropped without commit
    auto tx = repo.Begin();
    assert(repo.InsertTask(*tx, MakeTask(prefix + "-abandoned", prefix + "-FIX", PRIORITY_MEDIUM, NowMs())));
  }

  auto check = repo.Begin();
  assert(!repo.GetTask(*check, prefix + "-rolled-back").has_value());
  assert(!repo.GetTask(*check, prefix + "-abandoned").has_value());
  check->Commit();
}

// Claimers on separate connections never take the same task.
void VerifyConcurrentClaims(BackendFactory& backend, Repository& seed, const std::string& prefix) {
  constexpr int kTasks    = 24;
  constexpr int kClaimers = 4;
  const auto    type      = prefix + "-RACE";
  {
    auto       tx   = seed.Begin();
    const auto base = NowMs();
    for (int i = 0; i < kTasks; ++i) {
      assert(seed.InsertTask(*tx, MakeTask(prefix + "-race-" + std::to_string(i), type, PRIORITY_MEDIUM, base + i)));
    }
    tx->Commit();
  }

  std::mutex               mutex;
  std::vector<std::string> claimed;
  std::vector<std::thread> threads;
  for (int c = 0; c < kClaimers; ++c) {
    threads.emplace_back([&, c] {
      auto        repo      = backend.open_connection();
      const auto  worker_id = prefix + "-claimer-" + std::to_string(c);
      ClaimFilter filter;
      filter.types = {type};

      for (;;) {
        try {
          auto tx   = repo->Begin();
          auto next = repo->NextClaimable(*tx, filter);
          if (!next) {
            tx->Commit();
            return;
          }
          auto result = repo->MarkClaimed(*tx, next->id, worker_id, NowMs());
          if (!result) {
            assert(result.code == ErrorCode::Conflict);
            tx->Rollback();
            continue;
          }
          tx->Commit();
          std::lock_guard<std::mutex> lock(mutex);
          claimed.push_back(next->id);
        } catch (const TransactionConflict&) {
          // lost the commit race; look again
        }
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  assert(claimed.size() == kTasks);
  const std::set<std::string> unique(claimed.begin(), claimed.end());
  assert(unique.size() == claimed.size());
}

void VerifyRestartDurability(BackendFactory& backend, const std::string& prefix) {
  if (!backend.supports_restart()) {
    return;
  }

  {
    auto repo = backend.make_repository();
    auto tx   = repo->Begin();
    assert(repo->InsertTask(*tx, MakeTask(prefix + "-durable", prefix + "-FIX", PRIORITY_HIGH, NowMs())));
    KillSwitchRecord kill;
    kill.active = true;
    kill.reason = "restart check";
    assert(repo->PutKillSwitch(*tx, kill));
    tx->Commit();
  }

  auto reopened = backend.make_repository();
  auto tx       = reopened->Begin();
  auto task     = reopened->GetTask(*tx, prefix + "-durable");
  assert(task.has_value());
  assert(task->priority == PRIORITY_HIGH);
  assert(reopened->GetKillSwitch(*tx).active);

  KillSwitchRecord cleared;
  assert(reopened->PutKillSwitch(*tx, cleared));
  tx->Commit();
}

BackendFactory MakeMemoryFactory() {
  auto shared = std::make_shared<MemoryRepository>();
  return BackendFactory{
      .name             = "memory",
      .make_repository  = [shared]() -> std::shared_ptr<Repository> { return shared; },
      .open_connection  = [shared]() -> std::shared_ptr<Repository> { return shared; },
      .supports_restart = []() { return false; },
      .cleanup          = []() {},
  };
}

#if TASKORCH_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("taskorch_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();

  auto make_repo = [db_path]() -> std::shared_ptr<Repository> {
    auto db = std::make_shared<taskorch::db::sqlite::SqliteDB>(db_path);
    db->ApplySchema(taskorch::db::sql::SqliteSchema());
    return std::make_shared<taskorch::db::sqlite::SqliteRepository>(std::move(db));
  };

  return BackendFactory{
      .name             = "sqlite",
      .make_repository  = make_repo,
      .open_connection  = make_repo,
      .supports_restart = []() { return true; },
      .cleanup =
          [db_path]() {
            std::filesystem::remove(db_path);
            std::filesystem::remove(db_path + "-wal");
            std::filesystem::remove(db_path + "-shm");
          },
  };
}
#endif

#if TASKORCH_DB_POSTGRES
BackendFactory MakePostgresFactory() {
  const char* uri = std::getenv("TASKORCH_TEST_POSTGRES_URI");
  if (uri == nullptr || std::string(uri).empty()) {
    throw std::runtime_error("TASKORCH_TEST_POSTGRES_URI is not set");
  }

  auto conninfo  = std::string(uri);
  auto make_repo = [conninfo]() -> std::shared_ptr<Repository> {
    auto pool = std::make_shared<taskorch::db::postgres::PgPool>(conninfo, 4);
    pool->ApplySchema(taskorch::db::sql::PostgresSchema());
    return std::make_shared<taskorch::db::postgres::PgRepository>(std::move(pool));
  };

  return BackendFactory{
      .name             = "postgres",
      .make_repository  = make_repo,
      .open_connection  = make_repo,
      .supports_restart = []() { return true; },
      .cleanup          = []() {},
  };
}
#endif

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  // shared stores keep rows between runs
  const auto prefix = backend.name + "-" + std::to_string(NowMs());
  auto       repo   = backend.make_repository();

  VerifyTaskReadWrite(*repo, prefix);
  VerifyClaimOrderingAndFilters(*repo, prefix);
  VerifyTerminalTasksAreImmutable(*repo, prefix);
  VerifyListingAndCounts(*repo);
  VerifyEvents(*repo, prefix);
  VerifyWorkerGraph(*repo, prefix);
  VerifyConsensusRecords(*repo, prefix);
  VerifyControlState(*repo, prefix);
  VerifyRollbackBehavior(*repo, prefix);
  VerifyConcurrentClaims(backend, *repo, prefix);

  repo.reset();
  VerifyRestartDurability(backend, prefix);

  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());

#if TASKORCH_DB_SQLITE
  backends.push_back(MakeSqliteFactory());
#endif

#if TASKORCH_DB_POSTGRES
  try {
    backends.push_back(MakePostgresFactory());
  } catch (const std::exception& ex) {
    std::cout << "skipping postgres integration suite: " << ex.what() << "\n";
  }
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "taskorch_integration_repository_parity: pass\n";
  return 0;
}
