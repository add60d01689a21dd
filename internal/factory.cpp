#include "factory.hpp"

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/breaker/circuit_breaker.hpp"
#include "internal/budget/budget_governor.hpp"
#include "internal/budget/budget_watchdog.hpp"
#include "internal/consensus/consensus_engine.hpp"
#include "internal/consensus/review_coordinator.hpp"
#include "internal/core/routing.hpp"
#include "internal/core/task_store.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/executor/command_executor.hpp"
#include "internal/grpc/admin_server.hpp"
#include "internal/grpc/task_server.hpp"
#include "internal/heartbeat/heartbeat_monitor.hpp"
#include "internal/heartbeat/heartbeat_sweeper.hpp"
#include "internal/lifecycle/lifecycle_state_machine.hpp"
#include "internal/observability/logging.hpp"
#include "internal/pool/process_control.hpp"
#include "internal/pool/worker_pool_manager.hpp"
#include "internal/service/admin_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/service/task_service.hpp"
#include "internal/db/sql/schema.hpp"
#if TASKORCH_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if TASKORCH_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace taskorch::factory {

using namespace taskorch;

std::shared_ptr<db::Repository> BuildRepository(const taskorch::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if TASKORCH_DB_SQLITE
    if (database.sqlite().path().empty()) {
      throw std::invalid_argument("database.sqlite.path is required");
    }
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path());
    sqlite_db->ApplySchema(db::sql::SqliteSchema());
    TASKORCH_LOG_INFO("Using sqlite store", {observability::StringField("path", database.sqlite().path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if TASKORCH_DB_POSTGRES
    const auto& pg = database.postgres();
    auto pool = std::make_shared<db::postgres::PgPool>(pg.connection_uri(), pg.max_connections() > 0 ? pg.max_connections() : 16);
    pool->ApplySchema(db::sql::PostgresSchema());
    TASKORCH_LOG_INFO("Using postgres store");
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  TASKORCH_LOG_WARN("No database configured, using in-memory store");
  return std::make_shared<db::memory::MemoryRepository>();
}

Components BuildComponents(const taskorch::runtime::config::RuntimeConfig& config) {
  Components c;
  c.options    = config::ResolveOptions(config);
  c.repository = BuildRepository(config);

  // ------------------------------------------------------------------
  // Core components
  // ------------------------------------------------------------------
  c.process_control = std::make_shared<pool::PosixProcessControl>();
  c.tasks = std::make_shared<core::TaskStore>(c.repository, core::RoutingTable(c.options.routing), c.options.pool, c.options.lifecycle);
  c.pool  = std::make_shared<pool::WorkerPoolManager>(c.repository, c.tasks, c.process_control, c.options.pool);
  c.monitor   = std::make_shared<heartbeat::HeartbeatMonitor>(c.repository, c.process_control, c.options.heartbeat);
  c.lifecycle = std::make_shared<lifecycle::LifecycleStateMachine>(c.repository, c.options.lifecycle);
  c.consensus = std::make_shared<consensus::ConsensusEngine>(c.repository, c.options.consensus);
  c.breaker   = std::make_shared<breaker::CircuitBreaker>(c.repository, c.options.breaker);
  c.budget    = std::make_shared<budget::BudgetGovernor>(c.repository, c.pool, c.monitor, c.options.budget);
  c.executor  = std::make_shared<executor::CommandExecutor>(c.options.executor.commands);
  return c;
}

/*
    Build full application dependency graph
*/
Application Build(const taskorch::runtime::config::RuntimeConfig& config) {
  Application app;
  app.components = BuildComponents(config);
  const auto& c  = app.components;

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.repository = c.repository;
  ctx.tasks      = c.tasks;
  ctx.pool       = c.pool;
  ctx.monitor    = c.monitor;
  ctx.lifecycle  = c.lifecycle;
  ctx.consensus  = c.consensus;
  ctx.breaker    = c.breaker;
  ctx.budget     = c.budget;

  auto task_service  = std::make_shared<service::TaskService>(ctx);
  auto admin_service = std::make_shared<service::AdminService>(ctx);

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_unique<grpc::TaskServer>(task_service));
  app.grpc_services.push_back(std::make_unique<grpc::AdminServer>(admin_service));

  // ------------------------------------------------------------------
  // Background workers (started by the caller)
  // ------------------------------------------------------------------
  auto coordinator = std::make_shared<consensus::ReviewCoordinator>(c.repository, c.consensus, c.lifecycle, c.breaker, c.executor,
                                                                    c.budget, c.options.consensus);
  auto pool        = c.pool;

  app.background_workers.push_back(std::make_shared<heartbeat::HeartbeatSweeper>(c.monitor, c.options.heartbeat.scan_interval));
  app.background_workers.push_back(std::make_shared<budget::BudgetWatchdog>(c.budget, c.options.budget.check_interval));
  app.background_workers.push_back(std::make_shared<consensus::ReviewWorker>(coordinator, c.options.consensus.review_poll_interval));
  app.background_workers.push_back(std::make_shared<runtime::PeriodicWorker>("shard-rebalancer", c.options.pool.rebalance_interval,
                                                                             [pool] { pool->RebalanceShards(); }));

  return app;
}

} // namespace taskorch::factory
