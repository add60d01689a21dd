#include "pg_pool.hpp"

namespace taskorch::db::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)),
      max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  for (;;) {
    {
      std::unique_lock lock(mutex_);

      if (!idle_.empty()) {
        auto conn = std::move(idle_.back());
        idle_.pop_back();
        return Wrap(conn.release());
      }

      if (live_connections_ < max_connections_) {
        ++live_connections_;
        lock.unlock();

        try {
          auto conn = std::make_unique<pqxx::connection>(conninfo_);
          PrepareStatements(*conn);
          return Wrap(conn.release());
        } catch (const std::exception&) {
          std::lock_guard rollback_lock(mutex_);
          --live_connections_;
          cv_.notify_one();
          throw;
        }
      }

      cv_.wait(lock, [this] {
        return !idle_.empty() || live_connections_ < max_connections_;
      });
    }
  }
}

void PgPool::ApplySchema(const std::vector<std::string>& statements) {
  pqxx::connection conn(conninfo_);
  pqxx::work       tx(conn);
  for (const auto& sql : statements) {
    tx.exec(sql);
  }
  tx.commit();
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  // $1 shard, $2 model, $3 comma separated task types (NULL = any)
  conn.prepare("next_claimable",
               "SELECT id,name,type,priority,state,lane,shard,assigned_model,worker_id,payload,result,error,feedback,"
               "trace_id,retry_count,max_retries,created_at,updated_at,started_at,heartbeat_at,completed_at "
               "FROM tasks WHERE state='QUEUED' "
               "AND ($1::text IS NULL OR shard IS NULL OR shard=$1) "
               "AND ($2::text IS NULL OR assigned_model IS NULL OR assigned_model=$2) "
               "AND ($3::text IS NULL OR type = ANY(string_to_array($3, ','))) "
               "ORDER BY priority ASC, created_at ASC, seq ASC LIMIT 1 FOR UPDATE SKIP LOCKED");

  conn.prepare("mark_claimed",
               "UPDATE tasks SET state='RUNNING', worker_id=$1, started_at=$2, heartbeat_at=$2, updated_at=$2 "
               "WHERE id=$3 AND state='QUEUED'");
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(pqxx::connection* conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn, [weak_self](pqxx::connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void PgPool::Release(pqxx::connection* conn) {
  {
    std::lock_guard lock(mutex_);
    idle_.emplace_back(conn);
  }
  cv_.notify_one();
}

} // namespace taskorch::db::postgres
