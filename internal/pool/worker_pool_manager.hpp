#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/config/options.hpp"
#include "internal/core/task_store.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/pool/process_control.hpp"
#include "internal/util/time.hpp"

namespace taskorch::pool {

struct WorkerRegistration {
  std::string worker_id;
  int64_t     pid = 0;
  std::string specialization;
  std::string shard;
  std::string model;
};

/*
  WorkerPoolManager

  Worker registration and status, claim gating and pool-wide
  control. Claim gating order:

    kill switch -> pool pause -> worker status -> concurrency cap

  then TaskStore::ClaimTask with the worker's shard, model and
  specialization as the filter.
*/
class WorkerPoolManager {
 public:
  WorkerPoolManager(std::shared_ptr<db::Repository> repository, std::shared_ptr<core::TaskStore> tasks,
                    std::shared_ptr<ProcessControl> process_control, config::PoolOptions options, util::ClockFn clock = util::Now);

  // Idempotent; a gone worker re-enters as starting.
  db::model::WorkerRecord Register(const WorkerRegistration& registration);

  // Throws util::InvalidTransition outside the worker status graph.
  db::model::WorkerRecord Transition(const std::string& worker_id, taskorch::v1::WorkerStatus status);

  std::optional<db::model::TaskRecord> RequestClaim(const std::string& worker_id);

  db::ClaimFilter FilterFor(const db::model::WorkerRecord& worker) const;

  std::string          ShardFor(const std::string& task_key) const;
  const config::Route& Route(const std::string& task_type) const;

  db::model::PauseRecord RequestPause(const std::string& reason);
  db::model::PauseRecord Resume();
  db::model::PauseRecord PauseState();

  // Signals every live worker; returns how many were reached.
  size_t SignalWorkers(int signal);

  // SIGKILL; the row is left for crash recovery.
  bool Terminate(const std::string& worker_id);

  // Moves excess QUEUED tasks from deep shards to the shallowest one.
  // Returns how many tasks moved.
  size_t RebalanceShards();

  std::vector<db::model::WorkerRecord> ListWorkers();
  db::model::WorkerRecord              GetWorker(const std::string& worker_id);

  const config::PoolOptions& Options() const {
    return options_;
  }

 private:
  std::shared_ptr<db::Repository>  repository_;
  std::shared_ptr<core::TaskStore> tasks_;
  std::shared_ptr<ProcessControl>  process_control_;
  config::PoolOptions              options_;
  util::ClockFn                    clock_;
};

} // namespace taskorch::pool
