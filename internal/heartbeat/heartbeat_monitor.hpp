#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "internal/config/options.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/pool/process_control.hpp"
#include "internal/util/time.hpp"

namespace taskorch::heartbeat {

struct StaleWorker {
  std::string               worker_id;
  int64_t                   pid = 0;
  std::chrono::milliseconds age{0};
  std::chrono::milliseconds threshold{0};
};

struct Recovery {
  std::string                worker_id;
  taskorch::v1::WorkerStatus status = taskorch::v1::WORKER_STATUS_UNSPECIFIED;
  std::vector<std::string>   requeued_tasks;
};

/*
  HeartbeatMonitor

  Liveness recording and crash recovery. Heartbeats only decide
  staleness; the task row stays the ownership truth.

  Recovery re-reads the worker inside its own transaction, so
  concurrent passes over the same worker requeue each task once.
*/
class HeartbeatMonitor {
 public:
  HeartbeatMonitor(std::shared_ptr<db::Repository> repository, std::shared_ptr<pool::ProcessControl> process_control,
                   config::HeartbeatOptions options, util::ClockFn clock = util::Now);

  // Throws util::StaleWorker when task_id is set but owned by someone else.
  void RecordHeartbeat(const std::string& worker_id, const std::string& task_id, uint32_t progress_percent,
                       uint64_t expected_timeout_seconds);

  std::vector<StaleWorker> FindStale(util::TimePoint now);

  // Marks the worker dead (process gone) or crashed (process unresponsive)
  // and requeues its RUNNING tasks. Empty result when already recovered.
  Recovery RecoverWorker(const std::string& worker_id, const std::string& reason);

  std::vector<Recovery> RecoverStaleWorkers();

 private:
  std::chrono::milliseconds ThresholdFor(db::Transaction& tx, const db::model::WorkerRecord& worker);
  bool                      IsStale(db::Transaction& tx, const db::model::WorkerRecord& worker, util::TimePoint now,
                                    std::chrono::milliseconds* age, std::chrono::milliseconds* threshold);
  Recovery                  Recover(const std::string& worker_id, const std::string& reason, bool require_stale);

  std::shared_ptr<db::Repository>       repository_;
  std::shared_ptr<pool::ProcessControl> process_control_;
  config::HeartbeatOptions              options_;
  util::ClockFn                         clock_;
};

} // namespace taskorch::heartbeat
