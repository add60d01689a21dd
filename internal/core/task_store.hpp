#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/config/options.hpp"
#include "internal/core/routing.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/util/time.hpp"

namespace taskorch::core {

struct TaskSpec {
  std::string            id;
  std::string            name;
  std::string            type;
  taskorch::v1::Priority priority = taskorch::v1::PRIORITY_MEDIUM;
  std::string            payload;
  // Partition key override; derived from the id when empty.
  std::string shard;
  std::string trace_id;
};

/*
  TaskStore

  Owns task creation, atomic claiming and release. The claim is a
  conditional UPDATE ... WHERE state='QUEUED' inside one transaction;
  losing a race re-scans instead of failing.

  Ownership truth is the task row. The worker's busy/idle status is
  kept in step inside the same transaction.
*/
class TaskStore {
 public:
  TaskStore(std::shared_ptr<db::Repository> repository, RoutingTable routing, config::PoolOptions pool, config::LifecycleOptions lifecycle,
            util::ClockFn clock = util::Now);

  // Insert-if-absent. Returns true when a row was created.
  bool EnsureTaskExists(const std::string& id, const std::string& name, const std::string& type, taskorch::v1::Priority priority,
                        const std::string& payload);

  // Throws util::AlreadyExists for a duplicate id.
  db::model::TaskRecord Enqueue(const TaskSpec& spec);

  // Highest priority QUEUED task matching the filter, or nullopt.
  std::optional<db::model::TaskRecord> ClaimTask(const std::string& worker_id, const db::ClaimFilter& filter);

  // Claims one specific task. Throws util::ClaimConflict when it is no longer QUEUED.
  db::model::TaskRecord AssignTask(const std::string& task_id, const std::string& worker_id);

  // RUNNING -> QUEUED, retry_count unchanged.
  db::model::TaskRecord ReleaseTask(const std::string& task_id, const std::string& reason);

  db::model::TaskRecord               GetTask(const std::string& task_id);
  std::vector<db::model::TaskRecord>  ListTasks(std::optional<taskorch::v1::TaskState> state, uint32_t limit);
  std::vector<db::model::EventRecord> TaskHistory(const std::string& task_id);
  std::vector<db::model::TaskRecord>  RunningFor(const std::string& worker_id);
  uint32_t                            CountRunning(const std::string& worker_id);
  std::map<std::string, uint64_t>     QueueDepthByShard();
  std::map<std::string, uint64_t>     CountByState();

  const RoutingTable& Routing() const {
    return routing_;
  }

 private:
  db::model::TaskRecord NewRecord(const TaskSpec& spec, uint64_t now_ms) const;

  // Claims inside tx; Conflict when the row moved on.
  db::Result ClaimInTx(db::Transaction& tx, const db::model::TaskRecord& task, const std::string& worker_id, uint64_t now_ms);

  std::shared_ptr<db::Repository> repository_;
  RoutingTable                    routing_;
  config::PoolOptions             pool_;
  config::LifecycleOptions        lifecycle_;
  util::ClockFn                   clock_;
};

} // namespace taskorch::core
