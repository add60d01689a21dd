#pragma once

#include <cstdint>
#include <string>

#include "taskorch/v1/types.pb.h"

namespace taskorch::db::model {

/*
  Persistent task row.

  IMPORTANT:
  - This row is the ownership truth: worker_id is set only while RUNNING.
  - Rows in a terminal state are never written again.
  - Empty shard / assigned_model means "any".
*/

struct TaskRecord {
  std::string id;
  std::string name;
  std::string type;

  taskorch::v1::Priority  priority = taskorch::v1::PRIORITY_MEDIUM;
  taskorch::v1::TaskState state    = taskorch::v1::TASK_STATE_QUEUED;

  std::string lane;
  std::string shard;
  std::string assigned_model;
  std::string worker_id;

  std::string payload;
  std::string result;
  std::string error;
  // Rejection feedback handed to the next attempt.
  std::string feedback;
  std::string trace_id;

  uint32_t retry_count = 0;
  uint32_t max_retries = 3;

  uint64_t created_at_ms   = 0;
  uint64_t updated_at_ms   = 0;
  uint64_t started_at_ms   = 0;
  uint64_t heartbeat_at_ms = 0;
  uint64_t completed_at_ms = 0;
};

} // namespace taskorch::db::model
