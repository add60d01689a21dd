#pragma once

#include <cstdint>
#include <string>

#include "taskorch/v1/types.pb.h"

namespace taskorch::db::model {

struct WorkerRecord {
  std::string worker_id;
  int64_t     pid = 0;

  taskorch::v1::WorkerStatus status = taskorch::v1::WORKER_STATUS_STARTING;

  std::string shard;
  std::string specialization;
  std::string model;

  uint64_t started_at_ms     = 0;
  uint64_t last_heartbeat_ms = 0;

  uint64_t tasks_completed = 0;
  uint64_t tasks_failed    = 0;
  uint32_t crash_count     = 0;
};

} // namespace taskorch::db::model
