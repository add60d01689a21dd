#pragma once

#include <cstdint>
#include <string>

namespace taskorch::db::model {

/*
  Latest liveness sample per worker.

  Staleness only; never consulted for ownership.
*/
struct HeartbeatRecord {
  std::string worker_id;
  uint64_t    timestamp_ms = 0;
  std::string status;
  std::string task_id;
  uint32_t    progress_percent         = 0;
  uint64_t    expected_timeout_seconds = 0;
};

} // namespace taskorch::db::model
