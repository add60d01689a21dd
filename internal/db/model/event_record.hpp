#pragma once

#include <cstdint>
#include <string>

namespace taskorch::db::model {

// Append-only audit row.
struct EventRecord {
  uint64_t    id = 0;
  std::string task_id;
  std::string event_type;
  std::string actor;
  std::string payload;
  std::string trace_id;
  uint64_t    timestamp_ms = 0;
};

} // namespace taskorch::db::model
