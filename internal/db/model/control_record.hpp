#pragma once

#include <cstdint>
#include <string>

namespace taskorch::db::model {

struct LedgerEntry {
  uint64_t    id           = 0;
  uint64_t    timestamp_ms = 0;
  double      amount       = 0.0;
  std::string capability;
  std::string task_id;
};

/*
  Single-row kill switch.

  Stays readable after a reset so the incident remains discoverable.
*/
struct KillSwitchRecord {
  bool        active = false;
  std::string reason;
  uint64_t    triggered_at_ms = 0;
  uint64_t    reset_at_ms     = 0;
  std::string reset_by;
};

// Single-row pool pause flag.
struct PauseRecord {
  bool        paused = false;
  std::string reason;
  uint64_t    requested_at_ms = 0;
};

} // namespace taskorch::db::model
