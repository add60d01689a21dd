#pragma once

#include <cstdint>
#include <string>

#include "taskorch/v1/types.pb.h"

namespace taskorch::db::model {

struct BreakerRecord {
  std::string capability;

  taskorch::v1::BreakerState state = taskorch::v1::BREAKER_STATE_CLOSED;

  uint32_t failure_count   = 0;
  uint32_t half_open_calls = 0;

  uint64_t opened_at_ms    = 0;
  uint64_t last_failure_ms = 0;
  uint64_t last_success_ms = 0;
};

} // namespace taskorch::db::model
