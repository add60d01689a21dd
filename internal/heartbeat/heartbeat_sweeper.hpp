#pragma once

#include <memory>

#include "internal/heartbeat/heartbeat_monitor.hpp"
#include "internal/runtime/periodic_worker.hpp"

namespace taskorch::heartbeat {

// Crash recovery pass every scan interval.
class HeartbeatSweeper final : public runtime::PeriodicWorker {
 public:
  HeartbeatSweeper(std::shared_ptr<HeartbeatMonitor> monitor, std::chrono::milliseconds scan_interval)
      : runtime::PeriodicWorker("heartbeat-sweeper", scan_interval, [monitor] { monitor->RecoverStaleWorkers(); }) {
  }
};

} // namespace taskorch::heartbeat
