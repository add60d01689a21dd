#pragma once

#include <optional>
#include <string_view>

#include "taskorch/v1/types.pb.h"

namespace taskorch::model {

using taskorch::v1::WorkerStatus;

constexpr std::string_view ToString(WorkerStatus status) {
  switch (status) {
    case taskorch::v1::WORKER_STATUS_STARTING:
      return "starting";
    case taskorch::v1::WORKER_STATUS_IDLE:
      return "idle";
    case taskorch::v1::WORKER_STATUS_BUSY:
      return "busy";
    case taskorch::v1::WORKER_STATUS_PAUSED:
      return "paused";
    case taskorch::v1::WORKER_STATUS_STOPPING:
      return "stopping";
    case taskorch::v1::WORKER_STATUS_DEAD:
      return "dead";
    case taskorch::v1::WORKER_STATUS_CRASHED:
      return "crashed";
    default:
      return "unspecified";
  }
}

constexpr std::optional<WorkerStatus> ParseWorkerStatus(std::string_view name) {
  for (auto status : {taskorch::v1::WORKER_STATUS_STARTING, taskorch::v1::WORKER_STATUS_IDLE, taskorch::v1::WORKER_STATUS_BUSY,
                      taskorch::v1::WORKER_STATUS_PAUSED, taskorch::v1::WORKER_STATUS_STOPPING, taskorch::v1::WORKER_STATUS_DEAD,
                      taskorch::v1::WORKER_STATUS_CRASHED}) {
    if (ToString(status) == name) {
      return status;
    }
  }
  return std::nullopt;
}

constexpr bool IsGone(WorkerStatus status) {
  return status == taskorch::v1::WORKER_STATUS_DEAD || status == taskorch::v1::WORKER_STATUS_CRASHED;
}

/*
  starting -> idle <-> busy -> stopping -> {dead|crashed}

  paused is entered only from idle. A live worker may also be
  marked dead/crashed directly by crash recovery. dead/crashed
  go back to starting on re-registration.

  Must stay in sync with the workers_status_transition trigger.
*/
constexpr bool CanTransition(WorkerStatus from, WorkerStatus to) {
  using namespace taskorch::v1;

  if (from == to) {
    return true;
  }

  switch (from) {
    case WORKER_STATUS_STARTING:
      return to == WORKER_STATUS_IDLE || to == WORKER_STATUS_STOPPING;
    case WORKER_STATUS_IDLE:
      return to == WORKER_STATUS_BUSY || to == WORKER_STATUS_PAUSED || to == WORKER_STATUS_STOPPING || IsGone(to);
    case WORKER_STATUS_BUSY:
      return to == WORKER_STATUS_IDLE || to == WORKER_STATUS_STOPPING || IsGone(to);
    case WORKER_STATUS_PAUSED:
      return to == WORKER_STATUS_IDLE || to == WORKER_STATUS_STOPPING || IsGone(to);
    case WORKER_STATUS_STOPPING:
      return IsGone(to);
    case WORKER_STATUS_DEAD:
    case WORKER_STATUS_CRASHED:
      return to == WORKER_STATUS_STARTING;
    default:
      return false;
  }
}

} // namespace taskorch::model
