#pragma once

#include <optional>
#include <string_view>

#include "taskorch/v1/types.pb.h"

namespace taskorch::model {

using taskorch::v1::TaskState;

constexpr std::string_view ToString(TaskState state) {
  switch (state) {
    case taskorch::v1::TASK_STATE_QUEUED:
      return "QUEUED";
    case taskorch::v1::TASK_STATE_RUNNING:
      return "RUNNING";
    case taskorch::v1::TASK_STATE_REVIEW:
      return "REVIEW";
    case taskorch::v1::TASK_STATE_APPROVED:
      return "APPROVED";
    case taskorch::v1::TASK_STATE_REJECTED:
      return "REJECTED";
    case taskorch::v1::TASK_STATE_COMPLETED:
      return "COMPLETED";
    case taskorch::v1::TASK_STATE_FAILED:
      return "FAILED";
    case taskorch::v1::TASK_STATE_ESCALATED:
      return "ESCALATED";
    case taskorch::v1::TASK_STATE_CANCELLED:
      return "CANCELLED";
    default:
      return "UNSPECIFIED";
  }
}

constexpr std::optional<TaskState> ParseTaskState(std::string_view name) {
  for (auto state : {taskorch::v1::TASK_STATE_QUEUED, taskorch::v1::TASK_STATE_RUNNING, taskorch::v1::TASK_STATE_REVIEW,
                     taskorch::v1::TASK_STATE_APPROVED, taskorch::v1::TASK_STATE_REJECTED, taskorch::v1::TASK_STATE_COMPLETED,
                     taskorch::v1::TASK_STATE_FAILED, taskorch::v1::TASK_STATE_ESCALATED, taskorch::v1::TASK_STATE_CANCELLED}) {
    if (ToString(state) == name) {
      return state;
    }
  }
  return std::nullopt;
}

// Terminal rows are immutable; ESCALATED needs a human.
constexpr bool IsTerminal(TaskState state) {
  return state == taskorch::v1::TASK_STATE_COMPLETED || state == taskorch::v1::TASK_STATE_FAILED ||
         state == taskorch::v1::TASK_STATE_ESCALATED || state == taskorch::v1::TASK_STATE_CANCELLED;
}

constexpr bool CanTransition(TaskState from, TaskState to) {
  using namespace taskorch::v1;

  if (IsTerminal(from) || to == TASK_STATE_UNSPECIFIED) {
    return false;
  }
  if (to == TASK_STATE_FAILED) {
    return true;
  }

  switch (from) {
    case TASK_STATE_QUEUED:
      return to == TASK_STATE_RUNNING || to == TASK_STATE_CANCELLED;
    case TASK_STATE_RUNNING:
      // QUEUED: crash recovery, release or executor retry.
      // ESCALATED: executor retry budget exhausted.
      return to == TASK_STATE_REVIEW || to == TASK_STATE_QUEUED || to == TASK_STATE_ESCALATED;
    case TASK_STATE_REVIEW:
      return to == TASK_STATE_APPROVED || to == TASK_STATE_REJECTED || to == TASK_STATE_ESCALATED;
    case TASK_STATE_APPROVED:
      return to == TASK_STATE_COMPLETED;
    case TASK_STATE_REJECTED:
      return to == TASK_STATE_QUEUED || to == TASK_STATE_ESCALATED;
    default:
      return false;
  }
}

} // namespace taskorch::model
