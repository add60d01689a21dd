#pragma once

#include <optional>
#include <string_view>

#include "taskorch/v1/types.pb.h"

namespace taskorch::model {

constexpr std::string_view ToString(taskorch::v1::Priority priority) {
  switch (priority) {
    case taskorch::v1::PRIORITY_CRITICAL:
      return "CRITICAL";
    case taskorch::v1::PRIORITY_HIGH:
      return "HIGH";
    case taskorch::v1::PRIORITY_LOW:
      return "LOW";
    case taskorch::v1::PRIORITY_MEDIUM:
    default:
      return "MEDIUM";
  }
}

// Unknown names fall back to MEDIUM.
constexpr taskorch::v1::Priority ParsePriority(std::string_view name) {
  if (name == "CRITICAL") return taskorch::v1::PRIORITY_CRITICAL;
  if (name == "HIGH") return taskorch::v1::PRIORITY_HIGH;
  if (name == "LOW") return taskorch::v1::PRIORITY_LOW;
  return taskorch::v1::PRIORITY_MEDIUM;
}

constexpr std::string_view ToString(taskorch::v1::Vote vote) {
  switch (vote) {
    case taskorch::v1::VOTE_APPROVE:
      return "APPROVE";
    case taskorch::v1::VOTE_REJECT:
      return "REJECT";
    case taskorch::v1::VOTE_ABSTAIN:
      return "ABSTAIN";
    case taskorch::v1::VOTE_TIMEOUT:
      return "TIMEOUT";
    case taskorch::v1::VOTE_ERROR:
      return "ERROR";
    default:
      return "UNSPECIFIED";
  }
}

constexpr std::optional<taskorch::v1::Vote> ParseVoteName(std::string_view name) {
  for (auto vote : {taskorch::v1::VOTE_APPROVE, taskorch::v1::VOTE_REJECT, taskorch::v1::VOTE_ABSTAIN, taskorch::v1::VOTE_TIMEOUT,
                    taskorch::v1::VOTE_ERROR}) {
    if (ToString(vote) == name) {
      return vote;
    }
  }
  return std::nullopt;
}

constexpr std::string_view ToString(taskorch::v1::ConsensusResult result) {
  switch (result) {
    case taskorch::v1::CONSENSUS_RESULT_PENDING:
      return "PENDING";
    case taskorch::v1::CONSENSUS_RESULT_PASS:
      return "PASS";
    case taskorch::v1::CONSENSUS_RESULT_FAIL:
      return "FAIL";
    case taskorch::v1::CONSENSUS_RESULT_INCONCLUSIVE:
      return "INCONCLUSIVE";
    default:
      return "UNSPECIFIED";
  }
}

constexpr std::optional<taskorch::v1::ConsensusResult> ParseConsensusResult(std::string_view name) {
  for (auto result : {taskorch::v1::CONSENSUS_RESULT_PENDING, taskorch::v1::CONSENSUS_RESULT_PASS, taskorch::v1::CONSENSUS_RESULT_FAIL,
                      taskorch::v1::CONSENSUS_RESULT_INCONCLUSIVE}) {
    if (ToString(result) == name) {
      return result;
    }
  }
  return std::nullopt;
}

constexpr std::string_view ToString(taskorch::v1::BreakerState state) {
  switch (state) {
    case taskorch::v1::BREAKER_STATE_OPEN:
      return "OPEN";
    case taskorch::v1::BREAKER_STATE_HALF_OPEN:
      return "HALF_OPEN";
    case taskorch::v1::BREAKER_STATE_CLOSED:
    default:
      return "CLOSED";
  }
}

constexpr taskorch::v1::BreakerState ParseBreakerState(std::string_view name) {
  if (name == "OPEN") return taskorch::v1::BREAKER_STATE_OPEN;
  if (name == "HALF_OPEN") return taskorch::v1::BREAKER_STATE_HALF_OPEN;
  return taskorch::v1::BREAKER_STATE_CLOSED;
}

} // namespace taskorch::model
