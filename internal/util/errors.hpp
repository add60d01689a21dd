#pragma once

#include <stdexcept>
#include <string>

namespace taskorch::util {

/*
  Central error types.

  These get translated later to gRPC status codes
  (see internal/grpc/grpc_error.cpp).
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class AlreadyExists : public std::runtime_error {
 public:
  explicit AlreadyExists(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Task or worker state change outside the allowed graph.
class InvalidTransition : public InvalidState {
 public:
  explicit InvalidTransition(const std::string& msg) : InvalidState(msg) {
  }
};

// Another worker claimed the task first.
class ClaimConflict : public std::runtime_error {
 public:
  explicit ClaimConflict(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Heartbeat or update from a worker that no longer owns the task.
class StaleWorker : public std::runtime_error {
 public:
  explicit StaleWorker(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ExecutorError : public std::runtime_error {
 public:
  explicit ExecutorError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ExecutorTimeout : public ExecutorError {
 public:
  explicit ExecutorTimeout(const std::string& msg) : ExecutorError(msg) {
  }
};

class CircuitOpen : public std::runtime_error {
 public:
  explicit CircuitOpen(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ConsensusInconclusive : public std::runtime_error {
 public:
  explicit ConsensusInconclusive(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Kill switch is active; no new work may start.
class BudgetExceeded : public std::runtime_error {
 public:
  explicit BudgetExceeded(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Store busy or unreachable after the busy timeout.
class StoreUnavailable : public std::runtime_error {
 public:
  explicit StoreUnavailable(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace taskorch::util
