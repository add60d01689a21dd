#pragma once

#include <string>
#include <string_view>

namespace taskorch::db {

/*
  Portable DB result codes.

  The repository layer must translate backend errors into these.
  Upper layers should never depend on pqxx/sqlite error types.

    Conflict             MarkClaimed lost the task to another worker
    Busy                 sqlite lock timeout or an exhausted pg pool
    ConstraintViolation  a write the store's own rules reject
    SerializationFailure the transaction should be re-run
*/

enum class ErrorCode {
  OK = 0,

  NotFound,
  AlreadyExists,
  Conflict,
  Busy,

  ConstraintViolation,
  SerializationFailure,

  IOError,
  Corruption,

  InternalError
};

constexpr std::string_view ToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK:
      return "OK";
    case ErrorCode::NotFound:
      return "NOT_FOUND";
    case ErrorCode::AlreadyExists:
      return "ALREADY_EXISTS";
    case ErrorCode::Conflict:
      return "CONFLICT";
    case ErrorCode::Busy:
      return "BUSY";
    case ErrorCode::ConstraintViolation:
      return "CONSTRAINT_VIOLATION";
    case ErrorCode::SerializationFailure:
      return "SERIALIZATION_FAILURE";
    case ErrorCode::IOError:
      return "IO_ERROR";
    case ErrorCode::Corruption:
      return "CORRUPTION";
    case ErrorCode::InternalError:
      return "INTERNAL_ERROR";
  }
  return "UNKNOWN";
}

struct Result {
  ErrorCode   code = ErrorCode::OK;
  std::string message;

  static Result Ok() {
    return {};
  }

  static Result Err(ErrorCode c, std::string msg = {}) {
    return {c, std::move(msg)};
  }

  explicit operator bool() const {
    return code == ErrorCode::OK;
  }
};

} // namespace taskorch::db
