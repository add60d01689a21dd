#include "store_ops.hpp"

#include <stdexcept>

#include "internal/util/errors.hpp"

namespace taskorch::core {

void ThrowIfDbError(const db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  switch (result.code) {
    case db::ErrorCode::AlreadyExists:
      throw util::AlreadyExists(message);
    case db::ErrorCode::NotFound:
      throw util::NotFound(message);
    case db::ErrorCode::Conflict:
      throw util::ClaimConflict(message);
    case db::ErrorCode::ConstraintViolation:
      throw util::InvalidTransition(message);
    case db::ErrorCode::Busy:
    case db::ErrorCode::IOError:
      throw util::StoreUnavailable(message);
    case db::ErrorCode::SerializationFailure:
      throw db::TransactionConflict(message);
    default:
      // corruption and internal errors keep their code for the operator
      throw std::runtime_error(message + " [" + std::string(db::ToString(result.code)) + "]");
  }
}

void AppendEvent(db::Repository& repo, db::Transaction& tx, const std::string& task_id, const std::string& event_type, const std::string& actor,
                 const std::string& payload, const std::string& trace_id, uint64_t now_ms) {
  db::model::EventRecord event;
  event.task_id      = task_id;
  event.event_type   = event_type;
  event.actor        = actor;
  event.payload      = payload;
  event.trace_id     = trace_id;
  event.timestamp_ms = now_ms;
  ThrowIfDbError(repo.AppendEvent(tx, event), "append event " + event_type);
}

void SettleWorker(db::Repository& repo, db::Transaction& tx, const std::string& worker_id) {
  if (worker_id.empty()) {
    return;
  }
  auto worker = repo.GetWorker(tx, worker_id);
  if (!worker || worker->status != taskorch::v1::WORKER_STATUS_BUSY) {
    return;
  }
  if (!repo.ListRunningByWorker(tx, worker_id).empty()) {
    return;
  }
  worker->status = taskorch::v1::WORKER_STATUS_IDLE;
  ThrowIfDbError(repo.UpdateWorker(tx, *worker), "settle worker " + worker_id);
}

} // namespace taskorch::core
