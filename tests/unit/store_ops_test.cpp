#include <cassert>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/core/store_ops.hpp"
#include "internal/db/api/transaction.hpp"
#include "test_support.hpp"

namespace {

using namespace taskorch::v1;
using taskorch::core::RunTransaction;
using taskorch::core::ThrowIfDbError;
using taskorch::db::ErrorCode;
using taskorch::db::Result;
using taskorch::testing::Harness;
using taskorch::testing::Throws;

void TestErrorCodesMapToDomainErrors() {
  ThrowIfDbError(Result::Ok(), "noop");

  assert(Throws<taskorch::util::NotFound>([] { ThrowIfDbError(Result::Err(ErrorCode::NotFound), "x"); }));
  assert(Throws<taskorch::util::AlreadyExists>([] { ThrowIfDbError(Result::Err(ErrorCode::AlreadyExists), "x"); }));
  assert(Throws<taskorch::util::ClaimConflict>([] { ThrowIfDbError(Result::Err(ErrorCode::Conflict), "x"); }));
  assert(Throws<taskorch::util::InvalidTransition>([] { ThrowIfDbError(Result::Err(ErrorCode::ConstraintViolation), "x"); }));
  assert(Throws<taskorch::util::StoreUnavailable>([] { ThrowIfDbError(Result::Err(ErrorCode::Busy), "x"); }));
  assert(Throws<taskorch::util::StoreUnavailable>([] { ThrowIfDbError(Result::Err(ErrorCode::IOError), "x"); }));
  assert(Throws<taskorch::db::TransactionConflict>([] { ThrowIfDbError(Result::Err(ErrorCode::SerializationFailure), "x"); }));

  try {
    ThrowIfDbError(Result::Err(ErrorCode::Corruption, "malformed page"), "load task T-1");
    assert(false);
  } catch (const std::runtime_error& e) {
    assert(std::string(e.what()) == "load task T-1: malformed page [CORRUPTION]");
  }

  try {
    ThrowIfDbError(Result::Err(ErrorCode::NotFound), "task T-9");
    assert(false);
  } catch (const taskorch::util::NotFound& e) {
    assert(std::string(e.what()) == "task T-9");
  }

  assert(taskorch::db::ToString(ErrorCode::SerializationFailure) == "SERIALIZATION_FAILURE");
}

void TestConflictIsRetried() {
  Harness h;
  int     runs  = 0;
  auto    value = RunTransaction(*h.repository, [&](taskorch::db::Transaction&) {
    if (++runs < 3) {
      throw taskorch::db::TransactionConflict("lost the race");
    }
    return 42;
  });
  assert(value == 42);
  assert(runs == 3);
}

void TestRetriesAreBounded() {
  Harness h;
  int     runs = 0;
  assert(Throws<taskorch::db::TransactionConflict>([&] {
    RunTransaction(
        *h.repository,
        [&](taskorch::db::Transaction&) {
          ++runs;
          throw taskorch::db::TransactionConflict("always");
        },
        4);
  }));
  assert(runs == 4);
}

void TestOtherErrorsRollBackWithoutRetry() {
  Harness h;
  h.AddWorker("w-1", 100);
  int runs = 0;

  assert(Throws<taskorch::util::StoreUnavailable>([&] {
    RunTransaction(*h.repository, [&](taskorch::db::Transaction& tx) {
      ++runs;
      auto worker   = h.repository->GetWorker(tx, "w-1");
      worker->shard = "shard-9";
      ThrowIfDbError(h.repository->UpdateWorker(tx, *worker), "move worker");
      ThrowIfDbError(Result::Err(ErrorCode::Busy, "database is locked"), "append event");
    });
  }));
  assert(runs == 1);
  // the first write went away with the transaction
  assert(h.pool->GetWorker("w-1").shard.empty());
}

void TestSettleWorkerWaitsForLastTask() {
  Harness h;
  h.AddWorker("w-1", 100);
  h.AddTask("T-1", "FIX");
  h.AddTask("T-2", "FIX");
  h.tasks->AssignTask("T-1", "w-1");
  h.tasks->AssignTask("T-2", "w-1");

  h.tasks->ReleaseTask("T-1", "operator");
  assert(h.pool->GetWorker("w-1").status == WORKER_STATUS_BUSY);
  h.tasks->ReleaseTask("T-2", "operator");
  assert(h.pool->GetWorker("w-1").status == WORKER_STATUS_IDLE);

  // settling an idle or unknown worker changes nothing
  RunTransaction(*h.repository, [&](taskorch::db::Transaction& tx) {
    taskorch::core::SettleWorker(*h.repository, tx, "w-1");
    taskorch::core::SettleWorker(*h.repository, tx, "ghost");
    taskorch::core::SettleWorker(*h.repository, tx, "");
  });
  assert(h.pool->GetWorker("w-1").status == WORKER_STATUS_IDLE);
}

} // namespace

int main() {
  TestErrorCodesMapToDomainErrors();
  TestConflictIsRetried();
  TestRetriesAreBounded();
  TestOtherErrorsRollBackWithoutRetry();
  TestSettleWorkerWaitsForLastTask();

  std::cout << "taskorch_unit_store_ops: pass\n";
  return 0;
}
