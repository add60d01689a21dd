#pragma once

#include <cstdint>
#include <string>
#include <type_traits>
#include <utility>

#include "internal/db/api/repository.hpp"

namespace taskorch::core {

// Converts a repository Result into the matching util exception.
void ThrowIfDbError(const db::Result& result, const std::string& context);

// Appends one audit event; throws on store failure.
void AppendEvent(db::Repository& repo, db::Transaction& tx, const std::string& task_id, const std::string& event_type, const std::string& actor,
                 const std::string& payload, const std::string& trace_id, uint64_t now_ms);

// busy -> idle once the worker owns no RUNNING task. No-op for any other status.
void SettleWorker(db::Repository& repo, db::Transaction& tx, const std::string& worker_id);

/*
  Runs fn(tx) in a fresh transaction and commits it.

  A commit that loses an optimistic race (db::TransactionConflict)
  is re-run from scratch, up to attempts times.
*/
template <typename Fn>
auto RunTransaction(db::Repository& repo, Fn&& fn, int attempts = 5) {
  for (int attempt = 1;; ++attempt) {
    auto tx = repo.Begin();
    try {
      if constexpr (std::is_void_v<decltype(fn(*tx))>) {
        fn(*tx);
        tx->Commit();
        return;
      } else {
        auto value = fn(*tx);
        tx->Commit();
        return value;
      }
    } catch (const db::TransactionConflict&) {
      if (attempt >= attempts) {
        throw;
      }
    }
  }
}

} // namespace taskorch::core
