#pragma once

#include <memory>
#include <string>
#include <vector>

#include "internal/config/options.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace taskorch::breaker {

/*
  Per-capability circuit breaker, state persisted in the store.

    CLOSED --failures >= threshold--> OPEN --cooldown--> HALF_OPEN
    HALF_OPEN --success--> CLOSED
    HALF_OPEN --failure--> OPEN (cooldown restarts)

  opened_at_ms is when the breaker opened or last admitted a
  half-open trial. A trial nobody reports on (its worker died) stops
  blocking the capability after another cooldown, when a fresh trial
  is admitted.

  Every process shares the same row, so a trip seen by one worker
  fails fast for all of them.
*/
class CircuitBreaker {
 public:
  CircuitBreaker(std::shared_ptr<db::Repository> repository, config::BreakerOptions options, util::ClockFn clock = util::Now);

  // Admits the call; performs OPEN -> HALF_OPEN once the cooldown elapsed.
  bool AllowCall(const std::string& capability);

  void RecordSuccess(const std::string& capability);
  void RecordFailure(const std::string& capability);

  /*
    Throws util::CircuitOpen without invoking fn while the breaker
    rejects calls. Only exceptions from fn count as failures; a store
    error while recording the outcome propagates as is.
  */
  template <typename Fn>
  auto Call(const std::string& capability, Fn&& fn) -> decltype(fn()) {
    if (!AllowCall(capability)) {
      throw util::CircuitOpen("circuit open for " + capability);
    }
    auto value = [&] {
      try {
        return fn();
      } catch (const std::exception&) {
        RecordFailure(capability);
        throw;
      }
    }();
    RecordSuccess(capability);
    return value;
  }

  db::model::BreakerRecord              Get(const std::string& capability);
  std::vector<db::model::BreakerRecord> Status();

  // Operator action: back to CLOSED with counters cleared.
  db::model::BreakerRecord Reset(const std::string& capability);

 private:
  db::model::BreakerRecord Load(db::Transaction& tx, const std::string& capability);
  void                     Save(db::Transaction& tx, const db::model::BreakerRecord& record);

  std::shared_ptr<db::Repository> repository_;
  config::BreakerOptions          options_;
  util::ClockFn                   clock_;
};

} // namespace taskorch::breaker
