#include "circuit_breaker.hpp"

#include "internal/core/store_ops.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace taskorch::breaker {

using namespace taskorch::v1;
using db::model::BreakerRecord;

CircuitBreaker::CircuitBreaker(std::shared_ptr<db::Repository> repository, config::BreakerOptions options, util::ClockFn clock)
    : repository_(std::move(repository)), options_(options), clock_(std::move(clock)) {
}

BreakerRecord CircuitBreaker::Load(db::Transaction& tx, const std::string& capability) {
  if (auto record = repository_->GetBreaker(tx, capability)) {
    return *record;
  }
  BreakerRecord record;
  record.capability = capability;
  return record;
}

void CircuitBreaker::Save(db::Transaction& tx, const BreakerRecord& record) {
  core::ThrowIfDbError(repository_->UpsertBreaker(tx, record), "save breaker " + record.capability);
}

bool CircuitBreaker::AllowCall(const std::string& capability) {
  return core::RunTransaction(*repository_, [&](db::Transaction& tx) {
    auto       record = Load(tx, capability);
    const auto now_ms = util::ToUnixMillis(clock_());

    const auto cooldown_ms = static_cast<uint64_t>(options_.cooldown.count());
    const bool cooled      = now_ms >= record.opened_at_ms + cooldown_ms;

    switch (record.state) {
      case BREAKER_STATE_OPEN: {
        if (!cooled) {
          return false;
        }
        record.state           = BREAKER_STATE_HALF_OPEN;
        record.half_open_calls = 1;
        record.opened_at_ms    = now_ms;
        Save(tx, record);
        TASKORCH_LOG_INFO("Breaker half-open", {observability::StringField("capability", capability)});
        return true;
      }
      case BREAKER_STATE_HALF_OPEN:
        if (record.half_open_calls < options_.half_open_max_calls) {
          record.half_open_calls++;
          Save(tx, record);
          return true;
        }
        if (!cooled) {
          return false;
        }
        // the admitted trial never reported back
        record.half_open_calls = 1;
        record.opened_at_ms    = now_ms;
        Save(tx, record);
        TASKORCH_LOG_WARN("Breaker trial unreported, admitting another", {observability::StringField("capability", capability)});
        return true;
      default:
        return true;
    }
  });
}

void CircuitBreaker::RecordSuccess(const std::string& capability) {
  core::RunTransaction(*repository_, [&](db::Transaction& tx) {
    auto record = Load(tx, capability);
    if (record.state != BREAKER_STATE_CLOSED) {
      TASKORCH_LOG_INFO("Breaker closed", {observability::StringField("capability", capability)});
    }
    record.state           = BREAKER_STATE_CLOSED;
    record.failure_count   = 0;
    record.half_open_calls = 0;
    record.last_success_ms = util::ToUnixMillis(clock_());
    Save(tx, record);
  });
}

void CircuitBreaker::RecordFailure(const std::string& capability) {
  const bool tripped = core::RunTransaction(*repository_, [&](db::Transaction& tx) {
    auto       record = Load(tx, capability);
    const auto now_ms = util::ToUnixMillis(clock_());

    record.failure_count++;
    record.last_failure_ms = now_ms;

    bool trip = false;
    if (record.state == BREAKER_STATE_HALF_OPEN) {
      trip = true;
    } else if (record.state == BREAKER_STATE_CLOSED && record.failure_count >= options_.failure_threshold) {
      trip = true;
    }
    if (trip) {
      record.state           = BREAKER_STATE_OPEN;
      record.opened_at_ms    = now_ms;
      record.half_open_calls = 0;
    }
    Save(tx, record);
    return trip;
  });

  if (tripped) {
    observability::Metrics::Instance().RecordBreakerTrip(capability);
    TASKORCH_LOG_WARN("Breaker opened", {observability::StringField("capability", capability)});
  }
}

BreakerRecord CircuitBreaker::Get(const std::string& capability) {
  auto tx     = repository_->Begin();
  auto record = Load(*tx, capability);
  tx->Commit();
  return record;
}

std::vector<BreakerRecord> CircuitBreaker::Status() {
  auto tx      = repository_->Begin();
  auto records = repository_->ListBreakers(*tx);
  tx->Commit();
  return records;
}

BreakerRecord CircuitBreaker::Reset(const std::string& capability) {
  if (capability.empty()) {
    throw util::InvalidArgument("capability is required");
  }
  auto record = core::RunTransaction(*repository_, [&](db::Transaction& tx) {
    BreakerRecord record = Load(tx, capability);
    record.state           = BREAKER_STATE_CLOSED;
    record.failure_count   = 0;
    record.half_open_calls = 0;
    record.opened_at_ms    = 0;
    Save(tx, record);
    return record;
  });
  TASKORCH_LOG_INFO("Breaker reset", {observability::StringField("capability", capability)});
  return record;
}

} // namespace taskorch::breaker
