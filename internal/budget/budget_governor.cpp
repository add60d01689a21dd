#include "budget_governor.hpp"

#include <csignal>
#include <sstream>
#include <thread>

#include "internal/core/store_ops.hpp"
#include "internal/heartbeat/heartbeat_monitor.hpp"
#include "internal/model/worker_status.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/pool/worker_pool_manager.hpp"
#include "internal/util/errors.hpp"

namespace taskorch::budget {

using namespace taskorch::v1;

namespace {

std::string FormatAmount(double amount) {
  std::ostringstream out;
  out.setf(std::ios::fixed);
  out.precision(2);
  out << amount;
  return out.str();
}

bool HasPaused(WorkerStatus status) {
  return status == WORKER_STATUS_PAUSED || status == WORKER_STATUS_STOPPING || model::IsGone(status);
}

} // namespace

BudgetGovernor::BudgetGovernor(std::shared_ptr<db::Repository> repository, std::shared_ptr<pool::WorkerPoolManager> pool,
                               std::shared_ptr<heartbeat::HeartbeatMonitor> monitor, config::BudgetOptions options, util::ClockFn clock,
                               SleepFn sleep)
    : repository_(std::move(repository)),
      pool_(std::move(pool)),
      monitor_(std::move(monitor)),
      options_(options),
      clock_(std::move(clock)),
      sleep_(std::move(sleep)) {
  if (!sleep_) {
    sleep_ = [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
  }
}

void BudgetGovernor::RecordSpend(double amount, const std::string& capability, const std::string& task_id) {
  if (amount < 0.0) {
    throw util::InvalidArgument("spend amount must not be negative");
  }
  core::RunTransaction(*repository_, [&](db::Transaction& tx) {
    db::model::LedgerEntry entry;
    entry.timestamp_ms = util::ToUnixMillis(clock_());
    entry.amount       = amount;
    entry.capability   = capability;
    entry.task_id      = task_id;
    core::ThrowIfDbError(repository_->AppendLedger(tx, entry), "append ledger");
  });
  observability::Metrics::Instance().RecordSpend(capability, amount);
}

double BudgetGovernor::SpendRate() {
  const auto now    = clock_();
  const auto window = options_.rate_window;
  auto       tx     = repository_->Begin();
  const auto total  = repository_->SumLedgerSince(*tx, util::ToUnixMillis(now - window));
  tx->Commit();
  const double minutes = std::chrono::duration<double, std::ratio<60>>(window).count();
  return minutes > 0.0 ? total / minutes : total;
}

double BudgetGovernor::DailySpend() {
  auto       tx    = repository_->Begin();
  const auto total = repository_->SumLedgerSince(*tx, util::ToUnixMillis(util::StartOfUtcDay(clock_())));
  tx->Commit();
  return total;
}

bool BudgetGovernor::KillSwitchActive() {
  auto tx     = repository_->Begin();
  auto record = repository_->GetKillSwitch(*tx);
  tx->Commit();
  return record.active;
}

CheckResult BudgetGovernor::Check() {
  observability::SpanScope span("BudgetGovernor.Check");
  CheckResult              result;

  if (KillSwitchActive()) {
    result.breached = true;
    result.reason   = "kill switch already active";
    return result;
  }

  const double rate  = SpendRate();
  const double daily = DailySpend();
  std::string  threshold;
  if (options_.rate_limit_per_minute > 0.0 && rate > options_.rate_limit_per_minute) {
    threshold     = "rate";
    result.reason = "spend rate $" + FormatAmount(rate) + "/min exceeds $" + FormatAmount(options_.rate_limit_per_minute) + "/min";
  } else if (options_.daily_limit > 0.0 && daily > options_.daily_limit) {
    threshold     = "daily";
    result.reason = "daily spend $" + FormatAmount(daily) + " exceeds $" + FormatAmount(options_.daily_limit);
  } else {
    return result;
  }
  result.breached = true;

  result.activated = core::RunTransaction(*repository_, [&](db::Transaction& tx) {
    auto current = repository_->GetKillSwitch(tx);
    // another governor won
    if (current.active) {
      return false;
    }
    db::model::KillSwitchRecord record;
    record.active          = true;
    record.reason          = result.reason;
    record.triggered_at_ms = util::ToUnixMillis(clock_());
    core::ThrowIfDbError(repository_->PutKillSwitch(tx, record), "activate kill switch");
    return true;
  });

  if (result.activated) {
    TASKORCH_LOG_ERROR("Kill switch activated", {observability::StringField("reason", result.reason)});
    observability::Metrics::Instance().RecordKillSwitch(threshold);
    result.terminated = Enforce(result.reason);
  }
  return result;
}

size_t BudgetGovernor::Enforce(const std::string& reason) {
  pool_->RequestPause("kill switch: " + reason);
  pool_->SignalWorkers(SIGUSR1);

  sleep_(options_.grace_period);

  size_t terminated = 0;
  for (const auto& worker : pool_->ListWorkers()) {
    if (HasPaused(worker.status)) {
      continue;
    }
    if (pool_->Terminate(worker.worker_id)) {
      ++terminated;
    }
    monitor_->RecoverWorker(worker.worker_id, "terminated by budget kill switch");
  }
  if (terminated > 0) {
    TASKORCH_LOG_WARN("Workers terminated after grace period", {observability::IntField("count", static_cast<int64_t>(terminated))});
  }
  return terminated;
}

BudgetStatus BudgetGovernor::Status() {
  BudgetStatus status;
  status.spend_rate_per_minute = SpendRate();
  status.daily_spend           = DailySpend();
  status.rate_limit_per_minute = options_.rate_limit_per_minute;
  status.daily_limit           = options_.daily_limit;

  auto tx            = repository_->Begin();
  status.kill_switch = repository_->GetKillSwitch(*tx);
  tx->Commit();
  return status;
}

BudgetStatus BudgetGovernor::ResetKillSwitch(const std::string& operator_id) {
  if (operator_id.empty()) {
    throw util::InvalidArgument("operator_id is required to reset the kill switch");
  }

  const bool was_active = core::RunTransaction(*repository_, [&](db::Transaction& tx) {
    auto record = repository_->GetKillSwitch(tx);
    if (!record.active) {
      return false;
    }
    record.active      = false;
    record.reset_at_ms = util::ToUnixMillis(clock_());
    record.reset_by    = operator_id;
    core::ThrowIfDbError(repository_->PutKillSwitch(tx, record), "reset kill switch");
    return true;
  });

  if (was_active) {
    pool_->Resume();
    TASKORCH_LOG_WARN("Kill switch reset", {observability::StringField("operator", operator_id)});
  }
  return Status();
}

} // namespace taskorch::budget
