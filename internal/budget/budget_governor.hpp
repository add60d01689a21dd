#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <string>

#include "internal/config/options.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/util/time.hpp"

namespace taskorch::pool {
class WorkerPoolManager;
}
namespace taskorch::heartbeat {
class HeartbeatMonitor;
}

namespace taskorch::budget {

struct BudgetStatus {
  double                      spend_rate_per_minute = 0.0;
  double                      daily_spend           = 0.0;
  double                      rate_limit_per_minute = 0.0;
  double                      daily_limit           = 0.0;
  db::model::KillSwitchRecord kill_switch;
};

struct CheckResult {
  bool        breached  = false;
  bool        activated = false;
  std::string reason;
  size_t      terminated = 0;
};

using SleepFn = std::function<void(std::chrono::milliseconds)>;

/*
  BudgetGovernor

  Watches the spend ledger against a rate limit and a daily cap.
  A breach trips the kill switch, pauses the pool, waits the grace
  period and then kills every worker that did not pause.

  The kill switch is sticky: only ResetKillSwitch clears it.
*/
class BudgetGovernor {
 public:
  BudgetGovernor(std::shared_ptr<db::Repository> repository, std::shared_ptr<pool::WorkerPoolManager> pool,
                 std::shared_ptr<heartbeat::HeartbeatMonitor> monitor, config::BudgetOptions options, util::ClockFn clock = util::Now,
                 SleepFn sleep = nullptr);

  void RecordSpend(double amount, const std::string& capability, const std::string& task_id);

  // $/minute over the configured window.
  double SpendRate();
  // UTC day start until now.
  double DailySpend();

  CheckResult  Check();
  BudgetStatus Status();
  bool         KillSwitchActive();

  BudgetStatus ResetKillSwitch(const std::string& operator_id);

 private:
  // Pause, grace period, then SIGKILL stragglers and recover their tasks.
  size_t Enforce(const std::string& reason);

  std::shared_ptr<db::Repository>              repository_;
  std::shared_ptr<pool::WorkerPoolManager>     pool_;
  std::shared_ptr<heartbeat::HeartbeatMonitor> monitor_;
  config::BudgetOptions                        options_;
  util::ClockFn                                clock_;
  SleepFn                                      sleep_;
};

} // namespace taskorch::budget
