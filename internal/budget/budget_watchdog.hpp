#pragma once

#include <memory>

#include "internal/budget/budget_governor.hpp"
#include "internal/runtime/periodic_worker.hpp"

namespace taskorch::budget {

class BudgetWatchdog final : public runtime::PeriodicWorker {
 public:
  BudgetWatchdog(std::shared_ptr<BudgetGovernor> governor, std::chrono::milliseconds check_interval)
      : runtime::PeriodicWorker("budget-watchdog", check_interval, [governor] { governor->Check(); }) {
  }
};

} // namespace taskorch::budget
