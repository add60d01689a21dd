#include <cassert>
#include <chrono>
#include <cmath>
#include <csignal>
#include <iostream>
#include <string>

#include "test_support.hpp"

namespace {

using namespace taskorch::v1;
using std::chrono::hours;
using std::chrono::minutes;
using taskorch::testing::Harness;
using taskorch::testing::Throws;

bool Near(double a, double b) {
  return std::fabs(a - b) < 1e-9;
}

void TestSpendRateAndDailyTotals() {
  Harness h;
  h.budget->RecordSpend(0.30, "claude", "T-1");
  h.budget->RecordSpend(0.20, "codex", "T-1");
  assert(Near(h.budget->SpendRate(), 0.5));
  assert(Near(h.budget->DailySpend(), 0.5));

  // rate window slides, the day does not
  h.clock.Advance(minutes(2));
  assert(Near(h.budget->SpendRate(), 0.0));
  assert(Near(h.budget->DailySpend(), 0.5));

  // 12:02 + 12h is the next UTC day
  h.clock.Advance(hours(12));
  assert(Near(h.budget->DailySpend(), 0.0));

  assert(Throws<taskorch::util::InvalidArgument>([&] { h.budget->RecordSpend(-1.0, "claude", ""); }));
}

void TestWithinLimitsNoBreach() {
  Harness h;
  h.budget->RecordSpend(0.9, "claude", "");
  auto result = h.budget->Check();
  assert(!result.breached);
  assert(!result.activated);
  assert(!h.budget->KillSwitchActive());
}

void TestRateBreachTripsKillSwitchAndEnforces() {
  Harness h;
  h.AddWorker("idle", 100);
  h.AddWorker("busy", 101);
  h.AddWorker("paused", 102);
  h.pool->Transition("paused", WORKER_STATUS_PAUSED);
  h.AddTask("T-1", "FIX");
  h.tasks->AssignTask("T-1", "busy");

  h.budget->RecordSpend(0.6, "claude", "T-1");
  h.budget->RecordSpend(0.6, "claude", "T-1");

  auto result = h.budget->Check();
  assert(result.breached);
  assert(result.activated);
  assert(result.reason.find("spend rate $1.20/min") != std::string::npos);
  assert(result.terminated == 2);

  assert(h.budget->KillSwitchActive());
  assert(h.pool->PauseState().paused);
  assert(h.process_control->CountSignals(SIGUSR1) == 3);
  assert(h.process_control->CountSignals(SIGKILL) == 2);
  assert(h.slept == h.options.budget.grace_period);

  assert(h.pool->GetWorker("idle").status == WORKER_STATUS_DEAD);
  assert(h.pool->GetWorker("busy").status == WORKER_STATUS_DEAD);
  assert(h.pool->GetWorker("paused").status == WORKER_STATUS_PAUSED);
  assert(h.tasks->GetTask("T-1").state == TASK_STATE_QUEUED);

  auto status = h.budget->Status();
  assert(status.kill_switch.active);
  assert(status.kill_switch.reason == result.reason);
  assert(status.kill_switch.triggered_at_ms > 0);
}

void TestKillSwitchIsSticky() {
  Harness h;
  h.AddWorker("w-1", 100);
  h.AddTask("T-1", "FIX");
  h.budget->RecordSpend(5.0, "claude", "");
  assert(h.budget->Check().activated);

  // spend rate is back to zero but the switch holds
  h.clock.Advance(minutes(10));
  auto again = h.budget->Check();
  assert(again.breached);
  assert(!again.activated);
  assert(again.reason == "kill switch already active");
  assert(h.budget->KillSwitchActive());

  h.pool->Resume();
  h.AddWorker("w-2", 200);
  assert(!h.pool->RequestClaim("w-2").has_value());
}

void TestResetKillSwitch() {
  Harness h;
  h.AddWorker("w-1", 100);
  h.budget->RecordSpend(5.0, "claude", "");
  h.budget->Check();

  assert(Throws<taskorch::util::InvalidArgument>([&] { h.budget->ResetKillSwitch(""); }));
  assert(h.budget->KillSwitchActive());

  h.clock.Advance(minutes(5));
  auto status = h.budget->ResetKillSwitch("alice");
  assert(!status.kill_switch.active);
  assert(status.kill_switch.reset_by == "alice");
  assert(status.kill_switch.reset_at_ms > 0);
  // the incident stays readable
  assert(!status.kill_switch.reason.empty());
  assert(!h.pool->PauseState().paused);

  h.AddWorker("w-2", 200);
  h.AddTask("T-1", "FIX");
  assert(h.pool->RequestClaim("w-2").has_value());
}

void TestDailyLimitBreach() {
  auto options                          = taskorch::testing::TestOptions();
  options.budget.rate_limit_per_minute = 0.0;
  options.budget.daily_limit           = 2.0;
  Harness h(options);

  h.budget->RecordSpend(1.5, "claude", "");
  h.clock.Advance(hours(1));
  assert(!h.budget->Check().breached);

  h.budget->RecordSpend(1.0, "claude", "");
  auto result = h.budget->Check();
  assert(result.activated);
  assert(result.reason == "daily spend $2.50 exceeds $2.00");
  assert(result.terminated == 0);
}

} // namespace

int main() {
  TestSpendRateAndDailyTotals();
  TestWithinLimitsNoBreach();
  TestRateBreachTripsKillSwitchAndEnforces();
  TestKillSwitchIsSticky();
  TestResetKillSwitch();
  TestDailyLimitBreach();

  std::cout << "taskorch_unit_budget: pass\n";
  return 0;
}
