#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "config/config.pb.h"

namespace taskorch::config {

/*
  Typed runtime options with defaults applied.

  Built once from RuntimeConfig at startup and passed to each
  component explicitly. Components never read RuntimeConfig.
*/

using Millis = std::chrono::milliseconds;

struct ServerOptions {
  std::string bind_address{"0.0.0.0:50061"};
  // in-flight RPCs get this long to finish before they are cancelled
  Millis   shutdown_grace{5000};
  // 0 keeps the gRPC default
  uint32_t max_message_bytes = 0;
};

struct PoolOptions {
  uint32_t max_concurrent_tasks_per_worker = 3;
  uint32_t shard_count                     = 3;
  Millis   poll_interval{5000};
  Millis   max_backoff{60000};
  uint32_t claim_attempts      = 5;
  uint32_t rebalance_threshold = 5;
  Millis   rebalance_interval{60000};
};

struct HeartbeatOptions {
  Millis stale_threshold{300000};
  Millis scan_interval{30000};
  Millis interval{30000};
  double grace_multiplier = 1.5;
  // expected runtime per task type
  std::map<std::string, Millis> task_type_timeouts;
};

struct ConsensusOptions {
  std::vector<std::string> capabilities;
  uint32_t                 min_approvals = 2;
  std::vector<std::string> unanimous_task_types;
  Millis                   vote_timeout{120000};
  Millis                   review_poll_interval{5000};
};

struct BreakerOptions {
  uint32_t failure_threshold = 3;
  Millis   cooldown{60000};
  uint32_t half_open_max_calls = 1;
};

struct BudgetOptions {
  // 0 disables the threshold
  double rate_limit_per_minute = 1.0;
  Millis rate_window{60000};
  double daily_limit = 50.0;
  Millis check_interval{60000};
  Millis grace_period{30000};
};

struct LifecycleOptions {
  uint32_t max_retries_per_task = 3;
};

struct Route {
  std::string capability;
  std::string lane;
};

struct RoutingOptions {
  std::map<std::string, Route> table;
  Route                        fallback;
};

struct ExecutorOptions {
  std::map<std::string, std::string> commands;
  Millis                             timeout{300000};
};

struct Options {
  ServerOptions    server;
  PoolOptions      pool;
  HeartbeatOptions heartbeat;
  ConsensusOptions consensus;
  BreakerOptions   breaker;
  BudgetOptions    budget;
  LifecycleOptions lifecycle;
  RoutingOptions   routing;
  ExecutorOptions  executor;
};

// Defaults for every field; also what an empty RuntimeConfig resolves to.
Options DefaultOptions();

// Throws std::invalid_argument on values no component can work with.
Options ResolveOptions(const taskorch::runtime::config::RuntimeConfig& config);

} // namespace taskorch::config
