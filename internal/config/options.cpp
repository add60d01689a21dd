#include "options.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

#include "internal/util/time.hpp"

namespace taskorch::config {

namespace {

void OverrideMillis(const google::protobuf::Duration& d, bool present, Millis& out) {
  if (!present) return;
  auto ms = taskorch::util::FromProto(d);
  if (ms.count() <= 0) {
    throw std::invalid_argument("durations must be positive");
  }
  out = ms;
}

// task types are stored upper-cased; keys written in config may not be
std::string UpperType(std::string type) {
  std::transform(type.begin(), type.end(), type.begin(), [](unsigned char ch) { return static_cast<char>(std::toupper(ch)); });
  return type;
}

RoutingOptions DefaultRouting() {
  RoutingOptions r;
  const Route implement{"claude", "impl"};
  const Route review{"codex", "review"};
  const Route analyse{"gemini", "analysis"};

  for (const char* type : {"IMPLEMENTATION", "FEATURE", "FIX", "BUILD", "CODE", "BUG"}) r.table[type] = implement;
  for (const char* type : {"REVIEW", "AUDIT", "GATE", "QUALITY"}) r.table[type] = review;
  for (const char* type : {"ANALYSIS", "RESEARCH", "ARCH", "DESIGN"}) r.table[type] = analyse;
  // highest-trust capability regardless of load
  r.table["SECURITY"] = Route{"claude", "review"};

  r.fallback = implement;
  return r;
}

} // namespace

Options DefaultOptions() {
  Options o;

  o.heartbeat.task_type_timeouts = {
      {"REVIEW", Millis(300000)},    {"LINT", Millis(300000)}, {"SECURITY", Millis(1800000)},
      {"ANALYSIS", Millis(1800000)}, {"TEST", Millis(1800000)},
  };

  o.consensus.capabilities         = {"claude", "codex", "gemini"};
  o.consensus.unanimous_task_types = {"SECURITY"};

  o.routing = DefaultRouting();
  return o;
}

Options ResolveOptions(const taskorch::runtime::config::RuntimeConfig& config) {
  Options o = DefaultOptions();

  // pool
  const auto& pool = config.pool();
  if (pool.max_concurrent_tasks_per_worker() > 0) o.pool.max_concurrent_tasks_per_worker = pool.max_concurrent_tasks_per_worker();
  if (pool.shard_count() > 0) o.pool.shard_count = pool.shard_count();
  OverrideMillis(pool.poll_interval(), pool.has_poll_interval(), o.pool.poll_interval);
  OverrideMillis(pool.max_backoff(), pool.has_max_backoff(), o.pool.max_backoff);
  if (pool.claim_attempts() > 0) o.pool.claim_attempts = pool.claim_attempts();
  if (pool.rebalance_threshold() > 0) o.pool.rebalance_threshold = pool.rebalance_threshold();
  OverrideMillis(pool.rebalance_interval(), pool.has_rebalance_interval(), o.pool.rebalance_interval);

  // server
  const auto& sv = config.server();
  if (!sv.bind_address().empty()) o.server.bind_address = sv.bind_address();
  OverrideMillis(sv.shutdown_grace(), sv.has_shutdown_grace(), o.server.shutdown_grace);
  if (sv.max_message_bytes() > 0) o.server.max_message_bytes = sv.max_message_bytes();

  // heartbeat
  const auto& hb = config.heartbeat();
  OverrideMillis(hb.stale_threshold(), hb.has_stale_threshold(), o.heartbeat.stale_threshold);
  OverrideMillis(hb.scan_interval(), hb.has_scan_interval(), o.heartbeat.scan_interval);
  OverrideMillis(hb.interval(), hb.has_interval(), o.heartbeat.interval);
  if (hb.grace_multiplier() < 0.0) {
    throw std::invalid_argument("heartbeat.grace_multiplier must not be negative");
  }
  if (hb.grace_multiplier() > 0.0) o.heartbeat.grace_multiplier = hb.grace_multiplier();
  for (const auto& [type, seconds] : hb.task_type_timeouts()) {
    o.heartbeat.task_type_timeouts[UpperType(type)] = Millis(static_cast<int64_t>(seconds) * 1000);
  }

  // consensus
  const auto& cs = config.consensus();
  if (cs.capabilities_size() > 0) {
    o.consensus.capabilities.assign(cs.capabilities().begin(), cs.capabilities().end());
  }
  if (cs.min_approvals() > 0) o.consensus.min_approvals = cs.min_approvals();
  if (cs.unanimous_task_types_size() > 0) {
    o.consensus.unanimous_task_types.clear();
    for (const auto& type : cs.unanimous_task_types()) {
      o.consensus.unanimous_task_types.push_back(UpperType(type));
    }
  }
  OverrideMillis(cs.vote_timeout(), cs.has_vote_timeout(), o.consensus.vote_timeout);
  OverrideMillis(cs.review_poll_interval(), cs.has_review_poll_interval(), o.consensus.review_poll_interval);
  if (o.consensus.capabilities.size() < 2) {
    throw std::invalid_argument("consensus.capabilities needs at least two capabilities");
  }
  if (o.consensus.min_approvals > o.consensus.capabilities.size() - 1) {
    throw std::invalid_argument("consensus.min_approvals exceeds the number of voters");
  }

  // breaker
  const auto& br = config.breaker();
  if (br.failure_threshold() > 0) o.breaker.failure_threshold = br.failure_threshold();
  OverrideMillis(br.cooldown(), br.has_cooldown(), o.breaker.cooldown);
  if (br.half_open_max_calls() > 0) o.breaker.half_open_max_calls = br.half_open_max_calls();

  // budget
  const auto& bg = config.budget();
  if (bg.rate_limit_per_minute() < 0.0 || bg.daily_limit() < 0.0) {
    throw std::invalid_argument("budget limits must not be negative");
  }
  if (config.has_budget()) {
    o.budget.rate_limit_per_minute = bg.rate_limit_per_minute();
    o.budget.daily_limit           = bg.daily_limit();
  }
  OverrideMillis(bg.rate_window(), bg.has_rate_window(), o.budget.rate_window);
  OverrideMillis(bg.check_interval(), bg.has_check_interval(), o.budget.check_interval);
  OverrideMillis(bg.grace_period(), bg.has_grace_period(), o.budget.grace_period);

  // lifecycle
  if (config.has_lifecycle()) o.lifecycle.max_retries_per_task = config.lifecycle().max_retries_per_task();

  // routing
  const auto& rt = config.routing();
  for (const auto& rule : rt.rules()) {
    if (rule.task_type().empty() || rule.capability().empty()) {
      throw std::invalid_argument("routing rules need task_type and capability");
    }
    o.routing.table[rule.task_type()] = Route{rule.capability(), rule.lane()};
  }
  if (!rt.default_capability().empty()) o.routing.fallback.capability = rt.default_capability();
  if (!rt.default_lane().empty()) o.routing.fallback.lane = rt.default_lane();

  // executor
  const auto& ex = config.executor();
  for (const auto& [capability, command] : ex.commands()) {
    o.executor.commands[capability] = command;
  }
  OverrideMillis(ex.timeout(), ex.has_timeout(), o.executor.timeout);

  return o;
}

} // namespace taskorch::config
