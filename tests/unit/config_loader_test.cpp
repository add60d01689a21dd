#include "internal/config/config_loader.hpp"

#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/config/options.hpp"

namespace {

using std::chrono::milliseconds;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "taskorch_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void TestFullConfigResolves() {
  const auto yaml_path = WriteYaml("full",
                                   R"(server:
  bind_address: "127.0.0.1:50061"
  shutdown_grace: "10s"
  max_message_bytes: 8388608
database:
  sqlite:
    path: "/tmp/taskorch.db"
pool:
  max_concurrent_tasks_per_worker: 4
  shard_count: 5
  poll_interval: "2s"
  rebalance_interval: "90s"
heartbeat:
  stale_threshold: "120s"
  interval: "15s"
  grace_multiplier: 2
  task_type_timeouts:
    REVIEW: 600
consensus:
  capabilities: [claude, codex, gemini, local]
  min_approvals: 3
  unanimous_task_types: [SECURITY, RELEASE]
  vote_timeout: "45s"
breaker:
  failure_threshold: 5
  cooldown: "30s"
budget:
  rate_limit_per_minute: 2.5
  daily_limit: 100
  grace_period: "10s"
lifecycle:
  max_retries_per_task: 1
routing:
  rules:
    - task_type: docs
      capability: gemini
      lane: writing
  default_capability: codex
executor:
  commands:
    claude: "claude -p"
  timeout: "600s"
)");

  auto config = taskorch::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.server().bind_address() == "127.0.0.1:50061");
  assert(config.database().has_sqlite());
  assert(config.database().sqlite().path() == "/tmp/taskorch.db");

  auto options = taskorch::config::ResolveOptions(config);
  assert(options.server.bind_address == "127.0.0.1:50061");
  assert(options.server.shutdown_grace == milliseconds(10000));
  assert(options.server.max_message_bytes == 8388608);
  assert(options.pool.max_concurrent_tasks_per_worker == 4);
  assert(options.pool.shard_count == 5);
  assert(options.pool.poll_interval == milliseconds(2000));
  assert(options.pool.rebalance_interval == milliseconds(90000));
  assert(options.heartbeat.stale_threshold == milliseconds(120000));
  assert(options.heartbeat.interval == milliseconds(15000));
  assert(options.heartbeat.grace_multiplier == 2.0);
  assert(options.heartbeat.task_type_timeouts.at("REVIEW") == milliseconds(600000));
  // defaults for types the file does not mention survive
  assert(options.heartbeat.task_type_timeouts.count("SECURITY") == 1);
  assert(options.consensus.capabilities.size() == 4);
  assert(options.consensus.min_approvals == 3);
  assert(options.consensus.unanimous_task_types.size() == 2);
  assert(options.consensus.vote_timeout == milliseconds(45000));
  assert(options.breaker.failure_threshold == 5);
  assert(options.breaker.cooldown == milliseconds(30000));
  assert(options.budget.rate_limit_per_minute == 2.5);
  assert(options.budget.daily_limit == 100.0);
  assert(options.budget.grace_period == milliseconds(10000));
  assert(options.lifecycle.max_retries_per_task == 1);
  assert(options.routing.table.at("docs").capability == "gemini");
  assert(options.routing.fallback.capability == "codex");
  assert(options.executor.commands.at("claude") == "claude -p");
  assert(options.executor.timeout == milliseconds(600000));
}

void TestEmptyDocumentUsesDefaults() {
  auto config  = taskorch::config::ConfigLoader::LoadFromYamlString("");
  auto options = taskorch::config::ResolveOptions(config);
  assert(options.server.bind_address == "0.0.0.0:50061");
  assert(options.server.shutdown_grace == milliseconds(5000));
  assert(options.pool.max_concurrent_tasks_per_worker == 3);
  assert(options.pool.shard_count == 3);
  assert(options.heartbeat.stale_threshold == milliseconds(300000));
  assert(options.consensus.capabilities.size() == 3);
  assert(options.consensus.min_approvals == 2);
  assert(options.breaker.failure_threshold == 3);
  assert(options.budget.rate_limit_per_minute == 1.0);
  assert(options.budget.daily_limit == 50.0);
  assert(options.lifecycle.max_retries_per_task == 3);
  assert(options.routing.table.at("IMPLEMENTATION").capability == "claude");
  assert(options.routing.table.at("REVIEW").lane == "review");
}

void TestTaskTypeKeysAreCaseInsensitive() {
  auto config = taskorch::config::ConfigLoader::LoadFromYamlString(R"(heartbeat:
  task_type_timeouts:
    review: 120
    Migration: 900
consensus:
  unanimous_task_types: [security, Release]
)");
  auto options = taskorch::config::ResolveOptions(config);
  assert(options.heartbeat.task_type_timeouts.at("REVIEW") == milliseconds(120000));
  assert(options.heartbeat.task_type_timeouts.at("MIGRATION") == milliseconds(900000));
  assert(options.heartbeat.task_type_timeouts.count("review") == 0);
  assert(options.consensus.unanimous_task_types.size() == 2);
  assert(options.consensus.unanimous_task_types[0] == "SECURITY");
  assert(options.consensus.unanimous_task_types[1] == "RELEASE");
}

void TestZeroBudgetDisablesLimitsWhenSectionPresent() {
  auto config = taskorch::config::ConfigLoader::LoadFromYamlString(R"(budget:
  rate_limit_per_minute: 0
  daily_limit: 0
)");
  auto options = taskorch::config::ResolveOptions(config);
  assert(options.budget.rate_limit_per_minute == 0.0);
  assert(options.budget.daily_limit == 0.0);
}

void TestQuotedScalarsStayStrings() {
  auto config = taskorch::config::ConfigLoader::LoadFromYamlString(R"(executor:
  commands:
    local: "1"
)");
  assert(config.executor().commands().at("local") == "1");
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(server:
  bind_address: "0.0.0.0:50061"
unknown_field: 123
pool:
  shard_count: 2
)");

  bool threw = false;
  try {
    (void)taskorch::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestMissingFileIsReported() {
  bool threw = false;
  try {
    (void)taskorch::config::ConfigLoader::LoadFromYaml("/nonexistent/taskorch/config.yaml");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

void TestInvalidValuesAreRejected() {
  auto expect_invalid = [](const std::string& yaml) {
    auto config = taskorch::config::ConfigLoader::LoadFromYamlString(yaml);
    bool threw  = false;
    try {
      (void)taskorch::config::ResolveOptions(config);
    } catch (const std::invalid_argument&) {
      threw = true;
    }
    assert(threw);
  };

  expect_invalid("consensus:\n  capabilities: [solo]\n");
  expect_invalid("consensus:\n  min_approvals: 3\n");
  expect_invalid("budget:\n  daily_limit: -1\n");
  expect_invalid("heartbeat:\n  grace_multiplier: -0.5\n");
  expect_invalid("routing:\n  rules:\n    - task_type: docs\n");
}

} // namespace

int main() {
  TestFullConfigResolves();
  TestEmptyDocumentUsesDefaults();
  TestTaskTypeKeysAreCaseInsensitive();
  TestZeroBudgetDisablesLimitsWhenSectionPresent();
  TestQuotedScalarsStayStrings();
  TestUnknownFieldsAreRejected();
  TestMissingFileIsReported();
  TestInvalidValuesAreRejected();

  std::cout << "taskorch_unit_config_loader: pass\n";
  return 0;
}
