#pragma once

#include <chrono>
#include <string>

namespace taskorch::executor {

struct Execution {
  std::string text;
  // Spend reported by the capability; 0 when unknown.
  double cost_usd = 0.0;
};

/*
  External model capability. Opaque and possibly slow.

  Throws util::ExecutorTimeout when no reply arrives within timeout
  and util::ExecutorError for any other failure.
*/
class ModelExecutor {
 public:
  virtual ~ModelExecutor() = default;

  virtual Execution Execute(const std::string& capability, const std::string& prompt, std::chrono::milliseconds timeout) = 0;
};

} // namespace taskorch::executor
