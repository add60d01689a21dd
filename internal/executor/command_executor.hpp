#pragma once

#include <map>
#include <string>

#include "internal/executor/model_executor.hpp"

namespace taskorch::executor {

/*
  Runs one configured command line per capability through /bin/sh.

  The prompt is written to the child's stdin and stdout is the reply.
  A line "TASKORCH_COST_USD=<amount>" on stderr reports spend.
  The child is SIGKILLed at the timeout.
*/
class CommandExecutor final : public ModelExecutor {
 public:
  explicit CommandExecutor(std::map<std::string, std::string> commands);

  Execution Execute(const std::string& capability, const std::string& prompt, std::chrono::milliseconds timeout) override;

 private:
  std::map<std::string, std::string> commands_;
};

} // namespace taskorch::executor
