#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>
#include <vector>

namespace taskorch::runtime::config {
class RuntimeConfig;
}

namespace taskorch::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);

// component names the process in every line ("server", "worker").
void InitializeLogging(const taskorch::runtime::config::RuntimeConfig& config, std::string_view component = "server");
void ShutdownLogging();

/*
  LogContext

  Fields pushed for the lifetime of the scope and appended to every
  line logged from this thread, e.g. worker_id for a worker loop and
  task_id while a task executes. Scopes nest; an explicit field with
  the same key wins over the context.
*/
class LogContext {
 public:
  explicit LogContext(std::initializer_list<LogField> fields);
  ~LogContext();

  LogContext(const LogContext&)            = delete;
  LogContext& operator=(const LogContext&) = delete;

  // Snapshot of the calling thread's context, outermost first.
  static std::vector<LogField> Current();

 private:
  size_t pushed_;
};

// key=value pairs; values with spaces, quotes or '=' are quoted.
std::string FormatFields(const std::vector<LogField>& fields);

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

inline void LogDebug(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::debug, message, fields);
}

inline void LogInfo(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::info, message, fields);
}

inline void LogWarn(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::warn, message, fields);
}

inline void LogError(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::err, message, fields);
}

} // namespace taskorch::observability

#define TASKORCH_LOG_DEBUG(message, ...) ::taskorch::observability::LogDebug((message), ##__VA_ARGS__)
#define TASKORCH_LOG_INFO(message, ...) ::taskorch::observability::LogInfo((message), ##__VA_ARGS__)
#define TASKORCH_LOG_WARN(message, ...) ::taskorch::observability::LogWarn((message), ##__VA_ARGS__)
#define TASKORCH_LOG_ERROR(message, ...) ::taskorch::observability::LogError((message), ##__VA_ARGS__)
