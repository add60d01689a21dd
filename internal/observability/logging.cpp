#include "internal/observability/logging.hpp"

#include <algorithm>
#include <cstdlib>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

#ifdef ENABLE_OTEL
#include <opentelemetry/context/runtime_context.h>
#include <opentelemetry/trace/provider.h>
#include <opentelemetry/trace/span.h>
#endif

namespace taskorch::observability {
namespace {

// pid distinguishes the server from its workers when their output is merged
constexpr const char* kDefaultPattern = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %n[%P] %v";

thread_local std::vector<LogField> t_context;

bool g_include_trace_context{false};

const char* Env(const char* name) {
  const char* value = std::getenv(name);
  return value && *value ? value : nullptr;
}

spdlog::level::level_enum ResolveLevel(const taskorch::runtime::config::RuntimeConfig& config, bool& unknown) {
  std::string name = "info";
  if (const char* level = Env("TASKORCH_LOG_LEVEL")) {
    name = level;
  } else if (!config.logging().level().empty()) {
    name = config.logging().level();
  }

  // from_str maps unrecognised names to off, which would silence the process
  const auto level = spdlog::level::from_str(name);
  unknown          = level == spdlog::level::off && name != "off";
  return unknown ? spdlog::level::info : level;
}

std::string ResolvePattern(const taskorch::runtime::config::RuntimeConfig& config) {
  if (const char* pattern = Env("TASKORCH_LOG_PATTERN")) {
    return pattern;
  }
  if (!config.logging().pattern().empty()) {
    return config.logging().pattern();
  }
  return kDefaultPattern;
}

bool ResolveTraceContextEnabled(const taskorch::runtime::config::RuntimeConfig& config) {
  if (const char* include_trace = Env("TASKORCH_LOG_INCLUDE_TRACE_CONTEXT")) {
    return std::string(include_trace) == "1" || std::string(include_trace) == "true";
  }
  return config.logging().include_trace_context();
}

bool NeedsQuoting(const std::string& value) {
  if (value.empty()) {
    return true;
  }
  return std::any_of(value.begin(), value.end(), [](char ch) { return ch == ' ' || ch == '"' || ch == '=' || ch == '\n' || ch == '\t'; });
}

std::string Quote(const std::string& value) {
  std::string out;
  out.reserve(value.size() + 2);
  out.push_back('"');
  for (char ch : value) {
    switch (ch) {
      case '"':
        out += "\\\"";
        break;
      case '\\':
        out += "\\\\";
        break;
      case '\n':
        out += "\\n";
        break;
      case '\t':
        out += "\\t";
        break;
      default:
        out.push_back(ch);
    }
  }
  out.push_back('"');
  return out;
}

bool HasKey(const std::vector<LogField>& fields, const std::string& key) {
  return std::any_of(fields.begin(), fields.end(), [&](const LogField& field) { return field.key == key; });
}

#ifdef ENABLE_OTEL
std::string HexId(const uint8_t* data, std::size_t size) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string           result;
  result.reserve(size * 2);
  for (std::size_t i = 0; i < size; ++i) {
    result.push_back(kHex[(data[i] >> 4) & 0x0F]);
    result.push_back(kHex[data[i] & 0x0F]);
  }
  return result;
}

void AppendTraceContext(std::vector<LogField>& out) {
  if (!g_include_trace_context) {
    return;
  }
  auto span = opentelemetry::trace::GetSpan(opentelemetry::context::RuntimeContext::GetCurrent());
  if (!span) {
    return;
  }
  auto context = span->GetContext();
  if (!context.IsValid()) {
    return;
  }

  uint8_t trace_bytes[16];
  uint8_t span_bytes[8];
  context.trace_id().CopyBytesTo(trace_bytes);
  context.span_id().CopyBytesTo(span_bytes);
  // otel_ prefix keeps these apart from the orchestration trace_id carried on tasks
  out.push_back({"otel_trace_id", HexId(trace_bytes, 16)});
  out.push_back({"otel_span_id", HexId(span_bytes, 8)});
}
#else
void AppendTraceContext(std::vector<LogField>&) {
}
#endif

} // namespace

LogField StringField(std::string_view key, std::string_view value) {
  return {std::string(key), std::string(value)};
}

LogField IntField(std::string_view key, std::int64_t value) {
  return {std::string(key), std::to_string(value)};
}

LogField BoolField(std::string_view key, bool value) {
  return {std::string(key), value ? "true" : "false"};
}

LogContext::LogContext(std::initializer_list<LogField> fields) : pushed_(fields.size()) {
  t_context.insert(t_context.end(), fields.begin(), fields.end());
}

LogContext::~LogContext() {
  t_context.resize(t_context.size() - std::min(pushed_, t_context.size()));
}

std::vector<LogField> LogContext::Current() {
  return t_context;
}

std::string FormatFields(const std::vector<LogField>& fields) {
  std::string out;
  for (const auto& field : fields) {
    if (!out.empty()) {
      out.push_back(' ');
    }
    out += field.key;
    out.push_back('=');
    out += NeedsQuoting(field.value) ? Quote(field.value) : field.value;
  }
  return out;
}

void InitializeLogging(const taskorch::runtime::config::RuntimeConfig& config, std::string_view component) {
  const std::string name = "taskorch-" + std::string(component);

  // re-init only reconfigures; the worker binary initialises once per process
  auto logger = spdlog::get(name);
  if (!logger) {
    logger = spdlog::stdout_color_mt(name);
  }

  bool       unknown_level = false;
  const auto level         = ResolveLevel(config, unknown_level);
  logger->set_pattern(ResolvePattern(config));
  logger->set_level(level);
  spdlog::set_default_logger(logger);
  spdlog::flush_on(spdlog::level::warn);
  g_include_trace_context = ResolveTraceContextEnabled(config);

  if (unknown_level) {
    LogWarn("Unknown log level, using info", {StringField("level", config.logging().level())});
  }
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  auto logger = spdlog::default_logger_raw();
  if (!logger || !logger->should_log(level)) {
    return;
  }

  std::vector<LogField> line(fields.begin(), fields.end());
  // innermost scope wins on a repeated key
  for (auto it = t_context.rbegin(); it != t_context.rend(); ++it) {
    if (!HasKey(line, it->key)) {
      line.push_back(*it);
    }
  }
  AppendTraceContext(line);

  if (line.empty()) {
    logger->log(level, "{}", message);
    return;
  }
  logger->log(level, "{} {}", message, FormatFields(line));
}

} // namespace taskorch::observability
