#pragma once

#include <string>

namespace taskorch::runtime::config {
class RuntimeConfig;
}

namespace taskorch::observability {

enum class OtlpTransport {
  kGrpc,
  kHttpProtobuf,
};

enum class OtlpSignal {
  kTraces,
  kMetrics,
};

struct OtlpConfig {
  std::string   service_name{"taskorch"};
  std::string   endpoint{};
  OtlpTransport transport{OtlpTransport::kGrpc};
  bool          insecure{true};
};

// Service name: config, then OTEL_SERVICE_NAME, then "taskorch".
OtlpConfig ResolveOtlpConfig(const taskorch::runtime::config::RuntimeConfig& config);

/*
  Collector endpoint for one signal, first match wins:

    configured otlp_endpoint
    OTEL_EXPORTER_OTLP_{TRACES,METRICS}_ENDPOINT
    OTEL_EXPORTER_OTLP_ENDPOINT
    localhost:4317, or http://localhost:4318/v1/<signal> over HTTP
*/
std::string ResolveOtlpEndpoint(const OtlpConfig& config, OtlpSignal signal);

} // namespace taskorch::observability
