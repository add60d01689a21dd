#include "internal/observability/otlp_config.hpp"

#include <cstdlib>

#include "config/config.pb.h"

namespace taskorch::observability {
namespace {

const char* Env(const char* name) {
  const char* value = std::getenv(name);
  return value && *value ? value : nullptr;
}

} // namespace

OtlpConfig ResolveOtlpConfig(const taskorch::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();

  OtlpConfig otlp;
  otlp.endpoint  = observability.otlp_endpoint();
  otlp.transport = observability.transport() == taskorch::runtime::config::OTLP_TRANSPORT_HTTP ? OtlpTransport::kHttpProtobuf
                                                                                                : OtlpTransport::kGrpc;
  otlp.insecure  = !observability.otlp_tls();
  if (!observability.service_name().empty()) {
    otlp.service_name = observability.service_name();
  } else if (const char* name = Env("OTEL_SERVICE_NAME")) {
    otlp.service_name = name;
  }
  return otlp;
}

std::string ResolveOtlpEndpoint(const OtlpConfig& config, OtlpSignal signal) {
  if (!config.endpoint.empty()) {
    return config.endpoint;
  }

  const bool traces = signal == OtlpSignal::kTraces;
  if (const char* endpoint = Env(traces ? "OTEL_EXPORTER_OTLP_TRACES_ENDPOINT" : "OTEL_EXPORTER_OTLP_METRICS_ENDPOINT")) {
    return endpoint;
  }
  if (const char* endpoint = Env("OTEL_EXPORTER_OTLP_ENDPOINT")) {
    if (config.transport == OtlpTransport::kHttpProtobuf) {
      // the generic endpoint is a base URL; HTTP exporters post to a per-signal path
      std::string base(endpoint);
      if (!base.empty() && base.back() == '/') {
        base.pop_back();
      }
      return base + (traces ? "/v1/traces" : "/v1/metrics");
    }
    return endpoint;
  }

  if (config.transport == OtlpTransport::kHttpProtobuf) {
    return traces ? "http://localhost:4318/v1/traces" : "http://localhost:4318/v1/metrics";
  }
  return "localhost:4317";
}

} // namespace taskorch::observability
