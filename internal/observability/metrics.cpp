#include "internal/observability/spans.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/common/attribute_value.h>
#include <opentelemetry/context/context.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_options.h>
#include <opentelemetry/metrics/provider.h>
#include <opentelemetry/sdk/metrics/meter_provider.h>

#include <algorithm>
#include <chrono>
#include <memory>
#include <utility>
#if __has_include(<opentelemetry/sdk/metrics/periodic_exporting_metric_reader_factory.h>)
#define TASKORCH_OTEL_METRIC_READER_FACTORY 1
#include <opentelemetry/sdk/metrics/periodic_exporting_metric_reader_factory.h>
#elif __has_include(<opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>)
#define TASKORCH_OTEL_METRIC_READER_FACTORY 1
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>
#elif __has_include(<opentelemetry/sdk/metrics/periodic_exporting_metric_reader.h>)
#include <opentelemetry/sdk/metrics/periodic_exporting_metric_reader.h>
#else
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader.h>
#endif
#include <opentelemetry/sdk/resource/resource.h>

#include "config/config.pb.h"
#include "internal/observability/otlp_config.hpp"

namespace taskorch::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;
namespace resource    = opentelemetry::sdk::resource;

namespace {
using AttributePair = std::pair<opentelemetry::nostd::string_view, opentelemetry::common::AttributeValue>;
std::shared_ptr<sdkmetrics::MeterProvider> g_provider;

template <typename Provider>
void AddMetricReaderCompat(const std::shared_ptr<Provider>& provider, std::unique_ptr<sdkmetrics::MetricReader> reader) {
  if constexpr (requires { provider->AddMetricReader(std::move(reader)); }) {
    provider->AddMetricReader(std::move(reader));
  } else {
    provider->AddMetricReader(std::shared_ptr<sdkmetrics::MetricReader>(std::move(reader)));
  }
}

template <typename Instrument, typename Value, typename Attributes>
void AddWithAttributes(const opentelemetry::nostd::shared_ptr<Instrument>& instrument, Value value, Attributes&& attributes) {
  if constexpr (requires { instrument->Add(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{}); }) {
    instrument->Add(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{});
  } else {
    instrument->Add(value, std::forward<Attributes>(attributes));
  }
}

template <typename Instrument, typename Value, typename Attributes>
void RecordWithAttributes(const opentelemetry::nostd::shared_ptr<Instrument>& instrument, Value value, Attributes&& attributes) {
  if constexpr (requires { instrument->Record(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{}); }) {
    instrument->Record(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{});
  } else {
    instrument->Record(value, std::forward<Attributes>(attributes));
  }
}

} // namespace

struct Metrics::Impl {
  opentelemetry::nostd::shared_ptr<metrics_api::Meter> meter;

  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> request_count;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      request_latency_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> claim_count;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> recovery_count;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> breaker_trip_count;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<double>>        spend_total;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> consensus_count;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> kill_switch_count;
};

bool InitializeMetrics(const taskorch::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();
  if (!observability.metrics_enabled()) {
    ShutdownMetrics();
    return false;
  }

  const auto otlp_config = ResolveOtlpConfig(config);
  const auto endpoint    = ResolveOtlpEndpoint(otlp_config, OtlpSignal::kMetrics);

  std::unique_ptr<sdkmetrics::PushMetricExporter> exporter;
  if (otlp_config.transport == OtlpTransport::kHttpProtobuf) {
    otlp::OtlpHttpMetricExporterOptions options;
    options.url = endpoint;
    exporter    = otlp::OtlpHttpMetricExporterFactory::Create(options);
  } else {
    otlp::OtlpGrpcMetricExporterOptions options;
    options.endpoint            = endpoint;
    options.use_ssl_credentials = !otlp_config.insecure;
    exporter                    = otlp::OtlpGrpcMetricExporterFactory::Create(options);
  }

  const auto&                                      metric_config = observability.metrics();
  sdkmetrics::PeriodicExportingMetricReaderOptions reader_options;
  const auto                                       min_interval_ms = metric_config.min_collection_interval_ms();
  const auto configured_interval_ms     = metric_config.collection_interval_ms() > 0 ? metric_config.collection_interval_ms() : 1000;
  reader_options.export_interval_millis = std::chrono::milliseconds(std::max(min_interval_ms, configured_interval_ms));
  if (metric_config.export_timeout_ms() > 0) {
    reader_options.export_timeout_millis = std::chrono::milliseconds(metric_config.export_timeout_ms());
  }

#ifdef TASKORCH_OTEL_METRIC_READER_FACTORY
  auto reader = sdkmetrics::PeriodicExportingMetricReaderFactory::Create(std::move(exporter), reader_options);
#else
  auto reader = std::make_unique<sdkmetrics::PeriodicExportingMetricReader>(std::move(exporter), reader_options);
#endif

  resource::ResourceAttributes attrs = {{"service.name", otlp_config.service_name}};
  g_provider = std::make_shared<sdkmetrics::MeterProvider>(std::unique_ptr<sdkmetrics::ViewRegistry>(new sdkmetrics::ViewRegistry()),
                                                           resource::Resource::Create(attrs));
  AddMetricReaderCompat(g_provider, std::move(reader));

  metrics_api::Provider::SetMeterProvider(opentelemetry::nostd::shared_ptr<metrics_api::MeterProvider>(g_provider));
  return true;
}

void ShutdownMetrics() {
  if (g_provider) {
    g_provider->ForceFlush();
    g_provider->Shutdown();
  }
  g_provider.reset();
}

Metrics::Metrics() : impl_(std::make_unique<Impl>()) {
  auto provider = metrics_api::Provider::GetMeterProvider();
  impl_->meter  = provider->GetMeter("taskorch", "0.1.0");

  impl_->request_count      = impl_->meter->CreateUInt64Counter("taskorch.request.count", "Total number of service requests", "1");
  impl_->request_latency_ms = impl_->meter->CreateDoubleHistogram("taskorch.request.latency_ms", "End-to-end request latency", "ms");
  impl_->claim_count        = impl_->meter->CreateUInt64Counter("taskorch.claim.count", "Claim attempts by outcome", "1");
  impl_->recovery_count     = impl_->meter->CreateUInt64Counter("taskorch.recovery.count", "Workers recovered by the heartbeat monitor", "1");
  impl_->breaker_trip_count = impl_->meter->CreateUInt64Counter("taskorch.breaker.trips", "Circuit breaker CLOSED/HALF_OPEN to OPEN", "1");
  impl_->spend_total        = impl_->meter->CreateDoubleCounter("taskorch.budget.spend", "Recorded model spend", "USD");
  impl_->consensus_count    = impl_->meter->CreateUInt64Counter("taskorch.consensus.verdicts", "Review sessions decided, by verdict", "1");
  impl_->kill_switch_count  = impl_->meter->CreateUInt64Counter("taskorch.budget.kill_switch", "Kill switch activations", "1");
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordRequest(std::string_view route, bool success) {
  if (!impl_ || !impl_->request_count) {
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"route", std::string(route)}, {"success", success}};
  AddWithAttributes(impl_->request_count, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::ObserveRequestLatencyMs(std::string_view route, double latency_ms) {
  if (!impl_ || !impl_->request_latency_ms) {
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"route", std::string(route)}};
  RecordWithAttributes(impl_->request_latency_ms, latency_ms, attributes);
}

void Metrics::RecordClaim(std::string_view shard, bool claimed) {
  if (!impl_ || !impl_->claim_count) {
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"shard", std::string(shard)}, {"claimed", claimed}};
  AddWithAttributes(impl_->claim_count, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::RecordRecovery(std::string_view worker_status) {
  if (!impl_ || !impl_->recovery_count) {
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"status", std::string(worker_status)}};
  AddWithAttributes(impl_->recovery_count, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::RecordBreakerTrip(std::string_view capability) {
  if (!impl_ || !impl_->breaker_trip_count) {
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"capability", std::string(capability)}};
  AddWithAttributes(impl_->breaker_trip_count, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::RecordSpend(std::string_view capability, double amount) {
  if (!impl_ || !impl_->spend_total) {
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"capability", std::string(capability)}};
  AddWithAttributes(impl_->spend_total, amount, attributes);
}

void Metrics::RecordConsensus(std::string_view result) {
  if (!impl_ || !impl_->consensus_count) {
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"result", std::string(result)}};
  AddWithAttributes(impl_->consensus_count, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::RecordKillSwitch(std::string_view threshold) {
  if (!impl_ || !impl_->kill_switch_count) {
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"threshold", std::string(threshold)}};
  AddWithAttributes(impl_->kill_switch_count, static_cast<std::uint64_t>(1), attributes);
}

} // namespace taskorch::observability

#endif
