#include "internal/observability/spans.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_options.h>
#include <opentelemetry/sdk/resource/resource.h>
#include <opentelemetry/sdk/trace/batch_span_processor_factory.h>
#include <opentelemetry/sdk/trace/batch_span_processor_options.h>
#include <opentelemetry/sdk/trace/samplers/always_off_factory.h>
#include <opentelemetry/sdk/trace/samplers/always_on_factory.h>
#include <opentelemetry/sdk/trace/samplers/parent_factory.h>
#include <opentelemetry/sdk/trace/samplers/trace_id_ratio_factory.h>
#include <opentelemetry/sdk/trace/simple_processor_factory.h>
#include <opentelemetry/sdk/trace/tracer_provider_factory.h>
#include <opentelemetry/trace/provider.h>

#include <algorithm>
#include <chrono>
#include <utility>

#include "config/config.pb.h"
#include "internal/observability/logging.hpp"
#include "internal/observability/otlp_config.hpp"

namespace taskorch::observability {
namespace otlp      = opentelemetry::exporter::otlp;
namespace trace_api = opentelemetry::trace;
namespace sdktrace  = opentelemetry::sdk::trace;
namespace resource  = opentelemetry::sdk::resource;

using taskorch::runtime::config::ObservabilityConfig_TracingConfig;

namespace {
std::shared_ptr<sdktrace::TracerProvider>           g_sdk_provider;
opentelemetry::nostd::shared_ptr<trace_api::Tracer> g_tracer;

resource::Resource BuildResource(const OtlpConfig& config) {
  resource::ResourceAttributes attrs = {{"service.name", config.service_name}};
  return resource::Resource::Create(attrs);
}

std::unique_ptr<sdktrace::SpanExporter> BuildExporter(const OtlpConfig& config) {
  auto endpoint = ResolveOtlpEndpoint(config, OtlpSignal::kTraces);

  if (config.transport == OtlpTransport::kHttpProtobuf) {
    otlp::OtlpHttpExporterOptions options;
    options.url = endpoint;
    return otlp::OtlpHttpExporterFactory::Create(options);
  }

  otlp::OtlpGrpcExporterOptions options;
  options.endpoint            = endpoint;
  options.use_ssl_credentials = !config.insecure;
  return otlp::OtlpGrpcExporterFactory::Create(options);
}

sdktrace::BatchSpanProcessorOptions BuildBatchOptions(const ObservabilityConfig_TracingConfig& tracing) {
  sdktrace::BatchSpanProcessorOptions options;
  if (tracing.max_queue_size() > 0) {
    options.max_queue_size = tracing.max_queue_size();
  }
  if (tracing.schedule_delay_ms() > 0) {
    options.schedule_delay_millis = std::chrono::milliseconds(tracing.schedule_delay_ms());
  }
  if (tracing.max_export_batch_size() > 0) {
    // the SDK drops spans when a batch exceeds the queue
    options.max_export_batch_size = std::min<size_t>(tracing.max_export_batch_size(), options.max_queue_size);
  }
  return options;
}

// nullptr keeps the provider's parent-based always-on default
std::unique_ptr<sdktrace::Sampler> BuildSampler(const ObservabilityConfig_TracingConfig& tracing) {
  switch (tracing.trace_hint()) {
    case ObservabilityConfig_TracingConfig::TRACE_HINT_ALWAYS:
      return sdktrace::AlwaysOnSamplerFactory::Create();
    case ObservabilityConfig_TracingConfig::TRACE_HINT_NEVER:
      return sdktrace::AlwaysOffSamplerFactory::Create();
    case ObservabilityConfig_TracingConfig::TRACE_HINT_RATIO: {
      // children follow their parent; only roots are sampled by ratio
      const double ratio = std::clamp(tracing.sample_ratio(), 0.0, 1.0);
      std::shared_ptr<sdktrace::Sampler> root(sdktrace::TraceIdRatioBasedSamplerFactory::Create(ratio));
      return sdktrace::ParentBasedSamplerFactory::Create(root);
    }
    default:
      return nullptr;
  }
}

} // namespace

bool InitializeTracing(const taskorch::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();
  if (!observability.tracing_enabled()) {
    ShutdownTracing();
    return false;
  }

  const auto otlp_config = ResolveOtlpConfig(config);
  const auto& tracing    = observability.tracing();
  auto        exporter   = BuildExporter(otlp_config);

  std::unique_ptr<sdktrace::SpanProcessor> span_processor;
  if (tracing.processor() == ObservabilityConfig_TracingConfig::TRACE_PROCESSOR_SIMPLE) {
    span_processor = sdktrace::SimpleSpanProcessorFactory::Create(std::move(exporter));
  } else {
    span_processor = sdktrace::BatchSpanProcessorFactory::Create(std::move(exporter), BuildBatchOptions(tracing));
  }

  std::unique_ptr<sdktrace::TracerProvider> provider;
  if (auto sampler = BuildSampler(tracing)) {
    provider = sdktrace::TracerProviderFactory::Create(std::move(span_processor), BuildResource(otlp_config), std::move(sampler));
  } else {
    provider = sdktrace::TracerProviderFactory::Create(std::move(span_processor), BuildResource(otlp_config));
  }

  g_sdk_provider = std::shared_ptr<sdktrace::TracerProvider>(std::move(provider));
  trace_api::Provider::SetTracerProvider(opentelemetry::nostd::shared_ptr<trace_api::TracerProvider>(g_sdk_provider));
  g_tracer = g_sdk_provider->GetTracer("taskorch", "0.1.0");
  TASKORCH_LOG_INFO("Tracing enabled", {StringField("endpoint", ResolveOtlpEndpoint(otlp_config, OtlpSignal::kTraces)),
                                        StringField("service", otlp_config.service_name)});
  return static_cast<bool>(g_tracer);
}

void ShutdownTracing() {
  if (g_sdk_provider) {
    g_sdk_provider->ForceFlush();
    g_sdk_provider->Shutdown();
  }
  g_sdk_provider.reset();
  g_tracer = nullptr;
}

struct SpanScope::Impl {
  opentelemetry::nostd::shared_ptr<trace_api::Span> span;
  std::unique_ptr<trace_api::Scope>                 scope;
};

SpanScope::SpanScope(std::string_view name) : impl_(std::make_unique<Impl>()) {
  if (!g_tracer) {
    auto provider = trace_api::Provider::GetTracerProvider();
    if (provider) {
      g_tracer = provider->GetTracer("taskorch", "0.1.0");
    }
  }

  if (!g_tracer) {
    return;
  }

  impl_->span = g_tracer->StartSpan(std::string(name));
  for (const auto& field : LogContext::Current()) {
    impl_->span->SetAttribute(field.key, field.value);
  }
  impl_->scope = std::make_unique<trace_api::Scope>(g_tracer->WithActiveSpan(impl_->span));
}

SpanScope::~SpanScope() {
  if (impl_ && impl_->span) {
    impl_->span->End();
  }
}

SpanScope::SpanScope(SpanScope&&) noexcept            = default;
SpanScope& SpanScope::operator=(SpanScope&&) noexcept = default;

void SpanScope::SetAttribute(std::string_view key, std::string_view value) {
  if (impl_ && impl_->span) {
    impl_->span->SetAttribute(std::string(key), std::string(value));
  }
}

void SpanScope::SetAttribute(std::string_view key, std::int64_t value) {
  if (impl_ && impl_->span) {
    impl_->span->SetAttribute(std::string(key), value);
  }
}

void SpanScope::SetAttribute(std::string_view key, double value) {
  if (impl_ && impl_->span) {
    impl_->span->SetAttribute(std::string(key), value);
  }
}

void SpanScope::AddEvent(std::string_view name) {
  if (impl_ && impl_->span) {
    impl_->span->AddEvent(std::string(name));
  }
}

void SpanScope::RecordException(std::string_view description) {
  if (impl_ && impl_->span) {
    impl_->span->AddEvent("exception", {{"exception.message", std::string(description)}});
    impl_->span->SetStatus(trace_api::StatusCode::kError, std::string(description));
  }
}

} // namespace taskorch::observability

#endif
