#include "internal/observability/spans.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_options.h>
#include <opentelemetry/sdk/resource/resource.h>
#include <opentelemetry/sdk/trace/batch_span_processor_factory.h>
#include <opentelemetry/sdk/trace/batch_span_processor_options.h>
#include <opentelemetry/sdk/trace/tracer_provider_factory.h>
#include <opentelemetry/trace/provider.h>

#include <cstdlib>
#include <utility>

#include "config/config.pb.h"

namespace unison::observability {
namespace otlp      = opentelemetry::exporter::otlp;
namespace trace_api = opentelemetry::trace;
namespace sdktrace  = opentelemetry::sdk::trace;

namespace {

using unison::runtime::config::ObservabilityConfig;

// One provider per process; SpanScope is a no-op while `tracer` is null.
struct TracingState {
  std::shared_ptr<sdktrace::TracerProvider>           provider;
  opentelemetry::nostd::shared_ptr<trace_api::Tracer> tracer;
};

TracingState g_tracing;

const char* EnvOr(const char* name, const char* fallback) {
  const char* value = std::getenv(name);
  return value != nullptr ? value : fallback;
}

std::unique_ptr<sdktrace::SpanExporter> MakeSpanExporter(const ObservabilityConfig& config) {
  const bool http = config.transport() == unison::runtime::config::OTLP_TRANSPORT_HTTP;

  std::string endpoint = config.otlp_endpoint();
  if (endpoint.empty()) {
    endpoint = EnvOr("OTEL_EXPORTER_OTLP_TRACES_ENDPOINT",
                     EnvOr("OTEL_EXPORTER_OTLP_ENDPOINT", http ? "http://localhost:4318/v1/traces" : "localhost:4317"));
  }

  if (http) {
    otlp::OtlpHttpExporterOptions options;
    options.url = endpoint;
    return otlp::OtlpHttpExporterFactory::Create(options);
  }

  // collectors run beside the worker; plaintext gRPC
  otlp::OtlpGrpcExporterOptions options;
  options.endpoint            = endpoint;
  options.use_ssl_credentials = false;
  return otlp::OtlpGrpcExporterFactory::Create(options);
}

} // namespace

bool InitializeTracing(const unison::runtime::config::RuntimeConfig& config) {
  ShutdownTracing();
  if (!config.observability().tracing_enabled()) {
    return false;
  }

  auto processor =
      sdktrace::BatchSpanProcessorFactory::Create(MakeSpanExporter(config.observability()), sdktrace::BatchSpanProcessorOptions{});
  const opentelemetry::sdk::resource::ResourceAttributes attrs = {{"service.name", "unison-queue"}};
  auto resource = opentelemetry::sdk::resource::Resource::Create(attrs);

  g_tracing.provider = std::shared_ptr<sdktrace::TracerProvider>(sdktrace::TracerProviderFactory::Create(std::move(processor), resource));
  trace_api::Provider::SetTracerProvider(opentelemetry::nostd::shared_ptr<trace_api::TracerProvider>(g_tracing.provider));
  g_tracing.tracer = g_tracing.provider->GetTracer("unison-queue", "0.1.0");
  return static_cast<bool>(g_tracing.tracer);
}

void ShutdownTracing() {
  g_tracing.tracer = nullptr;
  if (auto provider = std::exchange(g_tracing.provider, nullptr)) {
    provider->ForceFlush();
    provider->Shutdown();
  }
}

struct SpanScope::Impl {
  opentelemetry::nostd::shared_ptr<trace_api::Span> span;
  std::unique_ptr<trace_api::Scope>                 scope;

  trace_api::Span* Live() const {
    return span ? span.get() : nullptr;
  }
};

SpanScope::SpanScope(std::string_view name) : impl_(std::make_unique<Impl>()) {
  if (g_tracing.tracer) {
    impl_->span  = g_tracing.tracer->StartSpan(std::string(name));
    impl_->scope = std::make_unique<trace_api::Scope>(g_tracing.tracer->WithActiveSpan(impl_->span));
  }
}

SpanScope::~SpanScope() {
  if (auto* span = impl_ ? impl_->Live() : nullptr) {
    span->End();
  }
}

void SpanScope::SetAttribute(std::string_view key, std::string_view value) {
  if (auto* span = impl_ ? impl_->Live() : nullptr) {
    span->SetAttribute(std::string(key), std::string(value));
  }
}

void SpanScope::SetAttribute(std::string_view key, std::int64_t value) {
  if (auto* span = impl_ ? impl_->Live() : nullptr) {
    span->SetAttribute(std::string(key), value);
  }
}

void SpanScope::AddEvent(std::string_view name) {
  if (auto* span = impl_ ? impl_->Live() : nullptr) {
    span->AddEvent(std::string(name));
  }
}

void SpanScope::RecordException(std::string_view description) {
  if (auto* span = impl_ ? impl_->Live() : nullptr) {
    const std::string message(description);
    span->AddEvent("exception", {{"exception.message", message}});
    span->SetStatus(trace_api::StatusCode::kError, message);
  }
}

} // namespace unison::observability

#endif
