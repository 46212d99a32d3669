#include "internal/observability/spans.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_options.h>
#include <opentelemetry/sdk/resource/resource.h>
#include <opentelemetry/sdk/trace/simple_processor_factory.h>
#include <opentelemetry/sdk/trace/tracer_provider_factory.h>
#include <opentelemetry/trace/provider.h>

#include <cstdlib>
#include <string>
#include <utility>

#include "config/config.pb.h"

namespace strata::observability {
namespace otlp      = opentelemetry::exporter::otlp;
namespace trace_api = opentelemetry::trace;
namespace sdktrace  = opentelemetry::sdk::trace;

using strata::runtime::config::ObservabilityConfig;
using strata::runtime::config::OTLP_TRANSPORT_HTTP;

namespace {

constexpr const char* kServiceName = "strata";
constexpr const char* kVersion     = "0.1.0";

std::shared_ptr<sdktrace::TracerProvider>           g_provider;
opentelemetry::nostd::shared_ptr<trace_api::Tracer> g_tracer;

// config, then the standard OTEL variables, then the collector default
std::string Endpoint(const ObservabilityConfig& config) {
  if (!config.otlp_endpoint().empty()) return config.otlp_endpoint();

  for (const char* name : {"OTEL_EXPORTER_OTLP_TRACES_ENDPOINT", "OTEL_EXPORTER_OTLP_ENDPOINT"}) {
    if (const char* value = std::getenv(name)) return value;
  }

  return config.transport() == OTLP_TRANSPORT_HTTP ? "http://localhost:4318/v1/traces" : "localhost:4317";
}

std::unique_ptr<sdktrace::SpanExporter> MakeExporter(const ObservabilityConfig& config) {
  if (config.transport() == OTLP_TRANSPORT_HTTP) {
    otlp::OtlpHttpExporterOptions options;
    options.url = Endpoint(config);
    return otlp::OtlpHttpExporterFactory::Create(options);
  }

  otlp::OtlpGrpcExporterOptions options;
  options.endpoint = Endpoint(config);
  return otlp::OtlpGrpcExporterFactory::Create(options);
}

// Falls back to whatever provider the host application installed.
trace_api::Tracer* Tracer() {
  if (!g_tracer) {
    if (auto provider = trace_api::Provider::GetTracerProvider()) {
      g_tracer = provider->GetTracer(kServiceName, kVersion);
    }
  }
  return g_tracer.get();
}

} // namespace

bool InitializeTracing(const strata::runtime::config::RuntimeConfig& config) {
  ShutdownTracing();
  if (!config.observability().tracing_enabled()) {
    return false;
  }

  // runs are short; export each span as it ends
  auto processor = sdktrace::SimpleSpanProcessorFactory::Create(MakeExporter(config.observability()));
  auto resource  = opentelemetry::sdk::resource::Resource::Create({{"service.name", kServiceName}});

  g_provider = std::shared_ptr<sdktrace::TracerProvider>(
      sdktrace::TracerProviderFactory::Create(std::move(processor), resource));
  trace_api::Provider::SetTracerProvider(opentelemetry::nostd::shared_ptr<trace_api::TracerProvider>(g_provider));
  g_tracer = g_provider->GetTracer(kServiceName, kVersion);
  return true;
}

void ShutdownTracing() {
  if (!g_provider) {
    return;
  }
  g_provider->ForceFlush();
  g_provider->Shutdown();
  g_provider.reset();
  g_tracer = nullptr;
}

struct SpanScope::Impl {
  opentelemetry::nostd::shared_ptr<trace_api::Span> span;
  std::unique_ptr<trace_api::Scope>                 active;
};

SpanScope::SpanScope(std::string_view name) : impl_(std::make_unique<Impl>()) {
  auto* tracer = Tracer();
  if (tracer == nullptr) {
    return;
  }
  impl_->span   = tracer->StartSpan(std::string(name));
  impl_->active = std::make_unique<trace_api::Scope>(impl_->span);
}

SpanScope::~SpanScope() {
  if (impl_ && impl_->span) {
    impl_->active.reset();
    impl_->span->End();
  }
}

SpanScope::SpanScope(SpanScope&&) noexcept            = default;
SpanScope& SpanScope::operator=(SpanScope&&) noexcept = default;

void SpanScope::SetAttribute(std::string_view key, std::string_view value) {
  if (!impl_ || !impl_->span) return;
  impl_->span->SetAttribute(std::string(key), std::string(value));
}

void SpanScope::SetAttribute(std::string_view key, std::uint64_t value) {
  if (!impl_ || !impl_->span) return;
  impl_->span->SetAttribute(std::string(key), value);
}

void SpanScope::Fail(std::string_view cause) {
  if (!impl_ || !impl_->span) return;
  const std::string message(cause);
  impl_->span->AddEvent("exception", {{"exception.message", message}});
  impl_->span->SetStatus(trace_api::StatusCode::kError, message);
}

} // namespace strata::observability

#endif
