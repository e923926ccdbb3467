#include "internal/observability/telemetry.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_options.h>
#include <opentelemetry/sdk/resource/resource.h>
#include <opentelemetry/sdk/trace/batch_span_processor_factory.h>
#include <opentelemetry/sdk/trace/batch_span_processor_options.h>
#include <opentelemetry/sdk/trace/simple_processor_factory.h>
#include <opentelemetry/sdk/trace/tracer_provider_factory.h>
#include <opentelemetry/trace/provider.h>

#include <string>
#include <utility>

#include "config/config.pb.h"

namespace apparatus::observability {
namespace cfg       = apparatus::runtime::config;
namespace otlp      = opentelemetry::exporter::otlp;
namespace trace_api = opentelemetry::trace;
namespace sdktrace  = opentelemetry::sdk::trace;

namespace {

std::shared_ptr<sdktrace::TracerProvider>           g_provider;
opentelemetry::nostd::shared_ptr<trace_api::Tracer> g_tracer;

// An empty endpoint keeps the exporter default, which honours OTEL_EXPORTER_OTLP_*.
std::unique_ptr<sdktrace::SpanExporter> MakeSpanExporter(const cfg::ObservabilityConfig& config) {
  if (config.transport() == cfg::OTLP_TRANSPORT_HTTP) {
    otlp::OtlpHttpExporterOptions options;
    if (!config.otlp_endpoint().empty()) options.url = config.otlp_endpoint();
    return otlp::OtlpHttpExporterFactory::Create(options);
  }
  otlp::OtlpGrpcExporterOptions options;
  if (!config.otlp_endpoint().empty()) options.endpoint = config.otlp_endpoint();
  return otlp::OtlpGrpcExporterFactory::Create(options);
}

} // namespace

bool InitializeTracing(const cfg::RuntimeConfig& config) {
  const auto& observability = config.observability();
  ShutdownTracing();
  if (!observability.tracing_enabled()) {
    return false;
  }

  std::unique_ptr<sdktrace::SpanProcessor> processor;
  if (observability.tracing().processor() == cfg::ObservabilityConfig_TracingConfig_TraceProcessorType_TRACE_PROCESSOR_SIMPLE) {
    processor = sdktrace::SimpleSpanProcessorFactory::Create(MakeSpanExporter(observability));
  } else {
    processor = sdktrace::BatchSpanProcessorFactory::Create(MakeSpanExporter(observability), sdktrace::BatchSpanProcessorOptions{});
  }

  opentelemetry::sdk::resource::ResourceAttributes attributes = {{"service.name", "apparatus"}};
  g_provider = std::shared_ptr<sdktrace::TracerProvider>(
      sdktrace::TracerProviderFactory::Create(std::move(processor), opentelemetry::sdk::resource::Resource::Create(attributes)));
  trace_api::Provider::SetTracerProvider(opentelemetry::nostd::shared_ptr<trace_api::TracerProvider>(g_provider));
  g_tracer = g_provider->GetTracer("apparatus");
  return true;
}

void ShutdownTracing() {
  g_tracer = nullptr;
  if (g_provider) {
    g_provider->ForceFlush();
    g_provider->Shutdown();
  }
  g_provider.reset();
}

struct SpanScope::Impl {
  opentelemetry::nostd::shared_ptr<trace_api::Span> span;
  std::unique_ptr<trace_api::Scope>                 scope;
};

SpanScope::SpanScope(std::string_view operation, std::string_view subject) {
  auto tracer = g_tracer;
  if (!tracer) {
    return;
  }

  impl_       = std::make_unique<Impl>();
  impl_->span = tracer->StartSpan(std::string(operation));
  if (!subject.empty()) {
    impl_->span->SetAttribute("apparatus.subject", std::string(subject));
  }
  impl_->scope = std::make_unique<trace_api::Scope>(tracer->WithActiveSpan(impl_->span));
}

SpanScope::~SpanScope() {
  if (impl_) {
    impl_->span->End();
  }
}

void SpanScope::Fail(std::string_view message) {
  if (impl_) {
    impl_->span->SetStatus(trace_api::StatusCode::kError, std::string(message));
  }
}

} // namespace apparatus::observability

#endif
