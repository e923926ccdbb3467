#include "internal/observability/telemetry.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/context/context.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_options.h>
#include <opentelemetry/metrics/provider.h>
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>
#include <opentelemetry/sdk/metrics/meter_provider.h>
#include <opentelemetry/sdk/metrics/view/view_registry.h>
#include <opentelemetry/sdk/resource/resource.h>

#include <chrono>
#include <string>
#include <utility>

#include "config/config.pb.h"

namespace apparatus::observability {
namespace cfg         = apparatus::runtime::config;
namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;

namespace {

constexpr std::uint32_t kDefaultIntervalMs = 1000;

template <typename T>
using CounterPtr = opentelemetry::nostd::shared_ptr<metrics_api::Counter<T>>;
template <typename T>
using HistogramPtr = opentelemetry::nostd::shared_ptr<metrics_api::Histogram<T>>;

std::shared_ptr<sdkmetrics::MeterProvider> g_provider;

std::unique_ptr<sdkmetrics::PushMetricExporter> MakeMetricExporter(const cfg::ObservabilityConfig& config) {
  if (config.transport() == cfg::OTLP_TRANSPORT_HTTP) {
    otlp::OtlpHttpMetricExporterOptions options;
    if (!config.otlp_endpoint().empty()) options.url = config.otlp_endpoint();
    return otlp::OtlpHttpMetricExporterFactory::Create(options);
  }
  otlp::OtlpGrpcMetricExporterOptions options;
  if (!config.otlp_endpoint().empty()) options.endpoint = config.otlp_endpoint();
  return otlp::OtlpGrpcMetricExporterFactory::Create(options);
}

} // namespace

bool InitializeMetrics(const cfg::RuntimeConfig& config) {
  const auto& observability = config.observability();
  ShutdownMetrics();
  if (!observability.metrics_enabled()) {
    return false;
  }

  const auto& settings = observability.metrics();
  sdkmetrics::PeriodicExportingMetricReaderOptions reader_options;
  reader_options.export_interval_millis =
      std::chrono::milliseconds(settings.collection_interval_ms() > 0 ? settings.collection_interval_ms() : kDefaultIntervalMs);
  if (settings.export_timeout_ms() > 0) {
    reader_options.export_timeout_millis = std::chrono::milliseconds(settings.export_timeout_ms());
  }

  opentelemetry::sdk::resource::ResourceAttributes attributes = {{"service.name", "apparatus"}};
  g_provider = std::make_shared<sdkmetrics::MeterProvider>(std::make_unique<sdkmetrics::ViewRegistry>(),
                                                           opentelemetry::sdk::resource::Resource::Create(attributes));
  g_provider->AddMetricReader(sdkmetrics::PeriodicExportingMetricReaderFactory::Create(MakeMetricExporter(observability), reader_options));
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

// Instruments bind to the provider installed when Instance() first runs;
// factory::InitializeObservability runs before any component records.
struct Metrics::Impl {
  CounterPtr<std::uint64_t> operations;
  HistogramPtr<double>      operation_latency_ms;

  CounterPtr<std::uint64_t> units_created;
  CounterPtr<std::uint64_t> supports_deduplicated;
  CounterPtr<std::uint64_t> retries;
  CounterPtr<std::uint64_t> location_failures;

  HistogramPtr<double> acknowledgement_latency_ms;
};

Metrics::Metrics() : impl_(std::make_unique<Impl>()) {
  auto meter = metrics_api::Provider::GetMeterProvider()->GetMeter("apparatus");

  impl_->operations           = meter->CreateUInt64Counter("apparatus.operations", "Store, build and gate operations", "1");
  impl_->operation_latency_ms = meter->CreateDoubleHistogram("apparatus.operation.latency_ms", "Operation wall time", "ms");

  impl_->units_created = meter->CreateUInt64Counter("apparatus.build.units_created", "Variant units created by builds", "1");
  impl_->supports_deduplicated =
      meter->CreateUInt64Counter("apparatus.build.supports_deduplicated", "Witness supports already present when a build saw them again", "1");
  impl_->retries           = meter->CreateUInt64Counter("apparatus.build.retries", "Location attempts repeated after a concurrent writer", "1");
  impl_->location_failures = meter->CreateUInt64Counter("apparatus.build.location_failures", "Locations or records reported as failed", "1");

  impl_->acknowledgement_latency_ms =
      meter->CreateDoubleHistogram("apparatus.gate.acknowledgement_latency_ms", "Time from unit creation to its acknowledgement", "ms");
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordOperation(std::string_view operation, bool success, double latency_ms) {
  impl_->operations->Add(1, {{"operation", std::string(operation)}, {"success", success}});
  impl_->operation_latency_ms->Record(latency_ms, {{"operation", std::string(operation)}}, opentelemetry::context::Context{});
}

void Metrics::RecordUnitsCreated(std::uint64_t count) {
  if (count > 0) impl_->units_created->Add(count);
}

void Metrics::RecordSupportsDeduplicated(std::uint64_t count) {
  if (count > 0) impl_->supports_deduplicated->Add(count);
}

void Metrics::RecordRetry(std::string_view cause) {
  impl_->retries->Add(1, {{"cause", std::string(cause)}});
}

void Metrics::RecordLocationFailure(std::string_view kind) {
  impl_->location_failures->Add(1, {{"kind", std::string(kind)}});
}

void Metrics::RecordAcknowledgementLatencyMs(std::string_view significance, double latency_ms) {
  impl_->acknowledgement_latency_ms->Record(latency_ms, {{"significance", std::string(significance)}}, opentelemetry::context::Context{});
}

} // namespace apparatus::observability

#endif
