#include "internal/observability/telemetry.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_options.h>
#include <opentelemetry/metrics/provider.h>
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>
#include <opentelemetry/sdk/metrics/meter_provider.h>
#include <opentelemetry/sdk/metrics/meter_provider_factory.h>
#include <opentelemetry/sdk/metrics/view/view_registry.h>
#include <opentelemetry/sdk/resource/resource.h>
#include <opentelemetry/sdk/trace/batch_span_processor_factory.h>
#include <opentelemetry/sdk/trace/batch_span_processor_options.h>
#include <opentelemetry/sdk/trace/simple_processor_factory.h>
#include <opentelemetry/sdk/trace/tracer_provider_factory.h>
#include <opentelemetry/trace/provider.h>

#include <chrono>
#include <cstdlib>
#include <mutex>
#include <string>
#include <utility>

#include "config/config.pb.h"

namespace slideshow::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace trace_api   = opentelemetry::trace;
namespace metrics_api = opentelemetry::metrics;
namespace sdktrace    = opentelemetry::sdk::trace;
namespace sdkmetrics  = opentelemetry::sdk::metrics;
namespace resource    = opentelemetry::sdk::resource;

namespace {

constexpr char kInstrumentationName[]    = "slideshow";
constexpr char kInstrumentationVersion[] = "0.1.0";

enum class Signal { kTraces, kMetrics };

struct Exporter {
  bool        http = false;
  std::string endpoint;
};

std::mutex                                  g_mutex;
std::shared_ptr<sdktrace::TracerProvider>   g_tracer_provider;
std::shared_ptr<sdkmetrics::MeterProvider>  g_meter_provider;

Exporter ResolveExporter(const slideshow::runtime::config::ObservabilityConfig& observability, Signal signal) {
  Exporter exporter;
  exporter.http     = observability.transport() == slideshow::runtime::config::OTLP_TRANSPORT_HTTP;
  exporter.endpoint = observability.otlp_endpoint();
  if (!exporter.endpoint.empty()) {
    return exporter;
  }

  const char* specific =
      std::getenv(signal == Signal::kTraces ? "OTEL_EXPORTER_OTLP_TRACES_ENDPOINT" : "OTEL_EXPORTER_OTLP_METRICS_ENDPOINT");
  if (specific != nullptr && *specific != '\0') {
    exporter.endpoint = specific;
  } else if (const char* shared = std::getenv("OTEL_EXPORTER_OTLP_ENDPOINT"); shared != nullptr && *shared != '\0') {
    exporter.endpoint = shared;
  } else if (exporter.http) {
    exporter.endpoint = signal == Signal::kTraces ? "http://localhost:4318/v1/traces" : "http://localhost:4318/v1/metrics";
  } else {
    exporter.endpoint = "localhost:4317";
  }
  return exporter;
}

resource::Resource ServiceResource() {
  return resource::Resource::Create({{"service.name", std::string(kInstrumentationName)}});
}

void StartTracing(const slideshow::runtime::config::ObservabilityConfig& observability) {
  const auto target = ResolveExporter(observability, Signal::kTraces);

  std::unique_ptr<sdktrace::SpanExporter> exporter;
  if (target.http) {
    otlp::OtlpHttpExporterOptions options;
    options.url = target.endpoint;
    exporter    = otlp::OtlpHttpExporterFactory::Create(options);
  } else {
    otlp::OtlpGrpcExporterOptions options;
    options.endpoint = target.endpoint;
    exporter         = otlp::OtlpGrpcExporterFactory::Create(options);
  }

  const bool simple = observability.tracing().processor() ==
                      slideshow::runtime::config::ObservabilityConfig_TracingConfig_TraceProcessorType_TRACE_PROCESSOR_SIMPLE;
  auto processor = simple ? sdktrace::SimpleSpanProcessorFactory::Create(std::move(exporter))
                          : sdktrace::BatchSpanProcessorFactory::Create(std::move(exporter), sdktrace::BatchSpanProcessorOptions{});

  g_tracer_provider = std::shared_ptr<sdktrace::TracerProvider>(
      sdktrace::TracerProviderFactory::Create(std::move(processor), ServiceResource()));
  trace_api::Provider::SetTracerProvider(opentelemetry::nostd::shared_ptr<trace_api::TracerProvider>(g_tracer_provider));
}

void StartMetrics(const slideshow::runtime::config::ObservabilityConfig& observability) {
  const auto target = ResolveExporter(observability, Signal::kMetrics);

  std::unique_ptr<sdkmetrics::PushMetricExporter> exporter;
  if (target.http) {
    otlp::OtlpHttpMetricExporterOptions options;
    options.url = target.endpoint;
    exporter    = otlp::OtlpHttpMetricExporterFactory::Create(options);
  } else {
    otlp::OtlpGrpcMetricExporterOptions options;
    options.endpoint = target.endpoint;
    exporter         = otlp::OtlpGrpcMetricExporterFactory::Create(options);
  }

  const auto&                                      metrics = observability.metrics();
  sdkmetrics::PeriodicExportingMetricReaderOptions reader_options;
  reader_options.export_interval_millis =
      std::chrono::milliseconds(metrics.collection_interval_ms() > 0 ? metrics.collection_interval_ms() : 10000);
  if (metrics.export_timeout_ms() > 0) {
    reader_options.export_timeout_millis = std::chrono::milliseconds(metrics.export_timeout_ms());
  }

  g_meter_provider = std::shared_ptr<sdkmetrics::MeterProvider>(
      sdkmetrics::MeterProviderFactory::Create(std::make_unique<sdkmetrics::ViewRegistry>(), ServiceResource()));
  g_meter_provider->AddMetricReader(
      sdkmetrics::PeriodicExportingMetricReaderFactory::Create(std::move(exporter), reader_options));
  metrics_api::Provider::SetMeterProvider(opentelemetry::nostd::shared_ptr<metrics_api::MeterProvider>(g_meter_provider));
}

opentelemetry::nostd::shared_ptr<trace_api::Tracer> Tracer() {
  return trace_api::Provider::GetTracerProvider()->GetTracer(kInstrumentationName, kInstrumentationVersion);
}

} // namespace

bool InitializeTelemetry(const slideshow::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();

  std::lock_guard lock(g_mutex);
  if (observability.tracing_enabled() && !g_tracer_provider) {
    StartTracing(observability);
  }
  if (observability.metrics_enabled() && !g_meter_provider) {
    StartMetrics(observability);
  }
  return g_tracer_provider != nullptr || g_meter_provider != nullptr;
}

void ShutdownTelemetry() {
  std::lock_guard lock(g_mutex);
  if (g_tracer_provider) {
    g_tracer_provider->ForceFlush();
    g_tracer_provider->Shutdown();
    g_tracer_provider.reset();
  }
  if (g_meter_provider) {
    g_meter_provider->ForceFlush();
    g_meter_provider->Shutdown();
    g_meter_provider.reset();
  }
}

// ------------------------------------------------------------
// Span
// ------------------------------------------------------------

struct Span::Impl {
  opentelemetry::nostd::shared_ptr<trace_api::Span> span;
  std::unique_ptr<trace_api::Scope>                 scope;
};

Span::Span(std::string_view name) : impl_(std::make_unique<Impl>()) {
  auto tracer  = Tracer();
  impl_->span  = tracer->StartSpan(std::string(name));
  impl_->scope = std::make_unique<trace_api::Scope>(tracer->WithActiveSpan(impl_->span));
}

Span::~Span() {
  impl_->scope.reset();
  impl_->span->End();
}

void Span::SetProject(std::int64_t project_id) {
  impl_->span->SetAttribute("slideshow.project_id", project_id);
}

void Span::SetAttribute(std::string_view key, std::string_view value) {
  impl_->span->SetAttribute(std::string(key), std::string(value));
}

void Span::SetAttribute(std::string_view key, std::int64_t value) {
  impl_->span->SetAttribute(std::string(key), value);
}

void Span::SetAttribute(std::string_view key, double value) {
  impl_->span->SetAttribute(std::string(key), value);
}

void Span::AddEvent(std::string_view name) {
  impl_->span->AddEvent(std::string(name));
}

void Span::RecordError(std::string_view kind, std::string_view description) {
  impl_->span->AddEvent("exception", {{"exception.type", std::string(kind)},
                                      {"exception.message", std::string(description)}});
  impl_->span->SetStatus(trace_api::StatusCode::kError, std::string(description));
}

} // namespace slideshow::observability

#endif
