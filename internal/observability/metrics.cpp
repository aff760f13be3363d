#include "internal/observability/telemetry.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/common/attribute_value.h>
#include <opentelemetry/context/context.h>
#include <opentelemetry/metrics/provider.h>

#include <string>
#include <utility>

namespace slideshow::observability {
namespace metrics_api = opentelemetry::metrics;

namespace {
using Attribute = std::pair<opentelemetry::nostd::string_view, opentelemetry::common::AttributeValue>;
}

struct Metrics::Impl {
  opentelemetry::nostd::unique_ptr<metrics_api::Counter<std::uint64_t>> rpc_count;
  opentelemetry::nostd::unique_ptr<metrics_api::Histogram<double>>      rpc_latency_ms;
  opentelemetry::nostd::unique_ptr<metrics_api::Counter<std::uint64_t>> generation_count;
  opentelemetry::nostd::unique_ptr<metrics_api::Histogram<double>>      generation_duration_ms;
  opentelemetry::nostd::unique_ptr<metrics_api::Counter<std::uint64_t>> frames_staged;
  opentelemetry::nostd::unique_ptr<metrics_api::Counter<std::uint64_t>> uploaded_bytes;
};

// Instruments bind to whichever meter provider is installed on first use,
// so telemetry must be initialized before the first RPC.
Metrics::Metrics() : impl_(std::make_unique<Impl>()) {
  auto meter = metrics_api::Provider::GetMeterProvider()->GetMeter("slideshow", "0.1.0");

  impl_->rpc_count      = meter->CreateUInt64Counter("slideshow.rpc.count", "RPCs handled, by route and result", "1");
  impl_->rpc_latency_ms = meter->CreateDoubleHistogram("slideshow.rpc.latency_ms", "RPC handling time", "ms");
  impl_->generation_count =
      meter->CreateUInt64Counter("slideshow.generation.count", "Generation attempts, by outcome", "1");
  impl_->generation_duration_ms =
      meter->CreateDoubleHistogram("slideshow.generation.duration_ms", "Wall time of one generation attempt", "ms");
  impl_->frames_staged = meter->CreateUInt64Counter("slideshow.generation.frames_staged", "Frames copied into staging", "1");
  impl_->uploaded_bytes = meter->CreateUInt64Counter("slideshow.upload.bytes", "Image bytes accepted by uploads", "By");
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordRpc(std::string_view route, bool ok, double latency_ms) {
  const std::string route_name(route);
  impl_->rpc_count->Add(1, {Attribute{"route", route_name}, Attribute{"ok", ok}});
  impl_->rpc_latency_ms->Record(latency_ms, {Attribute{"route", route_name}}, opentelemetry::context::Context{});
}

void Metrics::RecordGeneration(std::string_view outcome, double duration_ms, bool placeholder) {
  const std::string outcome_name(outcome);
  impl_->generation_count->Add(1, {Attribute{"outcome", outcome_name}, Attribute{"placeholder", placeholder}});
  impl_->generation_duration_ms->Record(duration_ms, {Attribute{"outcome", outcome_name}},
                                        opentelemetry::context::Context{});
}

void Metrics::AddFramesStaged(std::uint64_t frames) {
  impl_->frames_staged->Add(frames);
}

void Metrics::AddUploadedBytes(std::uint64_t bytes) {
  impl_->uploaded_bytes->Add(bytes);
}

} // namespace slideshow::observability

#endif
