#pragma once

#include <cstdint>
#include <memory>
#include <string_view>

namespace slideshow::runtime::config {
class RuntimeConfig;
}

namespace slideshow::observability {

/*
  OpenTelemetry tracing and metrics.

  Compiled to no-ops unless ENABLE_OTEL is defined. Exporters are OTLP
  over gRPC or HTTP; the endpoint falls back to the standard
  OTEL_EXPORTER_OTLP_*_ENDPOINT variables when the config leaves it empty.
*/

// Starts the exporters the config enables. Returns true if any is active.
bool InitializeTelemetry(const slideshow::runtime::config::RuntimeConfig& config);

// Flushes and stops all exporters.
void ShutdownTelemetry();

// Active span for the lifetime of the object.
class Span {
 public:
  explicit Span(std::string_view name);
  ~Span();

  Span(const Span&)            = delete;
  Span& operator=(const Span&) = delete;

  void SetProject(std::int64_t project_id);
  void SetAttribute(std::string_view key, std::string_view value);
  void SetAttribute(std::string_view key, std::int64_t value);
  void SetAttribute(std::string_view key, double value);
  void AddEvent(std::string_view name);

  // Marks the span as failed.
  void RecordError(std::string_view kind, std::string_view description);

 private:
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

class Metrics {
 public:
  static Metrics& Instance();

  void RecordRpc(std::string_view route, bool ok, double latency_ms);

  // outcome is "completed" or the failure kind
  void RecordGeneration(std::string_view outcome, double duration_ms, bool placeholder);

  void AddFramesStaged(std::uint64_t frames);
  void AddUploadedBytes(std::uint64_t bytes);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeTelemetry(const slideshow::runtime::config::RuntimeConfig&) {
  return false;
}

inline void ShutdownTelemetry() {
}

inline Span::Span(std::string_view) {
}

inline Span::~Span() {
}

inline void Span::SetProject(std::int64_t) {
}

inline void Span::SetAttribute(std::string_view, std::string_view) {
}

inline void Span::SetAttribute(std::string_view, std::int64_t) {
}

inline void Span::SetAttribute(std::string_view, double) {
}

inline void Span::AddEvent(std::string_view) {
}

inline void Span::RecordError(std::string_view, std::string_view) {
}

inline Metrics::Metrics() {
}

inline Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

inline void Metrics::RecordRpc(std::string_view, bool, double) {
}

inline void Metrics::RecordGeneration(std::string_view, double, bool) {
}

inline void Metrics::AddFramesStaged(std::uint64_t) {
}

inline void Metrics::AddUploadedBytes(std::uint64_t) {
}
#endif

} // namespace slideshow::observability
