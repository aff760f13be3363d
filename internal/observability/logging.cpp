#include "internal/observability/logging.hpp"

#include <spdlog/logger.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <atomic>
#include <cstdio>
#include <cstdlib>
#include <memory>
#include <string>
#include <vector>

#include "config/config.pb.h"

#ifdef ENABLE_OTEL
#include <opentelemetry/context/runtime_context.h>
#include <opentelemetry/trace/provider.h>
#include <opentelemetry/trace/span.h>
#endif

namespace slideshow::observability {
namespace {

constexpr char kLoggerName[]     = "slideshow";
constexpr char kDefaultPattern[] = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] [%t] %v";

std::atomic<bool> g_include_trace_context{false};

const char* Env(const char* name) {
  const char* value = std::getenv(name);
  return value != nullptr && *value != '\0' ? value : nullptr;
}

bool Truthy(std::string_view value) {
  return value == "1" || value == "true" || value == "yes";
}

void AppendFields(std::string& line, std::initializer_list<LogField> fields) {
  for (const auto& field : fields) {
    line.push_back(' ');
    line.append(field.key);
    line.push_back('=');
    // keep one field one token
    if (field.value.find(' ') != std::string::npos) {
      line.push_back('"');
      line.append(field.value);
      line.push_back('"');
    } else {
      line.append(field.value);
    }
  }
}

#ifdef ENABLE_OTEL
void AppendHex(std::string& out, const uint8_t* data, std::size_t size) {
  static constexpr char kHex[] = "0123456789abcdef";
  for (std::size_t i = 0; i < size; ++i) {
    out.push_back(kHex[(data[i] >> 4) & 0x0F]);
    out.push_back(kHex[data[i] & 0x0F]);
  }
}

void AppendTraceContext(std::string& line) {
  auto span = opentelemetry::trace::GetSpan(opentelemetry::context::RuntimeContext::GetCurrent());
  if (!span) return;

  auto context = span->GetContext();
  if (!context.IsValid()) return;

  uint8_t trace_bytes[16];
  uint8_t span_bytes[8];
  context.trace_id().CopyBytesTo(trace_bytes);
  context.span_id().CopyBytesTo(span_bytes);

  line.append(" trace_id=");
  AppendHex(line, trace_bytes, sizeof(trace_bytes));
  line.append(" span_id=");
  AppendHex(line, span_bytes, sizeof(span_bytes));
}
#else
void AppendTraceContext(std::string&) {
}
#endif

} // namespace

LogField StringField(std::string_view key, std::string_view value) {
  return {std::string(key), std::string(value)};
}

LogField IntField(std::string_view key, std::int64_t value) {
  return {std::string(key), std::to_string(value)};
}

LogField DoubleField(std::string_view key, double value) {
  char buffer[32];
  std::snprintf(buffer, sizeof(buffer), "%.3f", value);
  return {std::string(key), buffer};
}

LogField BoolField(std::string_view key, bool value) {
  return {std::string(key), value ? "true" : "false"};
}

LogSettings ResolveLogSettings(const slideshow::runtime::config::RuntimeConfig& config) {
  const auto& logging = config.logging();

  LogSettings settings;

  std::string level = logging.level().empty() ? "info" : logging.level();
  if (const char* env = Env("SLIDESHOW_LOG_LEVEL")) level = env;
  settings.level = spdlog::level::from_str(level);

  settings.pattern = logging.pattern().empty() ? kDefaultPattern : logging.pattern();
  if (const char* env = Env("SLIDESHOW_LOG_PATTERN")) settings.pattern = env;

  settings.include_trace_context = logging.include_trace_context();
  if (const char* env = Env("SLIDESHOW_LOG_INCLUDE_TRACE_CONTEXT")) settings.include_trace_context = Truthy(env);

  settings.file_path = logging.file_path();
  if (const char* env = Env("SLIDESHOW_LOG_FILE")) settings.file_path = env;
  settings.max_file_bytes = logging.max_file_bytes();
  settings.max_files      = logging.max_files();

  return settings;
}

void InitializeLogging(const slideshow::runtime::config::RuntimeConfig& config) {
  InitializeLogging(ResolveLogSettings(config));
}

void InitializeLogging(const LogSettings& settings) {
  std::vector<spdlog::sink_ptr> sinks;
  sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

  if (!settings.file_path.empty()) {
    const auto max_bytes = settings.max_file_bytes > 0 ? settings.max_file_bytes : 10 * 1024 * 1024;
    const auto max_files = settings.max_files > 0 ? settings.max_files : 3;
    sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(settings.file_path,
                                                                           static_cast<std::size_t>(max_bytes),
                                                                           static_cast<std::size_t>(max_files)));
  }

  // re-initialization replaces the previous logger
  spdlog::drop(kLoggerName);

  auto logger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
  logger->set_pattern(settings.pattern.empty() ? kDefaultPattern : settings.pattern);
  logger->set_level(settings.level);
  logger->flush_on(spdlog::level::warn);

  spdlog::register_logger(logger);
  spdlog::set_default_logger(std::move(logger));
  g_include_trace_context = settings.include_trace_context;
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  auto logger = spdlog::default_logger_raw();
  if (logger == nullptr || !logger->should_log(level)) {
    return;
  }

  std::string line(message);
  AppendFields(line, fields);
  if (g_include_trace_context) {
    AppendTraceContext(line);
  }
  logger->log(level, line);
}

} // namespace slideshow::observability
