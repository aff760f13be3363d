#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace slideshow::runtime::config {
class RuntimeConfig;
}

namespace slideshow::observability {

/*
  Structured logging on top of spdlog.

  Every line is "<message> key=value ..." so attempts can be followed by
  grepping for project_id. Environment variables override the config:

    SLIDESHOW_LOG_LEVEL, SLIDESHOW_LOG_PATTERN,
    SLIDESHOW_LOG_INCLUDE_TRACE_CONTEXT, SLIDESHOW_LOG_FILE
*/

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField DoubleField(std::string_view key, double value);
LogField BoolField(std::string_view key, bool value);

inline LogField ProjectField(std::int64_t project_id) {
  return IntField("project_id", project_id);
}

struct LogSettings {
  spdlog::level::level_enum level = spdlog::level::info;
  std::string               pattern;
  bool                      include_trace_context = false;

  // empty: console only
  std::string   file_path;
  std::uint64_t max_file_bytes = 0;
  std::uint32_t max_files      = 0;
};

LogSettings ResolveLogSettings(const slideshow::runtime::config::RuntimeConfig& config);

void InitializeLogging(const slideshow::runtime::config::RuntimeConfig& config);
void InitializeLogging(const LogSettings& settings);
void ShutdownLogging();

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

} // namespace slideshow::observability

#define SLIDESHOW_LOG_DEBUG(message, ...) ::slideshow::observability::Log(spdlog::level::debug, (message), ##__VA_ARGS__)
#define SLIDESHOW_LOG_INFO(message, ...) ::slideshow::observability::Log(spdlog::level::info, (message), ##__VA_ARGS__)
#define SLIDESHOW_LOG_WARN(message, ...) ::slideshow::observability::Log(spdlog::level::warn, (message), ##__VA_ARGS__)
#define SLIDESHOW_LOG_ERROR(message, ...) ::slideshow::observability::Log(spdlog::level::err, (message), ##__VA_ARGS__)
