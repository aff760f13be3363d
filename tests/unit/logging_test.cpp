#include "internal/observability/logging.hpp"

#include <spdlog/spdlog.h>

#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

#include "config/config.pb.h"

namespace {

std::string ReadAll(const std::filesystem::path& path) {
  std::ifstream      in(path);
  std::ostringstream out;
  out << in.rdbuf();
  return out.str();
}

void TestSettingsComeFromConfig() {
  unsetenv("SLIDESHOW_LOG_LEVEL");
  unsetenv("SLIDESHOW_LOG_FILE");

  slideshow::runtime::config::RuntimeConfig config;
  config.mutable_logging()->set_level("warn");
  config.mutable_logging()->set_file_path("/tmp/x.log");
  config.mutable_logging()->set_max_files(5);

  auto settings = slideshow::observability::ResolveLogSettings(config);
  assert(settings.level == spdlog::level::warn);
  assert(settings.file_path == "/tmp/x.log");
  assert(settings.max_files == 5);
  assert(!settings.pattern.empty());
  assert(!settings.include_trace_context);
}

void TestEnvironmentOverridesConfig() {
  setenv("SLIDESHOW_LOG_LEVEL", "debug", 1);
  setenv("SLIDESHOW_LOG_INCLUDE_TRACE_CONTEXT", "true", 1);

  slideshow::runtime::config::RuntimeConfig config;
  config.mutable_logging()->set_level("error");

  auto settings = slideshow::observability::ResolveLogSettings(config);
  assert(settings.level == spdlog::level::debug);
  assert(settings.include_trace_context);

  unsetenv("SLIDESHOW_LOG_LEVEL");
  unsetenv("SLIDESHOW_LOG_INCLUDE_TRACE_CONTEXT");
}

void TestFileSinkReceivesStructuredFields() {
  const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
  const auto path  = std::filesystem::temp_directory_path() / ("slideshow_logging_" + std::to_string(stamp) + ".log");

  slideshow::observability::LogSettings settings;
  settings.level     = spdlog::level::info;
  settings.pattern   = "%v";
  settings.file_path = path.string();
  slideshow::observability::InitializeLogging(settings);

  SLIDESHOW_LOG_DEBUG("hidden", {slideshow::observability::StringField("k", "v")});
  SLIDESHOW_LOG_INFO("generation started", {slideshow::observability::ProjectField(42),
                                            slideshow::observability::StringField("error", "two words"),
                                            slideshow::observability::BoolField("placeholder", true),
                                            slideshow::observability::DoubleField("duration_s", 1.5)});
  spdlog::default_logger()->flush();

  const auto contents = ReadAll(path);
  assert(contents.find("hidden") == std::string::npos);
  assert(contents.find("generation started project_id=42 error=\"two words\" placeholder=true duration_s=1.500") !=
         std::string::npos);

  slideshow::observability::ShutdownLogging();
  std::filesystem::remove(path);
}

} // namespace

int main() {
  TestSettingsComeFromConfig();
  TestEnvironmentOverridesConfig();
  TestFileSinkReceivesStructuredFields();

  std::cout << "slideshow_unit_logging: pass\n";
  return 0;
}
