#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/encoder/encoder.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/telemetry.hpp"
#include "internal/runtime/server.hpp"

using slideshow::factory::Build;
using slideshow::runtime::Server;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    std::cerr << "Usage: slideshow-server <config.yaml> OR slideshow-server --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = slideshow::config::ConfigLoader::LoadFromYaml(config_path);

    slideshow::observability::InitializeLogging(config);
    slideshow::observability::InitializeTelemetry(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = slideshow::factory::Build(config);

    // ------------------------------------------------------------
    // Start server
    // ------------------------------------------------------------
    Server server(config.server().bind_address(), std::move(app.grpc_services),
                  static_cast<int>(config.server().max_message_bytes()));

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    SLIDESHOW_LOG_INFO("slideshow server started", {slideshow::observability::StringField("bind_address", config.server().bind_address()),
                                                    slideshow::observability::StringField("encoder", app.encoder->Mode()),
                                                    slideshow::observability::StringField("storage_root", config.storage().root_path())});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    SLIDESHOW_LOG_INFO("shutting down slideshow server");

    server.Stop();
    app.StopWorkers();
    slideshow::observability::ShutdownTelemetry();
    slideshow::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    SLIDESHOW_LOG_ERROR("fatal error", {slideshow::observability::StringField("error", e.what())});
    slideshow::observability::ShutdownTelemetry();
    slideshow::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}
