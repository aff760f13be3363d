#pragma once

#include <memory>
#include <vector>

#include <grpcpp/impl/service_type.h>

#include "config/config.pb.h"

namespace slideshow::generation {
class GenerationWorker;
}
namespace slideshow::encoder {
class Encoder;
}

namespace slideshow::factory {

/*
  Application

  Owns all long-lived objects used by the server.
  Everything here lives for the lifetime of the process.
*/
struct Application {
  std::vector<std::unique_ptr<::grpc::Service>>                         grpc_services;
  std::vector<std::shared_ptr<slideshow::generation::GenerationWorker>> background_workers;
  std::shared_ptr<slideshow::encoder::Encoder>                        encoder;

  // Stops every background worker; queued attempts are dropped.
  void StopWorkers();
};

/*
  Build

  Constructs the entire backend based on runtime config.

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete DB, store and encoder types.
*/
Application Build(const slideshow::runtime::config::RuntimeConfig& config);

} // namespace slideshow::factory
