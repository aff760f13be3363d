#pragma once

#include <memory>
#include <string>

namespace slideshow::core { class GenerationOrchestrator; }
namespace slideshow::db { class Repository; }
namespace slideshow::encoder { class Encoder; }
namespace slideshow::generation { class GenerationScheduler; class SingleFlight; }
namespace slideshow::storage { class ArtifactStore; }

namespace slideshow::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<slideshow::db::Repository> repository;
  std::shared_ptr<slideshow::storage::ArtifactStore> store;
  std::shared_ptr<slideshow::encoder::Encoder> encoder;
  std::shared_ptr<slideshow::core::GenerationOrchestrator> orchestrator;
  std::shared_ptr<slideshow::generation::GenerationScheduler> scheduler;
  std::shared_ptr<slideshow::generation::SingleFlight> single_flight;

  // store-relative root for uploaded images
  std::string images_dir = "images";
};

}
