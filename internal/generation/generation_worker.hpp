#pragma once

#include <memory>
#include <thread>

#include "generation_scheduler.hpp"

namespace slideshow::core {
class GenerationOrchestrator;
}

namespace slideshow::generation {

/*
  Background worker that runs queued generation attempts.

  The orchestrator records failures on the project; the worker only logs
  them and moves on to the next task.
*/
class GenerationWorker {
 public:
  GenerationWorker(std::shared_ptr<GenerationScheduler> scheduler,
                   std::shared_ptr<slideshow::core::GenerationOrchestrator> orchestrator);
  ~GenerationWorker();

  void Start();
  void Stop();

 private:
  void Run();

  std::shared_ptr<GenerationScheduler>                     scheduler_;
  std::shared_ptr<slideshow::core::GenerationOrchestrator> orchestrator_;

  std::thread thread_;
};

} // namespace slideshow::generation
