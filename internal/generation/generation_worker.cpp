#include "generation_worker.hpp"

#include "internal/core/generation_orchestrator.hpp"
#include "internal/observability/logging.hpp"

namespace slideshow::generation {

GenerationWorker::GenerationWorker(std::shared_ptr<GenerationScheduler> scheduler,
                                   std::shared_ptr<slideshow::core::GenerationOrchestrator> orchestrator)
    : scheduler_(std::move(scheduler)),
      orchestrator_(std::move(orchestrator)) {}

GenerationWorker::~GenerationWorker() {
  Stop();
}

void GenerationWorker::Start() {
  thread_ = std::thread(&GenerationWorker::Run, this);
}

void GenerationWorker::Stop() {
  auto dropped = scheduler_->Shutdown();
  if (dropped > 0) {
    SLIDESHOW_LOG_WARN("generation tasks dropped at shutdown",
                       {observability::IntField("tasks", static_cast<int64_t>(dropped))});
  }
  if (thread_.joinable())
    thread_.join();
}

void GenerationWorker::Run() {
  for (;;) {
    auto task = scheduler_->Dequeue();
    if (!task)
      break;

    try {
      orchestrator_->Generate(task->project_id);
    }
    catch (const std::exception& e) {
      SLIDESHOW_LOG_WARN("background generation failed",
                         {observability::ProjectField(task->project_id),
                          observability::StringField("error", e.what())});
    }
  }
}

}
