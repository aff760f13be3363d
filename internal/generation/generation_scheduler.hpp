#pragma once

#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <queue>

#include "generation_task.hpp"

namespace slideshow::generation {

/*
  Thread-safe blocking queue for generation workers.
*/
class GenerationScheduler {
 public:
  // false once Shutdown has been called; the task is dropped
  bool Enqueue(GenerationTask task);

  // blocking wait; nullopt after Shutdown
  std::optional<GenerationTask> Dequeue();

  // Wakes all waiters and drops queued tasks. Returns how many were dropped.
  std::size_t Shutdown();

  std::size_t Pending() const;

 private:
  mutable std::mutex         mutex_;
  std::condition_variable    cv_;
  std::queue<GenerationTask> queue_;
  bool                       shutdown_ = false;
};

} // namespace slideshow::generation
