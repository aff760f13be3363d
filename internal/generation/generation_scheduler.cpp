#include "generation_scheduler.hpp"

namespace slideshow::generation {

bool GenerationScheduler::Enqueue(GenerationTask task) {
  {
    std::lock_guard lock(mutex_);
    if (shutdown_) return false;
    queue_.push(std::move(task));
  }
  cv_.notify_one();
  return true;
}

std::optional<GenerationTask> GenerationScheduler::Dequeue() {
  std::unique_lock lock(mutex_);

  cv_.wait(lock, [&] { return shutdown_ || !queue_.empty(); });

  if (shutdown_) return std::nullopt;

  GenerationTask task = std::move(queue_.front());
  queue_.pop();
  return task;
}

std::size_t GenerationScheduler::Shutdown() {
  std::queue<GenerationTask> dropped;
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
    dropped.swap(queue_);
  }
  cv_.notify_all();
  // leases are released here, outside the lock
  return dropped.size();
}

std::size_t GenerationScheduler::Pending() const {
  std::lock_guard lock(mutex_);
  return queue_.size();
}

} // namespace slideshow::generation
