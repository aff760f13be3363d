#include "single_flight.hpp"

namespace slideshow::generation {

SingleFlight::Lease::Lease(std::shared_ptr<Registry> registry, int64_t key) : registry_(std::move(registry)), key_(key) {
}

SingleFlight::Lease::~Lease() {
  Release();
}

SingleFlight::Lease::Lease(Lease&& other) noexcept : registry_(std::move(other.registry_)), key_(other.key_) {
}

SingleFlight::Lease& SingleFlight::Lease::operator=(Lease&& other) noexcept {
  if (this != &other) {
    Release();
    registry_ = std::move(other.registry_);
    key_      = other.key_;
  }
  return *this;
}

void SingleFlight::Lease::Release() {
  if (!registry_) return;
  {
    std::lock_guard lock(registry_->mutex);
    registry_->active.erase(key_);
  }
  registry_.reset();
}

SingleFlight::SingleFlight() : registry_(std::make_shared<Registry>()) {
}

std::optional<SingleFlight::Lease> SingleFlight::TryAcquire(int64_t key) {
  std::lock_guard lock(registry_->mutex);
  if (!registry_->active.insert(key).second) {
    return std::nullopt;
  }
  return Lease(registry_, key);
}

bool SingleFlight::InFlight(int64_t key) const {
  std::lock_guard lock(registry_->mutex);
  return registry_->active.contains(key);
}

} // namespace slideshow::generation
