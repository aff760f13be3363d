#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_set>

namespace slideshow::generation {

/*
  Admits at most one in-flight generation attempt per project id.

  TryAcquire hands out a move-only Lease; the id stays busy until the
  Lease is destroyed. Different ids never block each other.
*/
class SingleFlight {
  struct Registry {
    std::mutex                  mutex;
    std::unordered_set<int64_t> active;
  };

 public:
  class Lease {
   public:
    Lease() = default;
    ~Lease();

    Lease(Lease&& other) noexcept;
    Lease& operator=(Lease&& other) noexcept;

    Lease(const Lease&)            = delete;
    Lease& operator=(const Lease&) = delete;

    int64_t key() const {
      return key_;
    }

   private:
    friend class SingleFlight;
    Lease(std::shared_ptr<Registry> registry, int64_t key);
    void Release();

    std::shared_ptr<Registry> registry_;
    int64_t                   key_ = 0;
  };

  SingleFlight();

  // nullopt if key is already held.
  std::optional<Lease> TryAcquire(int64_t key);

  bool InFlight(int64_t key) const;

 private:
  std::shared_ptr<Registry> registry_;
};

} // namespace slideshow::generation
