#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace slideshow::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result InsertProject(Transaction&, model::ProjectRecord&) override;
  std::optional<model::ProjectRecord> GetProject(Transaction&, int64_t) override;
  std::vector<model::ProjectRecord> ListProjects(Transaction&) override;
  Result UpdateProject(Transaction&, const model::ProjectRecord&) override;
  Result SetProjectStatus(Transaction&, int64_t id, slideshow::v1::ProjectStatus status,
                          const std::optional<std::string>& output_path, uint64_t updated_at_ms) override;
  std::unordered_map<int, uint64_t> CountProjectsByStatus(Transaction&) override;

  Result InsertImage(Transaction&, model::ImageRecord&) override;
  std::vector<model::ImageRecord> ListImagesOrdered(Transaction&, int64_t project_id) override;

private:
  friend class MemoryTransaction;

  struct State {
    // ordered maps keep ListProjects in id order
    std::map<int64_t, model::ProjectRecord> projects;
    std::map<int64_t, model::ImageRecord>   images;
    int64_t next_project_id = 1;
    int64_t next_image_id   = 1;
  };

  // held by each transaction for its lifetime
  std::mutex tx_mutex_;
  State      committed_;
};

}
