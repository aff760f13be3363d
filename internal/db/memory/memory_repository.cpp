#include "memory_repository.hpp"

#include <algorithm>

#include "memory_tx.hpp"

namespace slideshow::db::memory {

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

Result MemoryRepository::InsertProject(Transaction& t, model::ProjectRecord& r) {
  auto& s = TX(t).Mutable();
  r.id    = s.next_project_id++;
  s.projects[r.id] = r;
  return Result::Ok();
}

std::optional<model::ProjectRecord> MemoryRepository::GetProject(Transaction& t, int64_t id) {
  const auto& s  = TX(t).View();
  auto        it = s.projects.find(id);
  if (it == s.projects.end()) return std::nullopt;
  return it->second;
}

std::vector<model::ProjectRecord> MemoryRepository::ListProjects(Transaction& t) {
  const auto&                       s = TX(t).View();
  std::vector<model::ProjectRecord> records;
  records.reserve(s.projects.size());
  for (const auto& [_, record] : s.projects) {
    records.push_back(record);
  }
  return records;
}

Result MemoryRepository::UpdateProject(Transaction& t, const model::ProjectRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.projects.contains(r.id)) return Result::Err(ErrorCode::NotFound, "project " + std::to_string(r.id));
  s.projects[r.id] = r;
  return Result::Ok();
}

Result MemoryRepository::SetProjectStatus(Transaction& t, int64_t id, slideshow::v1::ProjectStatus status,
                                          const std::optional<std::string>& output_path, uint64_t updated_at_ms) {
  auto& s  = TX(t).Mutable();
  auto  it = s.projects.find(id);
  if (it == s.projects.end()) return Result::Err(ErrorCode::NotFound, "project " + std::to_string(id));

  it->second.status        = status;
  it->second.updated_at_ms = updated_at_ms;
  if (output_path.has_value()) {
    it->second.output_path = output_path;
  }
  return Result::Ok();
}

std::unordered_map<int, uint64_t> MemoryRepository::CountProjectsByStatus(Transaction& t) {
  std::unordered_map<int, uint64_t> counts;
  for (const auto& [_, record] : TX(t).View().projects) {
    ++counts[static_cast<int>(record.status)];
  }
  return counts;
}

Result MemoryRepository::InsertImage(Transaction& t, model::ImageRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.projects.contains(r.project_id)) {
    return Result::Err(ErrorCode::NotFound, "project " + std::to_string(r.project_id));
  }
  r.id = s.next_image_id++;
  s.images[r.id] = r;
  return Result::Ok();
}

std::vector<model::ImageRecord> MemoryRepository::ListImagesOrdered(Transaction& t, int64_t project_id) {
  std::vector<model::ImageRecord> out;
  // map iteration yields ascending id, stable_sort keeps it as the tie-break
  for (const auto& [_, image] : TX(t).View().images) {
    if (image.project_id == project_id) out.push_back(image);
  }
  std::stable_sort(out.begin(), out.end(), [](const model::ImageRecord& a, const model::ImageRecord& b) {
    return a.order_index < b.order_index;
  });
  return out;
}

} // namespace slideshow::db::memory
