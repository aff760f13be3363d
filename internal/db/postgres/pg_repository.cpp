#include "pg_repository.hpp"

#include "internal/db/sql/schema.hpp"
#include "slideshow/v1/types.pb.h"

namespace slideshow::db::postgres {

namespace {

model::ProjectRecord ReadProject(const pqxx::row& row) {
  model::ProjectRecord r;
  r.id                 = row[0].as<int64_t>();
  r.name               = row[1].c_str();
  r.status             = (slideshow::v1::ProjectStatus)row[2].as<int>();
  r.output_path        = row[3].is_null() ? std::nullopt : std::optional<std::string>(row[3].c_str());
  r.duration_per_image = row[4].as<double>();
  r.fps                = row[5].as<int32_t>();
  r.created_at_ms      = row[6].as<uint64_t>();
  r.updated_at_ms      = row[7].as<uint64_t>();
  return r;
}

model::ImageRecord ReadImage(const pqxx::row& row) {
  model::ImageRecord r;
  r.id             = row[0].as<int64_t>();
  r.project_id     = row[1].as<int64_t>();
  r.filename       = row[2].c_str();
  r.file_path      = row[3].c_str();
  r.file_size      = row[4].as<uint64_t>();
  r.mime_type      = row[5].c_str();
  r.order_index    = row[6].as<int32_t>();
  r.uploaded_at_ms = row[7].as<uint64_t>();
  return r;
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::foreign_key_violation*>(&e)) {
    return Result::Err(ErrorCode::NotFound, e.what());
  }
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::serialization_failure*>(&e)) {
    return Result::Err(ErrorCode::Conflict, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

void PgRepository::ApplySchema() {
  pool_->Bootstrap(std::vector<std::string>(sql::kPostgresSchema.begin(), sql::kPostgresSchema.end()));
}

Result PgRepository::InsertProject(Transaction& t, model::ProjectRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared("insert_project", r.name, (int)r.status, r.output_path,
                                          r.duration_per_image, r.fps, r.created_at_ms, r.updated_at_ms);
    r.id = res[0][0].as<int64_t>();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::ProjectRecord> PgRepository::GetProject(Transaction& t, int64_t id) {
  auto res = TX(t).Work().exec_prepared("get_project", id);
  if (res.empty()) return std::nullopt;
  return ReadProject(res[0]);
}

std::vector<model::ProjectRecord> PgRepository::ListProjects(Transaction& t) {
  auto res = TX(t).Work().exec(
      "SELECT id,name,status,output_path,duration_per_image,fps,created_at_ms,updated_at_ms "
      "FROM video_projects ORDER BY id ASC;");

  std::vector<model::ProjectRecord> records;
  records.reserve(res.size());
  for (const auto& row : res) {
    records.push_back(ReadProject(row));
  }
  return records;
}

Result PgRepository::UpdateProject(Transaction& t, const model::ProjectRecord& r) {
  try {
    auto res = TX(t).Work().exec_params(
        "UPDATE video_projects SET name=$2,status=$3,output_path=$4,duration_per_image=$5,fps=$6,updated_at_ms=$7 "
        "WHERE id=$1;",
        r.id, r.name, (int)r.status, r.output_path, r.duration_per_image, r.fps, r.updated_at_ms);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, "project " + std::to_string(r.id));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::SetProjectStatus(Transaction& t, int64_t id, slideshow::v1::ProjectStatus status,
                                      const std::optional<std::string>& output_path, uint64_t updated_at_ms) {
  try {
    auto res = TX(t).Work().exec_prepared("set_project_status", id, (int)status, output_path, updated_at_ms);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, "project " + std::to_string(id));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::unordered_map<int, uint64_t> PgRepository::CountProjectsByStatus(Transaction& t) {
  auto res = TX(t).Work().exec("SELECT status,COUNT(*) FROM video_projects GROUP BY status;");

  std::unordered_map<int, uint64_t> counts;
  for (const auto& row : res) {
    counts[row[0].as<int>()] = row[1].as<uint64_t>();
  }
  return counts;
}

Result PgRepository::InsertImage(Transaction& t, model::ImageRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared("insert_image", r.project_id, r.filename, r.file_path, r.file_size,
                                          r.mime_type, r.order_index, r.uploaded_at_ms);
    r.id = res[0][0].as<int64_t>();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::ImageRecord> PgRepository::ListImagesOrdered(Transaction& t, int64_t project_id) {
  auto res = TX(t).Work().exec_prepared("list_images_ordered", project_id);

  std::vector<model::ImageRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(ReadImage(row));
  }
  return out;
}

} // namespace slideshow::db::postgres
