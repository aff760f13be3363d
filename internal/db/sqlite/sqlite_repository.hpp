#pragma once

#include <memory>
#include <string>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace slideshow::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

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
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
  // Throws when rc is not a success code; read paths have no Result to return.
  static void Check(sqlite3* db, int rc, const std::string& context);
};

}
