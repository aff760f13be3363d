#pragma once

#include "internal/db/api/repository.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace slideshow::db::postgres {

class PgRepository final : public db::Repository {
public:
  explicit PgRepository(std::shared_ptr<PgPool> pool);

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

  // Create the ledger tables if they do not exist yet.
  void ApplySchema();

private:
  std::shared_ptr<PgPool> pool_;

  static PgTransaction& TX(Transaction& t);
  static Result Translate(const std::exception&);
};

}
