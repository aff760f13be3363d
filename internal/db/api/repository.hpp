#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <unordered_map>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/image_record.hpp"
#include "internal/db/model/project_record.hpp"

namespace slideshow::db {

/*
  Project ledger.

  CRITICAL GUARANTEES:

  - All reads and writes run inside a Transaction
  - Reads inside a transaction see its writes
  - Ids are assigned by the backend and increase monotonically
  - ListImagesOrdered is ordered by (order_index ASC, id ASC); the id
    tie-break makes frame order deterministic for duplicate order_index

  The DB is the source of truth for:
    project configuration and status
    image metadata and order
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Projects
  // ---------------------------------------------------------------------

  // Assigns record.id on success.
  virtual Result InsertProject(Transaction&, model::ProjectRecord& record) = 0;

  virtual std::optional<model::ProjectRecord> GetProject(Transaction&, int64_t id) = 0;

  virtual std::vector<model::ProjectRecord> ListProjects(Transaction&) = 0;

  virtual Result UpdateProject(Transaction&, const model::ProjectRecord&) = 0;

  // output_path is left untouched when nullopt.
  virtual Result SetProjectStatus(Transaction&, int64_t id, slideshow::v1::ProjectStatus status,
                                  const std::optional<std::string>& output_path, uint64_t updated_at_ms) = 0;

  virtual std::unordered_map<int, uint64_t> CountProjectsByStatus(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Images
  // ---------------------------------------------------------------------

  // Assigns record.id on success. Fails with NotFound if the project is absent.
  virtual Result InsertImage(Transaction&, model::ImageRecord& record) = 0;

  virtual std::vector<model::ImageRecord> ListImagesOrdered(Transaction&, int64_t project_id) = 0;
};

} // namespace slideshow::db
