#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include "internal/db/api/db_errors.hpp"
#include "slideshow/v1/types.pb.h"

namespace slideshow::db::sqlite {

using slideshow::db::ErrorCode;
using slideshow::db::Result;

namespace {

constexpr const char* kProjectColumns =
    "id,name,status,output_path,duration_per_image,fps,created_at_ms,updated_at_ms";

constexpr const char* kImageColumns =
    "id,project_id,filename,file_path,file_size,mime_type,order_index,uploaded_at_ms";

// Finalizes the statement on scope exit.
struct Statement {
  sqlite3_stmt* st = nullptr;
  int           rc = SQLITE_OK;

  Statement(sqlite3* db, const std::string& sql) {
    rc = sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr);
    if (rc != SQLITE_OK) {
      if (st) sqlite3_finalize(st);
      st = nullptr;
    }
  }
  ~Statement() {
    if (st) sqlite3_finalize(st);
  }
  Statement(const Statement&)            = delete;
  Statement& operator=(const Statement&) = delete;

  explicit operator bool() const {
    return st != nullptr;
  }
};

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindI64(sqlite3_stmt* st, int idx, int64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindOptText(sqlite3_stmt* st, int idx, const std::optional<std::string>& s) {
  if (s.has_value()) {
    BindText(st, idx, *s);
  } else {
    sqlite3_bind_null(st, idx);
  }
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

std::optional<std::string> ColOptText(sqlite3_stmt* st, int col) {
  if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
  return ColText(st, col);
}

model::ProjectRecord ReadProject(sqlite3_stmt* st) {
  model::ProjectRecord r;
  r.id                 = sqlite3_column_int64(st, 0);
  r.name               = ColText(st, 1);
  r.status             = static_cast<slideshow::v1::ProjectStatus>(sqlite3_column_int(st, 2));
  r.output_path        = ColOptText(st, 3);
  r.duration_per_image = sqlite3_column_double(st, 4);
  r.fps                = sqlite3_column_int(st, 5);
  r.created_at_ms      = static_cast<uint64_t>(sqlite3_column_int64(st, 6));
  r.updated_at_ms      = static_cast<uint64_t>(sqlite3_column_int64(st, 7));
  return r;
}

model::ImageRecord ReadImage(sqlite3_stmt* st) {
  model::ImageRecord r;
  r.id             = sqlite3_column_int64(st, 0);
  r.project_id     = sqlite3_column_int64(st, 1);
  r.filename       = ColText(st, 2);
  r.file_path      = ColText(st, 3);
  r.file_size      = static_cast<uint64_t>(sqlite3_column_int64(st, 4));
  r.mime_type      = ColText(st, 5);
  r.order_index    = sqlite3_column_int(st, 6);
  r.uploaded_at_ms = static_cast<uint64_t>(sqlite3_column_int64(st, 7));
  return r;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
    return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

void SqliteRepository::Check(sqlite3* db, int rc, const std::string& context) {
    ThrowIfDbError(Translate(db, rc), context);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
        return Result::Ok();

    switch (rc & 0xff) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT:
            return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
        case SQLITE_IOERR:
            return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
        case SQLITE_CORRUPT:
            return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
}

// ------------------------------------------------------------------
// Projects
// ------------------------------------------------------------------

Result SqliteRepository::InsertProject(Transaction& t, model::ProjectRecord& r) {
    auto* db = TX(t).Handle();

    Statement stmt(db,
        "INSERT INTO video_projects(name,status,output_path,duration_per_image,fps,created_at_ms,updated_at_ms) "
        "VALUES(?,?,?,?,?,?,?);");
    if (!stmt) return Translate(db, stmt.rc);

    BindText(stmt.st, 1, r.name);
    sqlite3_bind_int(stmt.st, 2, static_cast<int>(r.status));
    BindOptText(stmt.st, 3, r.output_path);
    sqlite3_bind_double(stmt.st, 4, r.duration_per_image);
    sqlite3_bind_int(stmt.st, 5, r.fps);
    BindU64(stmt.st, 6, r.created_at_ms);
    BindU64(stmt.st, 7, r.updated_at_ms);

    auto result = Translate(db, sqlite3_step(stmt.st));
    if (result) r.id = sqlite3_last_insert_rowid(db);
    return result;
}

std::optional<model::ProjectRecord> SqliteRepository::GetProject(Transaction& t, int64_t id) {
    auto* db = TX(t).Handle();

    Statement stmt(db, std::string("SELECT ") + kProjectColumns + " FROM video_projects WHERE id=?;");
    if (!stmt) Check(db, stmt.rc, "get project");

    BindI64(stmt.st, 1, id);
    const int rc = sqlite3_step(stmt.st);
    if (rc == SQLITE_ROW) return ReadProject(stmt.st);
    Check(db, rc, "get project");
    return std::nullopt;
}

std::vector<model::ProjectRecord> SqliteRepository::ListProjects(Transaction& t) {
    auto* db = TX(t).Handle();

    std::vector<model::ProjectRecord> out;
    Statement stmt(db, std::string("SELECT ") + kProjectColumns + " FROM video_projects ORDER BY id ASC;");
    if (!stmt) Check(db, stmt.rc, "list projects");

    int rc;
    while ((rc = sqlite3_step(stmt.st)) == SQLITE_ROW) {
        out.push_back(ReadProject(stmt.st));
    }
    Check(db, rc, "list projects");
    return out;
}

Result SqliteRepository::UpdateProject(Transaction& t, const model::ProjectRecord& r) {
    auto* db = TX(t).Handle();

    Statement stmt(db,
        "UPDATE video_projects SET name=?,status=?,output_path=?,duration_per_image=?,fps=?,updated_at_ms=? "
        "WHERE id=?;");
    if (!stmt) return Translate(db, stmt.rc);

    BindText(stmt.st, 1, r.name);
    sqlite3_bind_int(stmt.st, 2, static_cast<int>(r.status));
    BindOptText(stmt.st, 3, r.output_path);
    sqlite3_bind_double(stmt.st, 4, r.duration_per_image);
    sqlite3_bind_int(stmt.st, 5, r.fps);
    BindU64(stmt.st, 6, r.updated_at_ms);
    BindI64(stmt.st, 7, r.id);

    auto result = Translate(db, sqlite3_step(stmt.st));
    if (result && sqlite3_changes(db) == 0) {
        return Result::Err(ErrorCode::NotFound, "project " + std::to_string(r.id));
    }
    return result;
}

Result SqliteRepository::SetProjectStatus(Transaction& t, int64_t id, slideshow::v1::ProjectStatus status,
                                          const std::optional<std::string>& output_path, uint64_t updated_at_ms) {
    auto* db = TX(t).Handle();

    // COALESCE keeps the stored output_path when none is given
    Statement stmt(db,
        "UPDATE video_projects SET status=?,output_path=COALESCE(?,output_path),updated_at_ms=? WHERE id=?;");
    if (!stmt) return Translate(db, stmt.rc);

    sqlite3_bind_int(stmt.st, 1, static_cast<int>(status));
    BindOptText(stmt.st, 2, output_path);
    BindU64(stmt.st, 3, updated_at_ms);
    BindI64(stmt.st, 4, id);

    auto result = Translate(db, sqlite3_step(stmt.st));
    if (result && sqlite3_changes(db) == 0) {
        return Result::Err(ErrorCode::NotFound, "project " + std::to_string(id));
    }
    return result;
}

std::unordered_map<int, uint64_t> SqliteRepository::CountProjectsByStatus(Transaction& t) {
    auto* db = TX(t).Handle();

    std::unordered_map<int, uint64_t> counts;
    Statement stmt(db, "SELECT status,COUNT(*) FROM video_projects GROUP BY status;");
    if (!stmt) Check(db, stmt.rc, "count projects");

    int rc;
    while ((rc = sqlite3_step(stmt.st)) == SQLITE_ROW) {
        counts[sqlite3_column_int(stmt.st, 0)] = static_cast<uint64_t>(sqlite3_column_int64(stmt.st, 1));
    }
    Check(db, rc, "count projects");
    return counts;
}

// ------------------------------------------------------------------
// Images
// ------------------------------------------------------------------

Result SqliteRepository::InsertImage(Transaction& t, model::ImageRecord& r) {
    auto* db = TX(t).Handle();

    {
        Statement exists(db, "SELECT 1 FROM video_projects WHERE id=?;");
        if (!exists) return Translate(db, exists.rc);
        BindI64(exists.st, 1, r.project_id);
        const int rc = sqlite3_step(exists.st);
        if (rc == SQLITE_DONE) {
            return Result::Err(ErrorCode::NotFound, "project " + std::to_string(r.project_id));
        }
        if (rc != SQLITE_ROW) return Translate(db, rc);
    }

    Statement stmt(db,
        "INSERT INTO images(project_id,filename,file_path,file_size,mime_type,order_index,uploaded_at_ms) "
        "VALUES(?,?,?,?,?,?,?);");
    if (!stmt) return Translate(db, stmt.rc);

    BindI64(stmt.st, 1, r.project_id);
    BindText(stmt.st, 2, r.filename);
    BindText(stmt.st, 3, r.file_path);
    BindU64(stmt.st, 4, r.file_size);
    BindText(stmt.st, 5, r.mime_type);
    sqlite3_bind_int(stmt.st, 6, r.order_index);
    BindU64(stmt.st, 7, r.uploaded_at_ms);

    auto result = Translate(db, sqlite3_step(stmt.st));
    if (result) r.id = sqlite3_last_insert_rowid(db);
    return result;
}

std::vector<model::ImageRecord> SqliteRepository::ListImagesOrdered(Transaction& t, int64_t project_id) {
    auto* db = TX(t).Handle();

    std::vector<model::ImageRecord> out;
    Statement stmt(db, std::string("SELECT ") + kImageColumns +
                           " FROM images WHERE project_id=? ORDER BY order_index ASC, id ASC;");
    if (!stmt) Check(db, stmt.rc, "list images");

    BindI64(stmt.st, 1, project_id);
    int rc;
    while ((rc = sqlite3_step(stmt.st)) == SQLITE_ROW) {
        out.push_back(ReadImage(stmt.st));
    }
    // a scan cut short must not pass for a shorter frame list
    Check(db, rc, "list images");
    return out;
}

} // namespace slideshow::db::sqlite
