#pragma once

#include <array>

namespace slideshow::db::sql {

/*
  Canonical ledger schema.

  Every statement is idempotent (IF NOT EXISTS) so bootstrap can run on
  each start. Deleting a project cascades to its images.
*/

inline constexpr std::array<const char*, 3> kSqliteSchema = {
    "CREATE TABLE IF NOT EXISTS video_projects ("
    " id INTEGER PRIMARY KEY AUTOINCREMENT,"
    " name TEXT NOT NULL,"
    " status INTEGER NOT NULL,"
    " output_path TEXT,"
    " duration_per_image REAL NOT NULL DEFAULT 2.0,"
    " fps INTEGER NOT NULL DEFAULT 30,"
    " created_at_ms INTEGER NOT NULL,"
    " updated_at_ms INTEGER NOT NULL);",

    "CREATE TABLE IF NOT EXISTS images ("
    " id INTEGER PRIMARY KEY AUTOINCREMENT,"
    " project_id INTEGER NOT NULL REFERENCES video_projects(id) ON DELETE CASCADE,"
    " filename TEXT NOT NULL,"
    " file_path TEXT NOT NULL,"
    " file_size INTEGER NOT NULL,"
    " mime_type TEXT NOT NULL,"
    " order_index INTEGER NOT NULL,"
    " uploaded_at_ms INTEGER NOT NULL);",

    "CREATE INDEX IF NOT EXISTS images_project_order ON images(project_id, order_index, id);",
};

inline constexpr std::array<const char*, 3> kPostgresSchema = {
    "CREATE TABLE IF NOT EXISTS video_projects ("
    " id BIGSERIAL PRIMARY KEY,"
    " name TEXT NOT NULL,"
    " status SMALLINT NOT NULL,"
    " output_path TEXT,"
    " duration_per_image DOUBLE PRECISION NOT NULL DEFAULT 2.0,"
    " fps INTEGER NOT NULL DEFAULT 30,"
    " created_at_ms BIGINT NOT NULL,"
    " updated_at_ms BIGINT NOT NULL);",

    "CREATE TABLE IF NOT EXISTS images ("
    " id BIGSERIAL PRIMARY KEY,"
    " project_id BIGINT NOT NULL REFERENCES video_projects(id) ON DELETE CASCADE,"
    " filename TEXT NOT NULL,"
    " file_path TEXT NOT NULL,"
    " file_size BIGINT NOT NULL,"
    " mime_type TEXT NOT NULL,"
    " order_index INTEGER NOT NULL,"
    " uploaded_at_ms BIGINT NOT NULL);",

    "CREATE INDEX IF NOT EXISTS images_project_order ON images(project_id, order_index, id);",
};

} // namespace slideshow::db::sql
