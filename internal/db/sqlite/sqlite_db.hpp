#pragma once

#include <sqlite3.h>

#include <memory>
#include <mutex>
#include <string>

namespace slideshow::db::sqlite {

/*
  Thin RAII wrapper around sqlite3*.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path, bool wal_mode = true);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  // Execute a SQL string (used for pragmas/schema)
  void Exec(const std::string& sql);

  // Create the ledger tables if they do not exist yet.
  void ApplySchema();

  // One transaction at a time on the shared connection.
  std::mutex& TransactionMutex() {
    return tx_mutex_;
  }

 private:
  void Configure(bool wal_mode);

  sqlite3*    db_ = nullptr;
  std::string path_;
  std::mutex  tx_mutex_;
};

} // namespace slideshow::db::sqlite
