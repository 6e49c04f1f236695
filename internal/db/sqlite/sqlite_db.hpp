#pragma once

#include <sqlite3.h>

#include <memory>
#include <string>

namespace runlens::db::sqlite {

/*
  Thin RAII wrapper around sqlite3*.

  Open/exec failures throw util::StorageUnavailable.
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

  // Execute a SQL string (used for pragmas/schema/transaction control)
  void Exec(const std::string& sql);

  // Create the activities table and indexes if missing.
  void BootstrapSchema();

 private:
  // Configure recommended PRAGMAs (WAL, busy timeout, etc.)
  void Configure(bool wal_mode);

  sqlite3*    db_ = nullptr;
  std::string path_;
};

} // namespace runlens::db::sqlite
