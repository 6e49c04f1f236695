#include "sqlite_db.hpp"

#include "internal/db/sql/sql_queries.hpp"
#include "internal/util/errors.hpp"

namespace runlens::db::sqlite {

static void ThrowIf(int rc, sqlite3* db, const char* what) {
  if (rc != SQLITE_OK) {
    throw runlens::util::StorageUnavailable(std::string(what) + ": " + sqlite3_errmsg(db));
  }
}

SqliteDB::SqliteDB(std::string path, bool wal_mode) : path_(std::move(path)) {
  int rc = sqlite3_open_v2(path_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);

  if (rc != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw runlens::util::StorageUnavailable("cannot open " + path_ + ": " + msg);
  }

  try {
    Configure(wal_mode);
  } catch (const runlens::util::StorageUnavailable&) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char* err = nullptr;
  int   rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = err ? err : "sqlite exec failed";
    sqlite3_free(err);
    throw runlens::util::StorageUnavailable(msg);
  }
}

void SqliteDB::BootstrapSchema() {
  Exec(sql::CREATE_ACTIVITIES);
  Exec(sql::CREATE_ACTIVITIES_DATE_INDEX);
  Exec(sql::CREATE_ACTIVITIES_SESSION_INDEX);

  // fail fast if an older file carries an incompatible layout
  Exec("SELECT hash,filename,date,json_data,session_id FROM activities LIMIT 1;");
}

void SqliteDB::Configure(bool wal_mode) {
  // WAL lets readers proceed while an import holds the write lock
  if (wal_mode) {
    Exec("PRAGMA journal_mode=WAL;");
  }

  Exec("PRAGMA synchronous=NORMAL;");

  // wait for locks instead of failing immediately
  ThrowIf(sqlite3_busy_timeout(db_, 5000), db_, "busy_timeout");

  Exec("PRAGMA temp_store=MEMORY;");
}

} // namespace runlens::db::sqlite
