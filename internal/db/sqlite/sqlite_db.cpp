#include "sqlite_db.hpp"

#include <stdexcept>

namespace healthstore::db::sqlite {

static void ThrowIf(int rc, sqlite3* db, const char* what) {
  if (rc != SQLITE_OK) {
    throw std::runtime_error(std::string(what) + ": " + sqlite3_errmsg(db));
  }
}

SqliteDB::SqliteDB(std::string path, SqliteOptions options) : path_(std::move(path)), options_(options) {
  const int flags = (options_.read_only ? SQLITE_OPEN_READONLY : (SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE)) | SQLITE_OPEN_FULLMUTEX;
  int       rc    = sqlite3_open_v2(path_.c_str(), &db_, flags, nullptr);

  if (rc != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw std::runtime_error("sqlite open " + path_ + ": " + msg);
  }

  Configure();
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
    throw std::runtime_error(msg);
  }
}

void SqliteDB::Configure() {
  // wait for locks instead of failing immediately
  ThrowIf(sqlite3_busy_timeout(db_, options_.busy_timeout_ms), db_, "busy_timeout");
  ThrowIf(sqlite3_extended_result_codes(db_, 1), db_, "extended_result_codes");

  // foreign keys are OFF by default in sqlite; series samples cascade on them
  Exec("PRAGMA foreign_keys=ON;");

  if (options_.read_only) {
    return;
  }

  // WAL lets readers run while the writer holds its lock
  if (options_.wal_mode) {
    Exec("PRAGMA journal_mode=WAL;");
    Exec("PRAGMA synchronous=NORMAL;");
  } else {
    Exec("PRAGMA synchronous=FULL;");
  }

  Exec("PRAGMA temp_store=MEMORY;");
}

} // namespace healthstore::db::sqlite
