#pragma once

#include <sqlite3.h>

#include <memory>
#include <string>

namespace healthstore::db::sqlite {

struct SqliteOptions {
  bool wal_mode        = true;
  int  busy_timeout_ms = 5000;
  bool read_only       = false;
};

/*
  Thin RAII wrapper around sqlite3*.

  The writer connection creates the file; reader connections open
  the same file read-only.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path, SqliteOptions options = {});
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  // Execute a SQL string (used for pragmas/schema)
  void Exec(const std::string& sql);

  // Configure recommended PRAGMAs (WAL, foreign keys, etc.)
  void Configure();

 private:
  sqlite3*      db_ = nullptr;
  std::string   path_;
  SqliteOptions options_;
};

} // namespace healthstore::db::sqlite
