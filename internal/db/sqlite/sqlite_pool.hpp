#pragma once

#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "sqlite_db.hpp"

namespace healthstore::db::sqlite {

/*
  SqliteConnectionPool

  Read-only connections for concurrent readers.

  Design notes:
  -------------
  - Each read transaction gets its own connection.
  - Connections are opened lazily up to max_connections;
    Acquire() blocks once all of them are handed out.
  - The returned shared_ptr gives the connection back to the pool
    when the last owner drops it.
*/

class SqliteConnectionPool : public std::enable_shared_from_this<SqliteConnectionPool> {
 public:
  SqliteConnectionPool(std::string path, SqliteOptions options, std::size_t max_connections = 4);

  std::shared_ptr<SqliteDB> Acquire();

 private:
  std::shared_ptr<SqliteDB> Wrap(SqliteDB* conn);
  void                      Release(SqliteDB* conn);

  std::string   path_;
  SqliteOptions options_;
  std::size_t   max_connections_;

  std::mutex                             mutex_;
  std::condition_variable                cv_;
  std::vector<std::unique_ptr<SqliteDB>> idle_;
  std::size_t                            live_connections_ = 0;
};

} // namespace healthstore::db::sqlite
