#include "sqlite_pool.hpp"

namespace healthstore::db::sqlite {

SqliteConnectionPool::SqliteConnectionPool(std::string path, SqliteOptions options, std::size_t max_connections)
    : path_(std::move(path)), options_(options), max_connections_(max_connections == 0 ? 1 : max_connections) {
  options_.read_only = true;
}

std::shared_ptr<SqliteDB> SqliteConnectionPool::Acquire() {
  for (;;) {
    {
      std::unique_lock lock(mutex_);

      if (!idle_.empty()) {
        auto conn = std::move(idle_.back());
        idle_.pop_back();
        return Wrap(conn.release());
      }

      if (live_connections_ < max_connections_) {
        ++live_connections_;
        lock.unlock();

        try {
          return Wrap(new SqliteDB(path_, options_));
        } catch (...) {
          std::lock_guard rollback_lock(mutex_);
          --live_connections_;
          cv_.notify_one();
          throw;
        }
      }

      cv_.wait(lock, [this] {
        return !idle_.empty() || live_connections_ < max_connections_;
      });
    }
  }
}

std::shared_ptr<SqliteDB> SqliteConnectionPool::Wrap(SqliteDB* conn) {
  std::weak_ptr<SqliteConnectionPool> weak_self = weak_from_this();
  return std::shared_ptr<SqliteDB>(conn, [weak_self](SqliteDB* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void SqliteConnectionPool::Release(SqliteDB* conn) {
  {
    std::lock_guard lock(mutex_);
    idle_.emplace_back(conn);
  }
  cv_.notify_one();
}

} // namespace healthstore::db::sqlite
