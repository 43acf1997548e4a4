#pragma once

#include <memory>
#include <mutex>
#include <string>

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace healthstore::db::sqlite {

enum class TransactionMode {
  kImmediate,
  kDeferred,
};

/*
  SQLite transaction wrapper.

  Writers use BEGIN IMMEDIATE:
    - grabs write lock early
    - avoids deadlock-y behavior later
  and hold the process-wide writer mutex until the transaction ends.

  Readers use BEGIN DEFERRED on a pooled read-only connection.
*/
class SqliteTransaction final : public db::Transaction {
public:
  explicit SqliteTransaction(std::shared_ptr<SqliteDB> db, TransactionMode mode = TransactionMode::kImmediate,
                             std::unique_lock<std::mutex> writer_lock = {});
  ~SqliteTransaction();

  sqlite3* Handle() const { return db_->Handle(); }

  void Commit() override;
  void Rollback() override;

  void Savepoint(const std::string& name) override;
  void ReleaseSavepoint(const std::string& name) override;
  void RollbackToSavepoint(const std::string& name) override;

private:
  void EnsureOpen(const char* op) const;

  // released last, after the destructor rolled back
  std::unique_lock<std::mutex> writer_lock_;
  std::shared_ptr<SqliteDB> db_;
  bool committed_ = false;
  bool finished_ = false;
};

}
