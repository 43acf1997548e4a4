#include "sqlite_tx.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace healthstore::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db, TransactionMode mode, std::unique_lock<std::mutex> writer_lock)
    : writer_lock_(std::move(writer_lock)), db_(std::move(db)) {
  db_->Exec(mode == TransactionMode::kImmediate ? "BEGIN IMMEDIATE;" : "BEGIN DEFERRED;");
}

SqliteTransaction::~SqliteTransaction() {
  if (!finished_) {
    try {
      db_->Exec("ROLLBACK;");
    } catch (const std::exception& e) {
      HEALTHSTORE_LOG_WARN("sqlite rollback failed", {observability::StringField("error", e.what())});
    }
  }
}

void SqliteTransaction::EnsureOpen(const char* op) const {
  if (finished_) {
    throw std::logic_error(std::string("sqlite transaction already finished: ") + op);
  }
}

void SqliteTransaction::Commit() {
  EnsureOpen("commit");
  db_->Exec("COMMIT;");
  committed_ = true;
  finished_  = true;
}

void SqliteTransaction::Rollback() {
  EnsureOpen("rollback");
  finished_ = true;
  db_->Exec("ROLLBACK;");
}

void SqliteTransaction::Savepoint(const std::string& name) {
  EnsureOpen("savepoint");
  db_->Exec("SAVEPOINT " + name + ";");
}

void SqliteTransaction::ReleaseSavepoint(const std::string& name) {
  EnsureOpen("release savepoint");
  db_->Exec("RELEASE SAVEPOINT " + name + ";");
}

void SqliteTransaction::RollbackToSavepoint(const std::string& name) {
  EnsureOpen("rollback to savepoint");
  // ROLLBACK TO keeps the savepoint open; release it to pop it off the stack
  db_->Exec("ROLLBACK TO SAVEPOINT " + name + ";");
  db_->Exec("RELEASE SAVEPOINT " + name + ";");
}

} // namespace healthstore::db::sqlite
