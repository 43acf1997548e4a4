#include "transaction_manager.hpp"

#include "internal/db/sqlite/sqlite_statement.hpp"
#include "internal/db/sqlite/sqlite_tx.hpp"
#include "internal/util/errors.hpp"

namespace healthstore::storage {

using db::ErrorCode;
using db::Result;
using db::sqlite::SqliteStatement;
using db::sqlite::SqliteTransaction;

TransactionManager::TransactionManager(std::shared_ptr<db::sqlite::SqliteDB> writer, std::shared_ptr<db::sqlite::SqliteConnectionPool> readers)
    : writer_(std::move(writer)), readers_(std::move(readers)) {
}

std::shared_ptr<TransactionManager> TransactionManager::Open(const std::string& path, db::sqlite::SqliteOptions options, std::size_t max_readers) {
  options.read_only = false;
  auto writer       = std::make_shared<db::sqlite::SqliteDB>(path, options);
  auto readers      = std::make_shared<db::sqlite::SqliteConnectionPool>(path, options, max_readers);
  return std::make_shared<TransactionManager>(std::move(writer), std::move(readers));
}

std::unique_ptr<db::Transaction> TransactionManager::BeginWrite() {
  std::unique_lock<std::mutex> lock(writer_mutex_);
  return std::make_unique<SqliteTransaction>(writer_, db::sqlite::TransactionMode::kImmediate, std::move(lock));
}

std::unique_ptr<db::Transaction> TransactionManager::BeginRead() {
  return std::make_unique<SqliteTransaction>(readers_->Acquire(), db::sqlite::TransactionMode::kDeferred);
}

sqlite3* TransactionManager::Handle(db::Transaction& tx) {
  auto* sqlite_tx = dynamic_cast<SqliteTransaction*>(&tx);
  if (!sqlite_tx) {
    throw util::InternalError("transaction was not opened by the sqlite transaction manager");
  }
  return sqlite_tx->Handle();
}

void TransactionManager::CreateTable(db::Transaction& tx, const CreateTableRequest& request) {
  auto* db = Handle(tx);

  SqliteStatement create(db, request.GetCreateCommand());
  if (auto result = create.Execute(); !result) {
    throw util::InternalError("create table " + request.GetTableName() + ": " + result.message);
  }

  for (const auto& index : request.GetCreateIndexStatements()) {
    SqliteStatement statement(db, index);
    if (auto result = statement.Execute(); !result) {
      throw util::InternalError("create index on " + request.GetTableName() + ": " + result.message);
    }
  }

  for (const auto& child : request.GetChildTableRequests()) {
    CreateTable(tx, child);
  }
}

Result TransactionManager::Insert(db::Transaction& tx, const UpsertTableRequest& request, int64_t* row_id) {
  auto* db = Handle(tx);

  SqliteStatement statement(db, request.GetInsertCommand());
  statement.BindAll(request.GetParams());
  if (auto result = statement.Execute(); !result) {
    return result;
  }

  if (row_id) {
    *row_id = statement.LastInsertRowId();
  }

  for (const auto& child : request.GetChildTableRequests()) {
    if (auto result = Insert(tx, child); !result) {
      return result;
    }
  }
  return Result::Ok();
}

Result TransactionManager::Update(db::Transaction& tx, const std::string& table, const ContentValues& values, const WhereClauses& where,
                                  int* changes) {
  if (values.Empty()) {
    return Result::Err(ErrorCode::InternalError, "update " + table + " without values");
  }

  std::string     sql = "UPDATE " + table + " SET ";
  db::sql::Params params;
  bool            first = true;
  for (const auto& [column, value] : values.Entries()) {
    if (!first) sql += ", ";
    first = false;
    sql += column + " = ?";
    params.push_back(value);
  }
  sql += where.Get(true);
  params.insert(params.end(), where.GetParams().begin(), where.GetParams().end());

  SqliteStatement statement(Handle(tx), sql);
  statement.BindAll(params);
  auto result = statement.Execute();
  if (result && changes) {
    *changes = statement.Changes();
  }
  return result;
}

Result TransactionManager::Delete(db::Transaction& tx, const DeleteTableRequest& request, int* deleted) {
  SqliteStatement statement(Handle(tx), request.GetDeleteCommand());
  statement.BindAll(request.GetParams());
  auto result = statement.Execute();
  if (result && deleted) {
    *deleted = statement.Changes();
  }
  return result;
}

std::unique_ptr<db::sql::Cursor> TransactionManager::Read(db::Transaction& tx, const ReadTableRequest& request) {
  return RawQuery(tx, request.GetReadCommand(), request.GetParams());
}

std::unique_ptr<db::sql::Cursor> TransactionManager::RawQuery(db::Transaction& tx, const std::string& sql, const db::sql::Params& params) {
  auto statement = std::make_unique<SqliteStatement>(Handle(tx), sql);
  statement->BindAll(params);
  return statement;
}

int64_t TransactionManager::Count(db::Transaction& tx, const ReadTableRequest& request) {
  auto cursor = RawQuery(tx, "SELECT COUNT(*) FROM (" + request.GetReadCommand() + ")", request.GetParams());
  if (!cursor->MoveToNext()) {
    throw util::InternalError("count on " + request.GetTableName() + " returned no rows");
  }
  return cursor->GetInt64(0);
}

} // namespace healthstore::storage
