#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <type_traits>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/sql/sql_row.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_pool.hpp"
#include "internal/storage/request/create_table_request.hpp"
#include "internal/storage/request/delete_table_request.hpp"
#include "internal/storage/request/read_table_request.hpp"
#include "internal/storage/request/upsert_table_request.hpp"

namespace healthstore::storage {

/*
  Owns the physical connections and every transaction boundary.

  Writes go through a single writer connection; the writer mutex is
  held for the whole write transaction, so write transactions are
  mutually exclusive across threads. Reads run on pooled read-only
  connections and only see committed state.

  Helpers never open transactions themselves: they receive the
  caller's transaction. Calling RunAsTransaction from inside a write
  transaction on the same thread deadlocks.
*/
class TransactionManager {
 public:
  TransactionManager(std::shared_ptr<db::sqlite::SqliteDB> writer, std::shared_ptr<db::sqlite::SqliteConnectionPool> readers);

  static std::shared_ptr<TransactionManager> Open(const std::string& path, db::sqlite::SqliteOptions options, std::size_t max_readers);

  std::unique_ptr<db::Transaction> BeginWrite();
  std::unique_ptr<db::Transaction> BeginRead();

  // Commits when fn returns, rolls back when it throws.
  template <typename Fn>
  auto RunAsTransaction(Fn&& fn) -> std::invoke_result_t<Fn&, db::Transaction&> {
    return Run(BeginWrite(), fn);
  }

  template <typename Fn>
  auto RunAsReadTransaction(Fn&& fn) -> std::invoke_result_t<Fn&, db::Transaction&> {
    return Run(BeginRead(), fn);
  }

  void CreateTable(db::Transaction& tx, const CreateTableRequest& request);

  // Inserts the row and then its child rows. row_id receives the parent's row id.
  db::Result Insert(db::Transaction& tx, const UpsertTableRequest& request, int64_t* row_id = nullptr);

  db::Result Update(db::Transaction& tx, const std::string& table, const ContentValues& values, const WhereClauses& where,
                    int* changes = nullptr);

  db::Result Delete(db::Transaction& tx, const DeleteTableRequest& request, int* deleted = nullptr);

  // The cursor must not outlive tx.
  std::unique_ptr<db::sql::Cursor> Read(db::Transaction& tx, const ReadTableRequest& request);
  std::unique_ptr<db::sql::Cursor> RawQuery(db::Transaction& tx, const std::string& sql, const db::sql::Params& params = {});

  int64_t Count(db::Transaction& tx, const ReadTableRequest& request);

 private:
  template <typename Fn>
  static auto Run(std::unique_ptr<db::Transaction> tx, Fn& fn) -> std::invoke_result_t<Fn&, db::Transaction&> {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn&, db::Transaction&>>) {
      fn(*tx);
      tx->Commit();
    } else {
      auto result = fn(*tx);
      tx->Commit();
      return result;
    }
  }

  static sqlite3* Handle(db::Transaction& tx);

  std::shared_ptr<db::sqlite::SqliteDB>             writer_;
  std::shared_ptr<db::sqlite::SqliteConnectionPool> readers_;
  std::mutex                                        writer_mutex_;
};

} // namespace healthstore::storage
