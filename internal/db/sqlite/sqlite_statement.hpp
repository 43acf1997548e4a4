#pragma once

#include <sqlite3.h>

#include <string>
#include <unordered_map>

#include "internal/db/api/result.hpp"
#include "internal/db/sql/sql_row.hpp"

namespace healthstore::db::sqlite {

/*
  Prepared statement + cursor over its result rows.

  Lives no longer than the transaction it was prepared in.
*/
class SqliteStatement final : public sql::Cursor {
 public:
  SqliteStatement(sqlite3* db, const std::string& sql);
  ~SqliteStatement();

  SqliteStatement(const SqliteStatement&)            = delete;
  SqliteStatement& operator=(const SqliteStatement&) = delete;

  // 1-based, like sqlite3_bind_*
  void Bind(int index, const sql::Param& param);
  void BindAll(const sql::Params& params);

  // Steps until SQLITE_DONE, for statements without result rows.
  Result Execute();

  bool MoveToNext() override;

  int64_t LastInsertRowId() const;
  int     Changes() const;

  int         ColumnCount() const override;
  std::string ColumnName(int col) const override;
  int         ColumnIndex(std::string_view name) const override;

  std::string GetText(int col) const override;
  int         GetInt(int col) const override;
  int64_t     GetInt64(int col) const override;
  double      GetDouble(int col) const override;
  sql::Blob   GetBlob(int col) const override;
  bool        IsNull(int col) const override;
  sql::Param  GetValue(int col) const override;

  static Result Translate(sqlite3* db, int rc);

 private:
  sqlite3*                             db_   = nullptr;
  sqlite3_stmt*                        stmt_ = nullptr;
  std::string                          sql_;
  std::unordered_map<std::string, int> columns_;
  bool                                 done_ = false;
};

} // namespace healthstore::db::sqlite
