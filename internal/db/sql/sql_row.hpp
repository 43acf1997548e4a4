#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "internal/db/sql/sql_params.hpp"

namespace healthstore::db::sql {

/*
  Generic row reader.

  Backends wrap their result row:
    sqlite -> sqlite3_stmt
    memory -> RowSnapshot

  Prevents driver types leaking into storage helpers.
*/

class Row {
public:
  virtual ~Row() = default;

  virtual int ColumnCount() const = 0;
  virtual std::string ColumnName(int col) const = 0;

  // Throws std::out_of_range if the row has no such column.
  virtual int ColumnIndex(std::string_view name) const = 0;

  virtual std::string GetText(int col) const = 0;
  virtual int GetInt(int col) const = 0;
  virtual int64_t GetInt64(int col) const = 0;
  virtual double GetDouble(int col) const = 0;
  virtual Blob GetBlob(int col) const = 0;
  virtual bool IsNull(int col) const = 0;

  // Column value with its storage class.
  virtual Param GetValue(int col) const = 0;
};

/*
  Forward-only result set. A fresh cursor is positioned before the
  first row.
*/
class Cursor : public Row {
public:
  virtual bool MoveToNext() = 0;
};

}
