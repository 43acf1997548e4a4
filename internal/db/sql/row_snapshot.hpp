#pragma once

#include <string>
#include <vector>

#include "internal/db/sql/sql_row.hpp"

namespace healthstore::db::sql {

/*
  Materialized copy of one row. Stays valid after the cursor it
  was captured from has moved on.
*/
class RowSnapshot final : public Row {
public:
  static RowSnapshot Capture(const Row& row);

  int ColumnCount() const override { return static_cast<int>(values_.size()); }
  std::string ColumnName(int col) const override;
  int ColumnIndex(std::string_view name) const override;

  std::string GetText(int col) const override;
  int GetInt(int col) const override;
  int64_t GetInt64(int col) const override;
  double GetDouble(int col) const override;
  Blob GetBlob(int col) const override;
  bool IsNull(int col) const override;
  Param GetValue(int col) const override;

private:
  const Param& At(int col) const;

  std::vector<std::string> names_;
  std::vector<Param> values_;
};

}
