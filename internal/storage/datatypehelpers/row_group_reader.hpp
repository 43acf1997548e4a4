#pragma once

#include <optional>
#include <string>
#include <vector>

#include "internal/db/sql/row_snapshot.hpp"
#include "internal/db/sql/sql_row.hpp"

namespace healthstore::storage {

struct RowGroup {
  std::string                       key;
  std::vector<db::sql::RowSnapshot> rows;  // never empty
};

/*
  Splits a cursor sorted by key into consecutive groups of rows that
  share the key. Groups are produced lazily, one per Next() call;
  the cursor is only advanced, never moved back.
*/
class RowGroupReader {
 public:
  RowGroupReader(db::sql::Cursor& cursor, std::string key_column);

  std::optional<RowGroup> Next();

 private:
  db::sql::Cursor&                    cursor_;
  std::string                         key_column_;
  std::optional<db::sql::RowSnapshot> lookahead_;
  bool                                exhausted_ = false;
};

} // namespace healthstore::storage
