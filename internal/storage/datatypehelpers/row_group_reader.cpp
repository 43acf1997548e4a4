#include "row_group_reader.hpp"

namespace healthstore::storage {

RowGroupReader::RowGroupReader(db::sql::Cursor& cursor, std::string key_column) : cursor_(cursor), key_column_(std::move(key_column)) {
}

std::optional<RowGroup> RowGroupReader::Next() {
  if (!lookahead_) {
    if (exhausted_ || !cursor_.MoveToNext()) {
      exhausted_ = true;
      return std::nullopt;
    }
    lookahead_ = db::sql::RowSnapshot::Capture(cursor_);
  }

  RowGroup group;
  group.key = lookahead_->GetText(lookahead_->ColumnIndex(key_column_));
  group.rows.push_back(std::move(*lookahead_));
  lookahead_.reset();

  while (cursor_.MoveToNext()) {
    auto row = db::sql::RowSnapshot::Capture(cursor_);
    if (row.GetText(row.ColumnIndex(key_column_)) != group.key) {
      lookahead_ = std::move(row);
      return group;
    }
    group.rows.push_back(std::move(row));
  }

  exhausted_ = true;
  return group;
}

} // namespace healthstore::storage
