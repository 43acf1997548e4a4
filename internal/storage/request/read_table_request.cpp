#include "read_table_request.hpp"

namespace healthstore::storage {

ReadTableRequest::ReadTableRequest(std::string table_name) : table_name_(std::move(table_name)) {
}

ReadTableRequest& ReadTableRequest::SetColumnNames(std::vector<std::string> columns) {
  columns_ = std::move(columns);
  return *this;
}

ReadTableRequest& ReadTableRequest::SetWhereClause(WhereClauses where) {
  where_ = std::move(where);
  return *this;
}

ReadTableRequest& ReadTableRequest::SetJoinClause(JoinClause join) {
  join_ = std::move(join);
  return *this;
}

ReadTableRequest& ReadTableRequest::SetOrderBy(std::vector<std::string> terms) {
  order_by_ = std::move(terms);
  return *this;
}

ReadTableRequest& ReadTableRequest::SetLimit(int limit) {
  limit_ = limit;
  return *this;
}

std::string ReadTableRequest::GetReadCommand() const {
  std::string sql = "SELECT ";
  if (columns_.empty()) {
    sql += join_ ? table_name_ + ".*" : "*";
  } else {
    for (std::size_t i = 0; i < columns_.size(); ++i) {
      if (i > 0) sql += ", ";
      sql += columns_[i];
    }
  }

  sql += " FROM " + table_name_;
  if (join_) {
    sql += " LEFT JOIN " + join_->table + " ON " + table_name_ + "." + join_->self_column + " = " + join_->table + "." + join_->table_column;
  }

  sql += where_.Get(true);

  if (!order_by_.empty()) {
    sql += " ORDER BY ";
    for (std::size_t i = 0; i < order_by_.size(); ++i) {
      if (i > 0) sql += ", ";
      sql += order_by_[i];
    }
  }

  if (limit_) {
    sql += " LIMIT " + std::to_string(*limit_);
  }
  return sql;
}

} // namespace healthstore::storage
