#include "create_table_request.hpp"

#include "internal/util/errors.hpp"

namespace healthstore::storage {
namespace {

std::string Join(const std::vector<std::string>& values) {
  std::string out;
  for (std::size_t i = 0; i < values.size(); ++i) {
    if (i > 0) out += ", ";
    out += values[i];
  }
  return out;
}

} // namespace

CreateTableRequest::CreateTableRequest(std::string table_name, std::vector<ColumnInfo> columns)
    : table_name_(std::move(table_name)), columns_(std::move(columns)) {
  if (table_name_.empty() || columns_.empty()) {
    throw util::InternalError("create table request needs a name and at least one column");
  }
}

CreateTableRequest& CreateTableRequest::AddForeignKey(ForeignKey foreign_key) {
  foreign_keys_.push_back(std::move(foreign_key));
  return *this;
}

CreateTableRequest& CreateTableRequest::AddUniqueColumns(std::vector<std::string> columns) {
  unique_columns_.push_back(std::move(columns));
  return *this;
}

CreateTableRequest& CreateTableRequest::CreateIndexOn(std::string column) {
  indexed_columns_.push_back(std::move(column));
  return *this;
}

CreateTableRequest& CreateTableRequest::SetChildTableRequests(std::vector<CreateTableRequest> child_requests) {
  child_requests_ = std::move(child_requests);
  return *this;
}

std::string CreateTableRequest::GetCreateCommand() const {
  std::string sql = "CREATE TABLE IF NOT EXISTS " + table_name_ + " (";
  for (std::size_t i = 0; i < columns_.size(); ++i) {
    if (i > 0) sql += ", ";
    sql += columns_[i].name + " " + columns_[i].type;
  }

  for (const auto& unique : unique_columns_) {
    sql += ", UNIQUE (" + Join(unique) + ")";
  }

  for (const auto& fk : foreign_keys_) {
    sql += ", FOREIGN KEY (" + fk.column + ") REFERENCES " + fk.referenced_table + "(" + fk.referenced_column + ")";
    if (fk.cascade_delete) {
      sql += " ON DELETE CASCADE";
    }
  }

  sql += ")";
  return sql;
}

std::vector<std::string> CreateTableRequest::GetCreateIndexStatements() const {
  std::vector<std::string> statements;
  statements.reserve(indexed_columns_.size());
  for (const auto& column : indexed_columns_) {
    statements.push_back("CREATE INDEX IF NOT EXISTS idx_" + table_name_ + "_" + column + " ON " + table_name_ + "(" + column + ")");
  }
  return statements;
}

} // namespace healthstore::storage
