#include "upsert_table_request.hpp"

#include <algorithm>

#include "internal/util/errors.hpp"

namespace healthstore::storage {

UpsertTableRequest::UpsertTableRequest(std::string table_name, ContentValues values)
    : table_name_(std::move(table_name)), values_(std::move(values)) {
  if (values_.Empty()) {
    throw util::InternalError("upsert into " + table_name_ + " without values");
  }
}

UpsertTableRequest& UpsertTableRequest::SetConflict(std::vector<std::string> unique_columns, ConflictPolicy policy) {
  conflict_columns_ = std::move(unique_columns);
  policy_           = policy;
  return *this;
}

UpsertTableRequest& UpsertTableRequest::SetChildTableRequests(std::vector<UpsertTableRequest> child_requests) {
  child_requests_ = std::move(child_requests);
  return *this;
}

std::string UpsertTableRequest::GetInsertCommand() const {
  std::string columns;
  std::string placeholders;
  for (const auto& [column, value] : values_.Entries()) {
    if (!columns.empty()) {
      columns += ", ";
      placeholders += ", ";
    }
    columns += column;
    placeholders += "?";
  }

  std::string sql = "INSERT INTO " + table_name_ + " (" + columns + ") VALUES (" + placeholders + ")";
  if (policy_ == ConflictPolicy::kAbort || conflict_columns_.empty()) {
    return sql;
  }

  std::string target;
  for (const auto& column : conflict_columns_) {
    if (!target.empty()) target += ", ";
    target += column;
  }
  sql += " ON CONFLICT (" + target + ")";

  std::string updates;
  if (policy_ == ConflictPolicy::kReplace) {
    for (const auto& [column, value] : values_.Entries()) {
      if (std::find(conflict_columns_.begin(), conflict_columns_.end(), column) != conflict_columns_.end()) {
        continue;
      }
      if (!updates.empty()) updates += ", ";
      updates += column + " = excluded." + column;
    }
  }

  sql += updates.empty() ? " DO NOTHING" : " DO UPDATE SET " + updates;
  return sql;
}

db::sql::Params UpsertTableRequest::GetParams() const {
  db::sql::Params params;
  params.reserve(values_.Entries().size());
  for (const auto& [column, value] : values_.Entries()) {
    params.push_back(value);
  }
  return params;
}

} // namespace healthstore::storage
