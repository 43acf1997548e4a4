#pragma once

#include <string>
#include <vector>

#include "internal/db/sql/sql_params.hpp"
#include "internal/storage/request/content_values.hpp"

namespace healthstore::storage {

enum class ConflictPolicy {
  kAbort,    // plain INSERT
  kReplace,  // ON CONFLICT DO UPDATE, keeps the existing row id
  kIgnore,   // ON CONFLICT DO NOTHING
};

/*
  Insert of one row plus optional child rows, written after the
  parent inside the same transaction.
*/
class UpsertTableRequest {
 public:
  UpsertTableRequest(std::string table_name, ContentValues values);

  UpsertTableRequest& SetConflict(std::vector<std::string> unique_columns, ConflictPolicy policy);
  UpsertTableRequest& SetChildTableRequests(std::vector<UpsertTableRequest> child_requests);

  const std::string& GetTableName() const {
    return table_name_;
  }

  const std::vector<UpsertTableRequest>& GetChildTableRequests() const {
    return child_requests_;
  }

  std::string     GetInsertCommand() const;
  db::sql::Params GetParams() const;

 private:
  std::string                     table_name_;
  ContentValues                   values_;
  std::vector<std::string>        conflict_columns_;
  ConflictPolicy                  policy_ = ConflictPolicy::kAbort;
  std::vector<UpsertTableRequest> child_requests_;
};

} // namespace healthstore::storage
