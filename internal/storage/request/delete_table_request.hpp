#pragma once

#include <string>

#include "internal/storage/request/where_clauses.hpp"

namespace healthstore::storage {

class DeleteTableRequest {
 public:
  DeleteTableRequest(std::string table_name, WhereClauses where)
      : table_name_(std::move(table_name)), where_(std::move(where)) {
  }

  const std::string& GetTableName() const {
    return table_name_;
  }

  std::string GetDeleteCommand() const {
    return "DELETE FROM " + table_name_ + where_.Get(true);
  }

  const db::sql::Params& GetParams() const {
    return where_.GetParams();
  }

 private:
  std::string  table_name_;
  WhereClauses where_;
};

} // namespace healthstore::storage
