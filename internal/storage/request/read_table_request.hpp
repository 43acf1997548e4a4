#pragma once

#include <optional>
#include <string>
#include <vector>

#include "internal/db/sql/sql_params.hpp"
#include "internal/storage/request/where_clauses.hpp"

namespace healthstore::storage {

// LEFT JOIN <table> ON <main>.<self_column> = <table>.<table_column>
struct JoinClause {
  std::string table;
  std::string self_column;
  std::string table_column;
};

class ReadTableRequest {
 public:
  explicit ReadTableRequest(std::string table_name);

  ReadTableRequest& SetColumnNames(std::vector<std::string> columns);
  ReadTableRequest& SetWhereClause(WhereClauses where);
  ReadTableRequest& SetJoinClause(JoinClause join);
  ReadTableRequest& SetOrderBy(std::vector<std::string> terms);
  ReadTableRequest& SetLimit(int limit);

  const std::string& GetTableName() const {
    return table_name_;
  }

  std::string GetReadCommand() const;

  const db::sql::Params& GetParams() const {
    return where_.GetParams();
  }

 private:
  std::string               table_name_;
  std::vector<std::string>  columns_;
  WhereClauses              where_;
  std::optional<JoinClause> join_;
  std::vector<std::string>  order_by_;
  std::optional<int>        limit_;
};

} // namespace healthstore::storage
