#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace healthstore::storage {

struct ColumnInfo {
  std::string name;
  std::string type;

  ColumnInfo(std::string column_name, std::string_view column_type) : name(std::move(column_name)), type(column_type) {
  }
};

struct ForeignKey {
  std::string column;
  std::string referenced_table;
  std::string referenced_column;
  bool        cascade_delete = true;
};

/*
  Table schema description. Child tables are created after their
  parent so their foreign keys resolve.
*/
class CreateTableRequest {
 public:
  CreateTableRequest(std::string table_name, std::vector<ColumnInfo> columns);

  CreateTableRequest& AddForeignKey(ForeignKey foreign_key);
  CreateTableRequest& AddUniqueColumns(std::vector<std::string> columns);
  CreateTableRequest& CreateIndexOn(std::string column);
  CreateTableRequest& SetChildTableRequests(std::vector<CreateTableRequest> child_requests);

  const std::string& GetTableName() const {
    return table_name_;
  }

  const std::vector<CreateTableRequest>& GetChildTableRequests() const {
    return child_requests_;
  }

  std::string              GetCreateCommand() const;
  std::vector<std::string> GetCreateIndexStatements() const;

 private:
  std::string                           table_name_;
  std::vector<ColumnInfo>               columns_;
  std::vector<ForeignKey>               foreign_keys_;
  std::vector<std::vector<std::string>> unique_columns_;
  std::vector<std::string>              indexed_columns_;
  std::vector<CreateTableRequest>       child_requests_;
};

} // namespace healthstore::storage
