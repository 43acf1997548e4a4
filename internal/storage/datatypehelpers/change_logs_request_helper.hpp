#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "internal/db/api/transaction.hpp"
#include "internal/model/change_log.hpp"
#include "internal/storage/datatypehelpers/change_logs_helper.hpp"
#include "internal/storage/transaction_manager.hpp"

namespace healthstore::storage {

/*
  Change-log tokens. A token is the row id of a stored request: the
  caller's filters plus the change-log row id it reads after. Rows
  are written once and never changed, so resolving a token is
  repeatable.

  Package filters are stored by name since a package may not have an
  app info row yet.
*/
class ChangeLogsRequestHelper {
 public:
  static constexpr std::string_view kTableName                  = "change_log_request_table";
  static constexpr std::string_view kPrimaryColumnName          = "row_id";
  static constexpr std::string_view kPackagesToFilterColumnName = "packages_to_filter";
  static constexpr std::string_view kPackageNameColumnName      = "package_name";
  static constexpr std::string_view kRecordTypesColumnName      = "record_types";
  static constexpr std::string_view kRowIdChangeLogsColumnName  = "row_id_change_logs_table";

  ChangeLogsRequestHelper(std::shared_ptr<TransactionManager> transactions, std::shared_ptr<ChangeLogsHelper> change_logs);

  CreateTableRequest GetCreateTableRequest() const;

  // Token positioned at the current end of the change log.
  std::int64_t GetToken(db::Transaction& tx, const std::string& package_name, const model::ChangeLogTokenRequest& request) const;

  // Token with the filters of request, positioned after row_id_change_logs.
  std::int64_t GetNextPageToken(db::Transaction& tx, const model::TokenRequest& request, std::int64_t row_id_change_logs) const;

  // Throws util::NotFound for a token that was never issued.
  model::TokenRequest GetRequest(db::Transaction& tx, std::int64_t token) const;

 private:
  std::int64_t Insert(db::Transaction& tx, const model::TokenRequest& request) const;

  std::shared_ptr<TransactionManager> transactions_;
  std::shared_ptr<ChangeLogsHelper>   change_logs_;
};

} // namespace healthstore::storage
