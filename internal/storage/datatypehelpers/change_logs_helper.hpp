#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/transaction.hpp"
#include "internal/model/change_log.hpp"
#include "internal/storage/transaction_manager.hpp"

namespace healthstore::storage {

struct ChangeLogsPage {
  std::vector<model::ChangeLogEntry> entries;
  bool                               has_more = false;
};

/*
  Append-only ledger of record mutations. Entries are written in the
  transaction of the mutation they describe and never updated.
*/
class ChangeLogsHelper {
 public:
  static constexpr std::string_view kTableName               = "change_logs_table";
  static constexpr std::string_view kPrimaryColumnName       = "row_id";
  static constexpr std::string_view kRecordTypeColumnName    = "record_type";
  static constexpr std::string_view kAppIdColumnName         = "app_id";
  static constexpr std::string_view kUuidsColumnName         = "uuids";
  static constexpr std::string_view kOperationTypeColumnName = "operation_type";
  static constexpr std::string_view kTimeColumnName          = "time";

  // Returned by GetLatestRowId for an empty log.
  static constexpr std::int64_t kNoChangeLogs = -1;

  explicit ChangeLogsHelper(std::shared_ptr<TransactionManager> transactions);

  CreateTableRequest GetCreateTableRequest() const;

  void Append(db::Transaction& tx, model::OperationType operation, model::RecordType record_type, std::int64_t app_id,
              const std::vector<std::string>& uuids, std::int64_t time_ms) const;

  std::int64_t GetLatestRowId(db::Transaction& tx) const;

  /*
    Entries with row id after request.row_id_change_logs, ascending.
    Empty filters match everything; app_ids are the resolved package
    filter (nullopt: no package filter).
  */
  ChangeLogsPage GetChangeLogs(db::Transaction& tx, const model::TokenRequest& request, const std::optional<std::vector<std::int64_t>>& app_ids,
                               int page_size) const;

 private:
  std::shared_ptr<TransactionManager> transactions_;
};

} // namespace healthstore::storage
