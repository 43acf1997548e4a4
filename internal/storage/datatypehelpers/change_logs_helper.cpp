#include "change_logs_helper.hpp"

#include "internal/storage/utils/storage_utils.hpp"
#include "internal/util/errors.hpp"

namespace healthstore::storage {

ChangeLogsHelper::ChangeLogsHelper(std::shared_ptr<TransactionManager> transactions) : transactions_(std::move(transactions)) {
}

CreateTableRequest ChangeLogsHelper::GetCreateTableRequest() const {
  CreateTableRequest request(std::string(kTableName), {
                                                          {std::string(kPrimaryColumnName), kPrimaryAutoincrement},
                                                          {std::string(kRecordTypeColumnName), kIntegerNotNull},
                                                          {std::string(kAppIdColumnName), kIntegerNotNull},
                                                          {std::string(kUuidsColumnName), kTextNotNull},
                                                          {std::string(kOperationTypeColumnName), kIntegerNotNull},
                                                          {std::string(kTimeColumnName), kIntegerNotNull},
                                                      });
  request.CreateIndexOn(std::string(kRecordTypeColumnName));
  request.CreateIndexOn(std::string(kAppIdColumnName));
  return request;
}

void ChangeLogsHelper::Append(db::Transaction& tx, model::OperationType operation, model::RecordType record_type, std::int64_t app_id,
                              const std::vector<std::string>& uuids, std::int64_t time_ms) const {
  if (uuids.empty()) {
    return;
  }

  ContentValues values;
  values.Put(std::string(kRecordTypeColumnName), model::ToId(record_type));
  values.Put(std::string(kAppIdColumnName), app_id);
  values.Put(std::string(kUuidsColumnName), EncodeStringList(uuids));
  values.Put(std::string(kOperationTypeColumnName), static_cast<std::int32_t>(operation));
  values.Put(std::string(kTimeColumnName), time_ms);
  ThrowIfError(transactions_->Insert(tx, UpsertTableRequest(std::string(kTableName), std::move(values))), "append change log");
}

std::int64_t ChangeLogsHelper::GetLatestRowId(db::Transaction& tx) const {
  auto cursor = transactions_->RawQuery(tx, "SELECT MAX(" + std::string(kPrimaryColumnName) + ") AS latest FROM " + std::string(kTableName));
  if (!cursor->MoveToNext() || IsNullValue(*cursor, "latest")) {
    return kNoChangeLogs;
  }
  return GetCursorLong(*cursor, "latest");
}

ChangeLogsPage ChangeLogsHelper::GetChangeLogs(db::Transaction& tx, const model::TokenRequest& request,
                                               const std::optional<std::vector<std::int64_t>>& app_ids, int page_size) const {
  if (page_size <= 0) {
    throw util::ValidationError("change logs page size must be positive");
  }

  WhereClauses where;
  where.AddWhereGreaterThanClause(std::string(kPrimaryColumnName), request.row_id_change_logs);
  if (!request.record_types.empty()) {
    std::vector<std::int64_t> types(request.record_types.begin(), request.record_types.end());
    where.AddWhereInIntsClause(std::string(kRecordTypeColumnName), types);
  }
  if (app_ids) {
    where.AddWhereInIntsClause(std::string(kAppIdColumnName), *app_ids);
  }

  ReadTableRequest read{std::string(kTableName)};
  read.SetWhereClause(std::move(where)).SetOrderBy({std::string(kPrimaryColumnName) + " ASC"}).SetLimit(page_size + 1);

  ChangeLogsPage page;
  auto           cursor = transactions_->Read(tx, read);
  while (cursor->MoveToNext()) {
    if (static_cast<int>(page.entries.size()) == page_size) {
      page.has_more = true;
      break;
    }

    const auto type_id = GetCursorInt(*cursor, kRecordTypeColumnName);
    const auto type    = model::RecordTypeFromId(type_id);
    if (!type) {
      throw util::InternalError("change log references unknown record type " + std::to_string(type_id));
    }

    const auto operation = GetCursorInt(*cursor, kOperationTypeColumnName);
    if (operation < 0 || operation > static_cast<int>(model::OperationType::kDelete)) {
      throw util::InternalError("change log has unknown operation " + std::to_string(operation));
    }

    model::ChangeLogEntry entry;
    entry.row_id      = GetCursorLong(*cursor, kPrimaryColumnName);
    entry.operation   = static_cast<model::OperationType>(operation);
    entry.record_type = *type;
    entry.app_id      = GetCursorLong(*cursor, kAppIdColumnName);
    entry.uuids       = DecodeStringList(GetCursorString(*cursor, kUuidsColumnName));
    entry.time_ms     = GetCursorLong(*cursor, kTimeColumnName);
    page.entries.push_back(std::move(entry));
  }
  return page;
}

} // namespace healthstore::storage
