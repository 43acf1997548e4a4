#include "change_logs_request_helper.hpp"

#include "internal/storage/utils/storage_utils.hpp"
#include "internal/util/errors.hpp"

namespace healthstore::storage {

ChangeLogsRequestHelper::ChangeLogsRequestHelper(std::shared_ptr<TransactionManager> transactions, std::shared_ptr<ChangeLogsHelper> change_logs)
    : transactions_(std::move(transactions)), change_logs_(std::move(change_logs)) {
}

CreateTableRequest ChangeLogsRequestHelper::GetCreateTableRequest() const {
  return CreateTableRequest(std::string(kTableName), {
                                                         {std::string(kPrimaryColumnName), kPrimaryAutoincrement},
                                                         {std::string(kPackagesToFilterColumnName), kTextNotNull},
                                                         {std::string(kPackageNameColumnName), kTextNotNull},
                                                         {std::string(kRecordTypesColumnName), kTextNotNull},
                                                         {std::string(kRowIdChangeLogsColumnName), kIntegerNotNull},
                                                     });
}

std::int64_t ChangeLogsRequestHelper::GetToken(db::Transaction& tx, const std::string& package_name,
                                               const model::ChangeLogTokenRequest& request) const {
  for (const auto id : request.record_types) {
    if (!model::RecordTypeFromId(id)) {
      throw util::ValidationError("unknown record type " + std::to_string(id) + " in change log token request");
    }
  }

  model::TokenRequest token;
  token.package_names_to_filter = request.package_names_to_filter;
  token.record_types            = request.record_types;
  token.requesting_package_name = package_name;
  token.row_id_change_logs      = change_logs_->GetLatestRowId(tx);
  return Insert(tx, token);
}

std::int64_t ChangeLogsRequestHelper::GetNextPageToken(db::Transaction& tx, const model::TokenRequest& request,
                                                       std::int64_t row_id_change_logs) const {
  auto next               = request;
  next.row_id_change_logs = row_id_change_logs;
  return Insert(tx, next);
}

std::int64_t ChangeLogsRequestHelper::Insert(db::Transaction& tx, const model::TokenRequest& request) const {
  ContentValues values;
  values.Put(std::string(kPackagesToFilterColumnName), EncodeStringList(request.package_names_to_filter));
  values.Put(std::string(kPackageNameColumnName), request.requesting_package_name);
  values.Put(std::string(kRecordTypesColumnName), EncodeIntList(request.record_types));
  values.Put(std::string(kRowIdChangeLogsColumnName), request.row_id_change_logs);

  std::int64_t token = 0;
  ThrowIfError(transactions_->Insert(tx, UpsertTableRequest(std::string(kTableName), std::move(values)), &token), "insert change log request");
  return token;
}

model::TokenRequest ChangeLogsRequestHelper::GetRequest(db::Transaction& tx, std::int64_t token) const {
  WhereClauses where;
  where.AddWhereEqualsClause(std::string(kPrimaryColumnName), token);

  ReadTableRequest read{std::string(kTableName)};
  read.SetWhereClause(std::move(where));

  auto cursor = transactions_->Read(tx, read);
  if (!cursor->MoveToNext()) {
    throw util::NotFound("change log token " + std::to_string(token) + " not found");
  }

  model::TokenRequest request;
  request.package_names_to_filter = DecodeStringList(GetCursorString(*cursor, kPackagesToFilterColumnName));
  request.requesting_package_name = GetCursorString(*cursor, kPackageNameColumnName);
  request.record_types            = DecodeIntList(GetCursorString(*cursor, kRecordTypesColumnName));
  request.row_id_change_logs      = GetCursorLong(*cursor, kRowIdChangeLogsColumnName);
  return request;
}

} // namespace healthstore::storage
