#include "preference_helper.hpp"

#include "internal/storage/utils/storage_utils.hpp"

namespace healthstore::storage {

PreferenceHelper::PreferenceHelper(std::shared_ptr<TransactionManager> transactions) : transactions_(std::move(transactions)) {
}

CreateTableRequest PreferenceHelper::GetCreateTableRequest() const {
  return CreateTableRequest(std::string(kTableName), {
                                                         {std::string(kKeyColumnName), "TEXT PRIMARY KEY"},
                                                         {std::string(kValueColumnName), kTextNull},
                                                     });
}

void PreferenceHelper::InsertOrReplacePreference(db::Transaction& tx, std::string_view key, const std::string& value) const {
  ContentValues values;
  values.Put(std::string(kKeyColumnName), std::string(key));
  values.Put(std::string(kValueColumnName), value);

  UpsertTableRequest request(std::string(kTableName), std::move(values));
  request.SetConflict({std::string(kKeyColumnName)}, ConflictPolicy::kReplace);
  ThrowIfError(transactions_->Insert(tx, request), "set preference " + std::string(key));
}

std::optional<std::string> PreferenceHelper::GetPreference(db::Transaction& tx, std::string_view key) const {
  WhereClauses where;
  where.AddWhereEqualsClause(std::string(kKeyColumnName), std::string(key));

  ReadTableRequest request{std::string(kTableName)};
  request.SetWhereClause(std::move(where));

  auto cursor = transactions_->Read(tx, request);
  if (!cursor->MoveToNext()) {
    return std::nullopt;
  }
  return GetCursorString(*cursor, kValueColumnName);
}

} // namespace healthstore::storage
