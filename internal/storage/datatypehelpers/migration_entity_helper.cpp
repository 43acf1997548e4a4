#include "migration_entity_helper.hpp"

#include "internal/storage/utils/storage_utils.hpp"

namespace healthstore::storage {

MigrationEntityHelper::MigrationEntityHelper(std::shared_ptr<TransactionManager> transactions) : transactions_(std::move(transactions)) {
}

CreateTableRequest MigrationEntityHelper::GetCreateTableRequest() const {
  return CreateTableRequest(std::string(kTableName), {
                                                         {std::string(kPrimaryColumnName), kPrimaryAutoincrement},
                                                         {std::string(kEntityIdColumnName), kTextNotNullUnique},
                                                     });
}

bool MigrationEntityHelper::InsertEntity(db::Transaction& tx, const std::string& entity_id) const {
  ContentValues values;
  values.Put(std::string(kEntityIdColumnName), entity_id);

  auto result = transactions_->Insert(tx, UpsertTableRequest(std::string(kTableName), std::move(values)));
  if (result.code == db::ErrorCode::AlreadyExists) {
    return false;
  }
  ThrowIfError(result, "record migration entity " + entity_id);
  return true;
}

bool MigrationEntityHelper::Contains(db::Transaction& tx, const std::string& entity_id) const {
  WhereClauses where;
  where.AddWhereEqualsClause(std::string(kEntityIdColumnName), entity_id);

  ReadTableRequest request{std::string(kTableName)};
  request.SetWhereClause(std::move(where));
  return transactions_->Count(tx, request) > 0;
}

} // namespace healthstore::storage
