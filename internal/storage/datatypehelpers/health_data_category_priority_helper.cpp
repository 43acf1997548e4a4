#include "health_data_category_priority_helper.hpp"

#include "internal/storage/utils/storage_utils.hpp"

namespace healthstore::storage {

HealthDataCategoryPriorityHelper::HealthDataCategoryPriorityHelper(std::shared_ptr<TransactionManager> transactions)
    : transactions_(std::move(transactions)) {
}

CreateTableRequest HealthDataCategoryPriorityHelper::GetCreateTableRequest() const {
  return CreateTableRequest(std::string(kTableName), {
                                                         {std::string(kPrimaryColumnName), kPrimaryAutoincrement},
                                                         {std::string(kCategoryColumnName), kIntegerNotNullUnique},
                                                         {std::string(kPackagePriorityColumnName), kTextNull},
                                                     });
}

std::vector<std::string> HealthDataCategoryPriorityHelper::GetPriorityOrder(db::Transaction& tx, model::HealthDataCategory category) const {
  WhereClauses where;
  where.AddWhereEqualsClause(std::string(kCategoryColumnName), model::ToId(category));

  ReadTableRequest request{std::string(kTableName)};
  request.SetWhereClause(std::move(where));

  auto cursor = transactions_->Read(tx, request);
  if (!cursor->MoveToNext()) {
    return {};
  }
  return DecodeStringList(GetCursorString(*cursor, kPackagePriorityColumnName));
}

void HealthDataCategoryPriorityHelper::SetPriorityOrder(db::Transaction& tx, model::HealthDataCategory category,
                                                        const std::vector<std::string>& packages) const {
  ContentValues values;
  values.Put(std::string(kCategoryColumnName), model::ToId(category));
  values.Put(std::string(kPackagePriorityColumnName), EncodeStringList(packages));

  UpsertTableRequest request(std::string(kTableName), std::move(values));
  request.SetConflict({std::string(kCategoryColumnName)}, ConflictPolicy::kReplace);
  ThrowIfError(transactions_->Insert(tx, request), "set priority for " + std::string(model::CategoryName(category)));
}

} // namespace healthstore::storage
