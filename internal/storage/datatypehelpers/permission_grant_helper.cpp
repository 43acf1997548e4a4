#include "permission_grant_helper.hpp"

#include "internal/model/health_permissions.hpp"
#include "internal/storage/utils/storage_utils.hpp"

namespace healthstore::storage {

PermissionGrantHelper::PermissionGrantHelper(std::shared_ptr<TransactionManager> transactions) : transactions_(std::move(transactions)) {
}

CreateTableRequest PermissionGrantHelper::GetCreateTableRequest() const {
  CreateTableRequest request(std::string(kTableName), {
                                                          {std::string(kPrimaryColumnName), kPrimaryAutoincrement},
                                                          {std::string(kPackageColumnName), kTextNotNull},
                                                          {std::string(kPermissionColumnName), kTextNotNull},
                                                          {std::string(kFirstGrantTimeColumnName), kIntegerNotNull},
                                                      });
  request.AddUniqueColumns({std::string(kPackageColumnName), std::string(kPermissionColumnName)});
  request.CreateIndexOn(std::string(kPackageColumnName));
  return request;
}

void PermissionGrantHelper::GrantPermissions(db::Transaction& tx, const std::string& package_name, const std::vector<std::string>& permissions,
                                             std::int64_t first_grant_time_ms) const {
  for (const auto& permission : permissions) {
    ContentValues values;
    values.Put(std::string(kPackageColumnName), package_name);
    values.Put(std::string(kPermissionColumnName), permission);
    values.Put(std::string(kFirstGrantTimeColumnName), first_grant_time_ms);

    UpsertTableRequest request(std::string(kTableName), std::move(values));
    request.SetConflict({std::string(kPackageColumnName), std::string(kPermissionColumnName)}, ConflictPolicy::kIgnore);
    ThrowIfError(transactions_->Insert(tx, request), "grant " + permission + " to " + package_name);
  }
}

void PermissionGrantHelper::RevokePermissions(db::Transaction& tx, const std::string& package_name,
                                              const std::vector<std::string>& permissions) const {
  WhereClauses where;
  where.AddWhereEqualsClause(std::string(kPackageColumnName), package_name);
  where.AddWhereInClause(std::string(kPermissionColumnName), permissions);
  ThrowIfError(transactions_->Delete(tx, DeleteTableRequest(std::string(kTableName), std::move(where))), "revoke permissions of " + package_name);
}

std::vector<PermissionGrant> PermissionGrantHelper::GetGrantedPermissions(db::Transaction& tx, const std::string& package_name) const {
  WhereClauses where;
  where.AddWhereEqualsClause(std::string(kPackageColumnName), package_name);

  ReadTableRequest request{std::string(kTableName)};
  request.SetWhereClause(std::move(where)).SetOrderBy({std::string(kPermissionColumnName) + " ASC"});

  std::vector<PermissionGrant> grants;
  auto                         cursor = transactions_->Read(tx, request);
  while (cursor->MoveToNext()) {
    grants.push_back({GetCursorString(*cursor, kPermissionColumnName), GetCursorLong(*cursor, kFirstGrantTimeColumnName)});
  }
  return grants;
}

bool PermissionGrantHelper::HasWritePermissionForCategory(db::Transaction& tx, const std::string& package_name,
                                                          model::HealthDataCategory category) const {
  WhereClauses where;
  where.AddWhereEqualsClause(std::string(kPackageColumnName), package_name);
  where.AddWhereInClause(std::string(kPermissionColumnName), model::WritePermissionsForCategory(category));

  ReadTableRequest request{std::string(kTableName)};
  request.SetWhereClause(std::move(where));
  return transactions_->Count(tx, request) > 0;
}

} // namespace healthstore::storage
