#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "internal/db/api/transaction.hpp"
#include "internal/model/record_type.hpp"
#include "internal/storage/transaction_manager.hpp"

namespace healthstore::storage {

struct PermissionGrant {
  std::string  permission;
  std::int64_t first_grant_time_ms = 0;
};

/*
  Health permissions granted to packages, one row per (package,
  permission). Permission names are validated by callers.
*/
class PermissionGrantHelper {
 public:
  static constexpr std::string_view kTableName                = "health_permission_grants_table";
  static constexpr std::string_view kPrimaryColumnName        = "row_id";
  static constexpr std::string_view kPackageColumnName        = "package_name";
  static constexpr std::string_view kPermissionColumnName     = "permission";
  static constexpr std::string_view kFirstGrantTimeColumnName = "first_grant_time";

  explicit PermissionGrantHelper(std::shared_ptr<TransactionManager> transactions);

  CreateTableRequest GetCreateTableRequest() const;

  // Re-granting keeps the first grant time already stored.
  void GrantPermissions(db::Transaction& tx, const std::string& package_name, const std::vector<std::string>& permissions,
                        std::int64_t first_grant_time_ms) const;

  void RevokePermissions(db::Transaction& tx, const std::string& package_name, const std::vector<std::string>& permissions) const;

  std::vector<PermissionGrant> GetGrantedPermissions(db::Transaction& tx, const std::string& package_name) const;

  bool HasWritePermissionForCategory(db::Transaction& tx, const std::string& package_name, model::HealthDataCategory category) const;

 private:
  std::shared_ptr<TransactionManager> transactions_;
};

} // namespace healthstore::storage
