#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/core/package_registry.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/model/app_info.hpp"
#include "internal/model/record_type.hpp"
#include "internal/storage/datatypehelpers/record_helper.hpp"
#include "internal/storage/transaction_manager.hpp"

namespace healthstore::storage {

/*
  Package identity for everything stored.

  Every package that wrote (or had migrated) records gets a row; the
  row id is the app_info_id foreign key of the record tables. The
  name and icon columns are only filled by app-info migration, for
  packages that are no longer installed.

  App info migrated before the package's records is kept in the
  staging table until the migration finishes.
*/
class AppInfoHelper {
 public:
  static constexpr std::string_view kTableName               = "application_info_table";
  static constexpr std::string_view kStagingTableName        = "migration_app_info_staging_table";
  static constexpr std::string_view kPrimaryColumnName       = "row_id";
  static constexpr std::string_view kPackageColumnName       = "package_name";
  static constexpr std::string_view kAppNameColumnName       = "app_name";
  static constexpr std::string_view kAppIconColumnName       = "app_icon";
  static constexpr std::string_view kRecordTypesUsedColumnName = "record_types_used";

  explicit AppInfoHelper(std::shared_ptr<TransactionManager> transactions);

  CreateTableRequest GetCreateTableRequest() const;
  CreateTableRequest GetStagingCreateTableRequest() const;

  std::int64_t                GetOrInsertAppInfoId(db::Transaction& tx, const std::string& package_name) const;
  std::optional<std::int64_t> GetAppInfoId(db::Transaction& tx, const std::string& package_name) const;

  // Ids of the packages that have a row; unknown packages are dropped.
  std::vector<std::int64_t> GetAppInfoIds(db::Transaction& tx, const std::vector<std::string>& package_names) const;

  AppIdToPackageMap GetIdToPackageNameMap(db::Transaction& tx) const;

  void AddRecordTypeUsed(db::Transaction& tx, std::int64_t app_info_id, model::RecordType type) const;
  bool HasRecords(db::Transaction& tx, const std::string& package_name) const;

  void UpdateAppInfo(db::Transaction& tx, const model::AppInfo& info) const;

  void                        StageAppInfo(db::Transaction& tx, const model::AppInfo& info) const;
  std::vector<model::AppInfo> GetStagedAppInfo(db::Transaction& tx) const;
  void                        ClearStagedAppInfo(db::Transaction& tx) const;

  /*
    Packages that contributed records. Installed packages are listed
    under their installed name; uninstalled ones only when migration
    gave them a name.
  */
  std::vector<model::AppInfo> GetContributorApplicationsInfo(db::Transaction& tx, const core::PackageRegistry& packages) const;

 private:
  struct Row {
    std::int64_t                id = 0;
    model::AppInfo              info;
    std::vector<std::int32_t>   record_types_used;
  };

  std::optional<Row> ReadRow(db::Transaction& tx, const std::string& package_name) const;
  static Row         ToRow(const db::sql::Row& row);

  std::shared_ptr<TransactionManager> transactions_;
};

} // namespace healthstore::storage
