#pragma once

#include <memory>

#include "internal/storage/datatypehelpers/app_info_helper.hpp"
#include "internal/storage/datatypehelpers/change_logs_helper.hpp"
#include "internal/storage/datatypehelpers/change_logs_request_helper.hpp"
#include "internal/storage/datatypehelpers/health_data_category_priority_helper.hpp"
#include "internal/storage/datatypehelpers/migration_entity_helper.hpp"
#include "internal/storage/datatypehelpers/permission_grant_helper.hpp"
#include "internal/storage/datatypehelpers/preference_helper.hpp"
#include "internal/storage/datatypehelpers/record_helper_registry.hpp"
#include "internal/storage/transaction_manager.hpp"

namespace healthstore::storage {

/*
  Every table helper over one TransactionManager.
*/
struct DatabaseHelpers {
  std::shared_ptr<TransactionManager>               transactions;
  std::shared_ptr<RecordHelperRegistry>             records;
  std::shared_ptr<AppInfoHelper>                    app_info;
  std::shared_ptr<PermissionGrantHelper>            permissions;
  std::shared_ptr<HealthDataCategoryPriorityHelper> priority;
  std::shared_ptr<PreferenceHelper>                 preferences;
  std::shared_ptr<MigrationEntityHelper>            migration_entities;
  std::shared_ptr<ChangeLogsHelper>                 change_logs;
  std::shared_ptr<ChangeLogsRequestHelper>          change_log_requests;

  static std::shared_ptr<DatabaseHelpers> Create(std::shared_ptr<TransactionManager> transactions);

  // Idempotent. App info goes first: record tables reference it.
  void CreateTables() const;
};

} // namespace healthstore::storage
