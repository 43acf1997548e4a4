#include "database_helpers.hpp"

namespace healthstore::storage {

std::shared_ptr<DatabaseHelpers> DatabaseHelpers::Create(std::shared_ptr<TransactionManager> transactions) {
  auto helpers                 = std::make_shared<DatabaseHelpers>();
  helpers->transactions        = transactions;
  helpers->records             = std::make_shared<RecordHelperRegistry>();
  helpers->app_info            = std::make_shared<AppInfoHelper>(transactions);
  helpers->permissions         = std::make_shared<PermissionGrantHelper>(transactions);
  helpers->priority            = std::make_shared<HealthDataCategoryPriorityHelper>(transactions);
  helpers->preferences         = std::make_shared<PreferenceHelper>(transactions);
  helpers->migration_entities  = std::make_shared<MigrationEntityHelper>(transactions);
  helpers->change_logs         = std::make_shared<ChangeLogsHelper>(transactions);
  helpers->change_log_requests = std::make_shared<ChangeLogsRequestHelper>(transactions, helpers->change_logs);
  return helpers;
}

void DatabaseHelpers::CreateTables() const {
  transactions->RunAsTransaction([&](db::Transaction& tx) {
    transactions->CreateTable(tx, app_info->GetCreateTableRequest());
    transactions->CreateTable(tx, app_info->GetStagingCreateTableRequest());
    for (const auto& helper : records->All()) {
      transactions->CreateTable(tx, helper->GetCreateTableRequest());
    }
    transactions->CreateTable(tx, permissions->GetCreateTableRequest());
    transactions->CreateTable(tx, priority->GetCreateTableRequest());
    transactions->CreateTable(tx, preferences->GetCreateTableRequest());
    transactions->CreateTable(tx, migration_entities->GetCreateTableRequest());
    transactions->CreateTable(tx, change_logs->GetCreateTableRequest());
    transactions->CreateTable(tx, change_log_requests->GetCreateTableRequest());
  });
}

} // namespace healthstore::storage
