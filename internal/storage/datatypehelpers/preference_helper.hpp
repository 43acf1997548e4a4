#pragma once

#include <memory>
#include <optional>
#include <string>

#include "internal/db/api/transaction.hpp"
#include "internal/storage/transaction_manager.hpp"

namespace healthstore::storage {

/*
  String key/value settings that must survive restarts.
*/
class PreferenceHelper {
 public:
  static constexpr std::string_view kTableName       = "preference_table";
  static constexpr std::string_view kKeyColumnName   = "key";
  static constexpr std::string_view kValueColumnName = "value";

  static constexpr std::string_view kMigrationPhaseKey            = "migration_state";
  static constexpr std::string_view kMinSdkExtensionVersionKey    = "min_data_migration_sdk_extension_version";
  static constexpr std::string_view kRecordRetentionPeriodDaysKey = "record_retention_period_days";

  explicit PreferenceHelper(std::shared_ptr<TransactionManager> transactions);

  CreateTableRequest GetCreateTableRequest() const;

  void                       InsertOrReplacePreference(db::Transaction& tx, std::string_view key, const std::string& value) const;
  std::optional<std::string> GetPreference(db::Transaction& tx, std::string_view key) const;

 private:
  std::shared_ptr<TransactionManager> transactions_;
};

} // namespace healthstore::storage
