#pragma once

#include <cstdint>
#include <memory>

namespace healthstore::core {
class PackageRegistry;
class RecordStore;
} // namespace healthstore::core
namespace healthstore::storage {
struct DatabaseHelpers;
}
namespace healthstore::migration {
class MigrationStateManager;
class DataMigrationManager;
} // namespace healthstore::migration

namespace healthstore::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<healthstore::storage::DatabaseHelpers>         helpers;
  std::shared_ptr<healthstore::core::RecordStore>                records;
  std::shared_ptr<healthstore::core::PackageRegistry>            packages;
  std::shared_ptr<healthstore::migration::MigrationStateManager> migration_state;
  std::shared_ptr<healthstore::migration::DataMigrationManager>  data_migration;

  int          change_logs_page_size         = 1000;
  std::int32_t default_retention_period_days = 0;
};

} // namespace healthstore::service
