#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/core/package_registry.hpp"
#include "internal/core/record_store.hpp"
#include "internal/migration/data_migration_manager.hpp"
#include "internal/migration/migration_state_manager.hpp"
#include "internal/runtime/worker_pool.hpp"
#include "internal/service/health_data_service.hpp"
#include "internal/service/migration_service.hpp"
#include "internal/storage/datatypehelpers/database_helpers.hpp"

namespace healthstore::factory {

/*
  Application

  Owns all long-lived objects. Everything here lives for the
  lifetime of the process; the worker pool is started.
*/
struct Application {
  std::shared_ptr<storage::DatabaseHelpers>         helpers;
  std::shared_ptr<core::StaticPackageRegistry>      packages;
  std::shared_ptr<core::RecordStore>                records;
  std::shared_ptr<migration::MigrationStateManager> migration_state;
  std::shared_ptr<migration::DataMigrationManager>  data_migration;

  std::shared_ptr<service::HealthDataService> health_data_service;
  std::shared_ptr<service::MigrationService>  migration_service;

  std::shared_ptr<runtime::WorkerPool> workers;
};

/*
  Build

  Opens the database, creates missing tables, restores the migration
  phase and wires the services. This is the composition root: the
  only place that knows the concrete sqlite types.
*/
Application Build(const healthstore::runtime::config::RuntimeConfig& config);

} // namespace healthstore::factory
