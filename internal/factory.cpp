#include "factory.hpp"

#include <vector>

#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/migration/migration_payload_applier.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/service_context.hpp"
#include "internal/storage/transaction_manager.hpp"

namespace healthstore::factory {

namespace {

std::shared_ptr<storage::TransactionManager> BuildTransactionManager(const healthstore::runtime::config::RuntimeConfig& config) {
  const auto& sqlite = config.database().sqlite();

  db::sqlite::SqliteOptions options;
  options.wal_mode        = sqlite.wal_mode();
  options.busy_timeout_ms = static_cast<int>(sqlite.busy_timeout_ms());

  return storage::TransactionManager::Open(sqlite.path(), options, sqlite.max_readers());
}

std::shared_ptr<core::StaticPackageRegistry> BuildPackageRegistry(const healthstore::runtime::config::RuntimeConfig& config) {
  std::vector<core::InstalledPackage> installed;
  for (const auto& package : config.packages().installed()) {
    installed.push_back({package.package_name(), package.app_name()});
  }
  return std::make_shared<core::StaticPackageRegistry>(installed);
}

} // namespace

/*
    Build full application dependency graph
*/
Application Build(const healthstore::runtime::config::RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Storage
  // ------------------------------------------------------------------
  app.helpers = storage::DatabaseHelpers::Create(BuildTransactionManager(config));
  app.helpers->CreateTables();

  // ------------------------------------------------------------------
  // Core components
  // ------------------------------------------------------------------
  app.packages        = BuildPackageRegistry(config);
  app.records         = std::make_shared<core::RecordStore>(app.helpers);
  app.migration_state = std::make_shared<migration::MigrationStateManager>(app.helpers, config.migration().module_sdk_extension_version());
  app.migration_state->LoadState();

  auto applier       = std::make_shared<migration::MigrationPayloadApplier>(app.helpers, app.records, app.packages);
  app.data_migration = std::make_shared<migration::DataMigrationManager>(app.helpers, app.migration_state, applier);

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.helpers                       = app.helpers;
  ctx.records                       = app.records;
  ctx.packages                      = app.packages;
  ctx.migration_state               = app.migration_state;
  ctx.data_migration                = app.data_migration;
  ctx.change_logs_page_size         = static_cast<int>(config.records().change_logs_page_size());
  ctx.default_retention_period_days = config.records().default_retention_period_days();

  app.health_data_service = std::make_shared<service::HealthDataService>(ctx);
  app.migration_service   = std::make_shared<service::MigrationService>(ctx);

  // ------------------------------------------------------------------
  // Worker pool
  // ------------------------------------------------------------------
  app.workers = std::make_shared<runtime::WorkerPool>(config.workers().threads(), config.workers().queue_capacity());
  app.workers->Start();

  HEALTHSTORE_LOG_INFO("Health store ready", {observability::StringField("database", config.database().sqlite().path()),
                                              observability::StringField("migration_phase", model::PhaseName(app.migration_state->GetPhase()))});
  return app;
}

} // namespace healthstore::factory
