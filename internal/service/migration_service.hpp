#pragma once

#include <cstdint>
#include <vector>

#include "healthstore/migration/v1/migration.pb.h"
#include "internal/model/migration_entity.hpp"
#include "internal/model/migration_state.hpp"
#include "service_context.hpp"

namespace healthstore::service {

/*
  Caller-facing migration lifecycle: start, write batches, finish.
*/
class MigrationService {
 public:
  explicit MigrationService(ServiceContext ctx);

  void StartMigration();

  void WriteMigrationData(const std::vector<model::MigrationEntity>& entities);

  // Entities that fail to decode are reported by id with the batch's other failures.
  void WriteMigrationData(const healthstore::migration::v1::MigrationBatch& batch);

  void FinishMigration();
  void AbortMigration();
  void ResetMigrationState();

  void InsertMinDataMigrationSdkExtensionVersion(std::int32_t version);

  model::MigrationState GetMigrationState() const;

 private:
  ServiceContext ctx_;
};

} // namespace healthstore::service
