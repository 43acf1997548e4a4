#pragma once

#include <memory>
#include <mutex>
#include <vector>

#include "internal/migration/migration_payload_applier.hpp"
#include "internal/migration/migration_state_manager.hpp"
#include "internal/model/migration_entity.hpp"
#include "internal/storage/datatypehelpers/database_helpers.hpp"
#include "internal/util/errors.hpp"

namespace healthstore::migration {

/*
  DataMigrationManager

  Applies migration batches exactly once per entity id.

  A batch is one writer transaction with a savepoint around every
  entity. An entity that fails validation is rolled back to its
  savepoint and reported; the rest of the batch still commits. Ids
  already applied (in an earlier batch or earlier in this one) are
  skipped silently. A failed id is not recorded, so a corrected copy
  later in the same batch is applied. Any other failure rolls back the whole batch and
  aborts the migration.
*/
class DataMigrationManager {
 public:
  DataMigrationManager(std::shared_ptr<storage::DatabaseHelpers> helpers, std::shared_ptr<MigrationStateManager> state,
                       std::shared_ptr<MigrationPayloadApplier> applier);

  /*
    Throws util::InvalidState outside IN_PROGRESS and
    util::MigrationEntityError after commit when entities were
    rejected. prior_failures (e.g. entities that failed to decode)
    are reported together with this batch's failures.
  */
  void WriteMigrationData(const std::vector<model::MigrationEntity>& entities, std::vector<util::EntityFailure> prior_failures = {});

  // Resolves staged app info and moves to COMPLETE.
  void FinishMigration();

 private:
  std::shared_ptr<storage::DatabaseHelpers> helpers_;
  std::shared_ptr<MigrationStateManager>    state_;
  std::shared_ptr<MigrationPayloadApplier>  applier_;
  std::mutex                                batch_mutex_;
};

} // namespace healthstore::migration
