#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>

#include "internal/db/api/transaction.hpp"
#include "internal/model/migration_state.hpp"
#include "internal/storage/datatypehelpers/database_helpers.hpp"

namespace healthstore::migration {

/*
  MigrationStateManager

  Sole owner of the migration phase.

    IDLE --start--> IN_PROGRESS --finish--> COMPLETE
    IN_PROGRESS --abort--> IDLE
    COMPLETE / ERROR --reset--> IDLE
    IDLE <--min version--> ERROR

  The phase lives in the preference table and is mirrored in an
  atomic for the per-call fast path. Transitions are serialized by a
  mutex and written inside a writer transaction; the atomic is
  updated before that transaction commits, so any writer that takes
  the writer lock afterwards observes the new phase.
*/
class MigrationStateManager {
 public:
  MigrationStateManager(std::shared_ptr<storage::DatabaseHelpers> helpers, std::int32_t module_sdk_extension_version);

  // Restores the persisted state. Call once after the tables exist.
  void LoadState();

  model::MigrationPhase GetPhase() const {
    return phase_.load(std::memory_order_acquire);
  }

  model::MigrationState GetState() const;

  // Throws util::MigrationInProgress while a migration is running.
  void EnsureNotInProgress() const;

  // Throws util::InvalidState unless a migration is running.
  void EnsureInProgress() const;

  // IDLE -> IN_PROGRESS; util::InvalidState from any other phase.
  void StartMigration();

  // IN_PROGRESS -> COMPLETE; no-op when already COMPLETE. finalize runs
  // in the transition's transaction.
  void FinishMigration(const std::function<void(db::Transaction&)>& finalize = {});

  // IN_PROGRESS -> IDLE
  void AbortMigration();

  // COMPLETE or ERROR -> IDLE; no-op when IDLE.
  void ResetMigrationState();

  /*
    Records the minimum module version the migration source needs.
    A module older than that moves IDLE to ERROR; a satisfiable value
    moves ERROR back to IDLE.
  */
  void InsertMinDataMigrationSdkExtensionVersion(std::int32_t version);

 private:
  void Transition(model::MigrationPhase to, const std::function<void(db::Transaction&)>& in_transaction);

  std::shared_ptr<storage::DatabaseHelpers> helpers_;
  const std::int32_t                        module_sdk_extension_version_;

  mutable std::mutex                 mutex_;
  std::atomic<model::MigrationPhase> phase_{model::MigrationPhase::kIdle};
  std::atomic<std::int32_t>          min_sdk_extension_version_{0};
};

} // namespace healthstore::migration
