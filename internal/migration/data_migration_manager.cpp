#include "data_migration_manager.hpp"

#include <string>

#include "internal/observability/logging.hpp"

namespace healthstore::migration {

namespace {

util::EntityFailureKind FailureKindOf(const util::ValidationError& error) {
  if (dynamic_cast<const util::InvalidPermission*>(&error)) {
    return util::EntityFailureKind::kInvalidPermission;
  }
  if (dynamic_cast<const util::UnsupportedType*>(&error)) {
    return util::EntityFailureKind::kUnsupportedType;
  }
  return util::EntityFailureKind::kInvalidEntity;
}

} // namespace

DataMigrationManager::DataMigrationManager(std::shared_ptr<storage::DatabaseHelpers> helpers, std::shared_ptr<MigrationStateManager> state,
                                           std::shared_ptr<MigrationPayloadApplier> applier)
    : helpers_(std::move(helpers)), state_(std::move(state)), applier_(std::move(applier)) {
}

void DataMigrationManager::WriteMigrationData(const std::vector<model::MigrationEntity>& entities,
                                              std::vector<util::EntityFailure> prior_failures) {
  state_->EnsureInProgress();
  std::lock_guard lock(batch_mutex_);

  std::vector<util::EntityFailure> failures = std::move(prior_failures);
  std::size_t                      applied  = 0;

  try {
    helpers_->transactions->RunAsTransaction([&](db::Transaction& tx) {
      // the phase may have moved while this call waited for the writer
      state_->EnsureInProgress();

      // applied ids are recorded inside this transaction, so a repeat later in the batch is skipped too
      for (std::size_t i = 0; i < entities.size(); ++i) {
        const auto& entity = entities[i];
        if (entity.entity_id.empty()) {
          failures.push_back({entity.entity_id, util::EntityFailureKind::kInvalidEntity, "entity id must not be empty"});
          continue;
        }
        if (helpers_->migration_entities->Contains(tx, entity.entity_id)) {
          HEALTHSTORE_LOG_DEBUG("Skipping already migrated entity", {observability::StringField("entity_id", entity.entity_id)});
          continue;
        }

        const std::string savepoint = "migration_entity_" + std::to_string(i);
        tx.Savepoint(savepoint);
        try {
          applier_->Apply(tx, entity.payload);
          helpers_->migration_entities->InsertEntity(tx, entity.entity_id);
          tx.ReleaseSavepoint(savepoint);
          ++applied;
        } catch (const util::ValidationError& e) {
          tx.RollbackToSavepoint(savepoint);
          HEALTHSTORE_LOG_WARN("Migration entity rejected", {observability::StringField("entity_id", entity.entity_id),
                                                             observability::StringField("kind", model::PayloadKindName(entity.payload)),
                                                             observability::StringField("error", e.what())});
          failures.push_back({entity.entity_id, FailureKindOf(e), e.what()});
        }
      }
    });
  } catch (const util::InvalidState&) {
    throw;
  } catch (const std::exception& e) {
    HEALTHSTORE_LOG_ERROR("Migration batch aborted", {observability::StringField("error", e.what()),
                                                      observability::IntField("entities", static_cast<std::int64_t>(entities.size()))});
    try {
      state_->AbortMigration();
    } catch (const std::exception& abort_error) {
      HEALTHSTORE_LOG_ERROR("Failed to abort migration", {observability::StringField("error", abort_error.what())});
    }
    throw;
  }

  HEALTHSTORE_LOG_INFO("Migration batch committed", {observability::IntField("applied", static_cast<std::int64_t>(applied)),
                                                     observability::IntField("failed", static_cast<std::int64_t>(failures.size()))});
  if (!failures.empty()) {
    throw util::MigrationEntityError(std::move(failures));
  }
}

void DataMigrationManager::FinishMigration() {
  std::lock_guard lock(batch_mutex_);
  state_->FinishMigration([&](db::Transaction& tx) { applier_->ResolveStagedAppInfo(tx); });
}

} // namespace healthstore::migration
