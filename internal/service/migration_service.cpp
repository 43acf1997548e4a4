#include "migration_service.hpp"

#include "internal/migration/data_migration_manager.hpp"
#include "internal/migration/migration_codec.hpp"
#include "internal/migration/migration_state_manager.hpp"
#include "internal/util/errors.hpp"
#include "observe_call.hpp"

namespace healthstore::service {

MigrationService::MigrationService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

void MigrationService::StartMigration() {
  ObserveCall("MigrationService.StartMigration", [&] { ctx_.migration_state->StartMigration(); });
}

void MigrationService::WriteMigrationData(const std::vector<model::MigrationEntity>& entities) {
  ObserveCall("MigrationService.WriteMigrationData", [&] { ctx_.data_migration->WriteMigrationData(entities); });
}

void MigrationService::WriteMigrationData(const healthstore::migration::v1::MigrationBatch& batch) {
  ObserveCall("MigrationService.WriteMigrationData", [&] {
    std::vector<model::MigrationEntity> entities;
    std::vector<util::EntityFailure>    failures;
    entities.reserve(batch.entities_size());

    for (const auto& wire : batch.entities()) {
      try {
        entities.push_back(migration::MigrationCodec::Decode(wire));
      } catch (const util::UnsupportedType& e) {
        failures.push_back({wire.entity_id(), util::EntityFailureKind::kUnsupportedType, e.what()});
      } catch (const util::ValidationError& e) {
        failures.push_back({wire.entity_id(), util::EntityFailureKind::kInvalidEntity, e.what()});
      }
    }

    ctx_.data_migration->WriteMigrationData(entities, std::move(failures));
  });
}

void MigrationService::FinishMigration() {
  ObserveCall("MigrationService.FinishMigration", [&] { ctx_.data_migration->FinishMigration(); });
}

void MigrationService::AbortMigration() {
  ObserveCall("MigrationService.AbortMigration", [&] { ctx_.migration_state->AbortMigration(); });
}

void MigrationService::ResetMigrationState() {
  ObserveCall("MigrationService.ResetMigrationState", [&] { ctx_.migration_state->ResetMigrationState(); });
}

void MigrationService::InsertMinDataMigrationSdkExtensionVersion(std::int32_t version) {
  ObserveCall("MigrationService.InsertMinDataMigrationSdkExtensionVersion",
              [&] { ctx_.migration_state->InsertMinDataMigrationSdkExtensionVersion(version); });
}

model::MigrationState MigrationService::GetMigrationState() const {
  return ctx_.migration_state->GetState();
}

} // namespace healthstore::service
