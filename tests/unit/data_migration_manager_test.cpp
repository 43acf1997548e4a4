#include <cassert>
#include <iostream>
#include <string>
#include <variant>
#include <vector>

#include "internal/model/health_permissions.hpp"
#include "internal/util/errors.hpp"
#include "support/temp_store.hpp"

using namespace healthstore;
using healthstore::model::MigrationEntity;
using healthstore::testing::Steps;
using healthstore::testing::TempStore;

namespace {

const std::string kInstalled(healthstore::testing::kInstalledPackage);
const std::string kAppA = "com.example.a";
const std::string kAppB = "com.example.b";

const std::string kWriteSteps = model::PermissionName(model::PermissionAccess::kWrite, "STEPS");
const std::string kReadSteps  = model::PermissionName(model::PermissionAccess::kRead, "STEPS");

MigrationEntity RecordEntity(std::string id, std::string package, model::Record record) {
  return {std::move(id), model::RecordPayload{std::move(package), std::move(record)}};
}

MigrationEntity PermissionEntity(std::string id, std::string package, std::vector<std::string> permissions) {
  return {std::move(id), model::PermissionPayload{std::move(package), 1'600'000'000'000, std::move(permissions)}};
}

MigrationEntity PriorityEntity(std::string id, std::vector<std::string> packages) {
  return {std::move(id), model::PriorityPayload{model::HealthDataCategory::kActivity, std::move(packages)}};
}

MigrationEntity AppInfoEntity(std::string id, std::string package, std::string name) {
  return {std::move(id), model::AppInfoPayload{std::move(package), std::move(name), {0x89, 0x50, 0x4e, 0x47}}};
}

std::vector<util::EntityFailure> WriteExpectingFailures(service::MigrationService& service, const std::vector<MigrationEntity>& entities) {
  try {
    service.WriteMigrationData(entities);
  } catch (const util::MigrationEntityError& e) {
    return e.Failures();
  }
  return {};
}

std::size_t CountSteps(TempStore& store) {
  core::ReadRecordsRequest request;
  request.record_type = model::RecordType::kSteps;
  return store.app().health_data_service->ReadRecords(request).size();
}

void TestEntitiesApplyExactlyOnce() {
  TempStore store("migration_exactly_once");
  auto&     migration = *store.app().migration_service;

  migration.StartMigration();
  migration.WriteMigrationData({RecordEntity("steps-1", kAppA, Steps(1000, 2000, 10)), RecordEntity("steps-1", kAppA, Steps(1000, 2000, 10)),
                                RecordEntity("steps-2", kAppA, Steps(3000, 4000, 20))});
  // resent batch after a lost acknowledgement
  migration.WriteMigrationData({RecordEntity("steps-1", kAppA, Steps(1000, 2000, 10)), RecordEntity("steps-2", kAppA, Steps(3000, 4000, 20))});
  migration.FinishMigration();

  assert(CountSteps(store) == 2);
}

void TestWriteRequiresMigrationInProgress() {
  TempStore store("migration_requires_progress");

  bool threw = false;
  try {
    store.app().migration_service->WriteMigrationData({RecordEntity("steps-1", kAppA, Steps(1000, 2000, 10))});
  } catch (const util::InvalidState&) {
    threw = true;
  }
  assert(threw);
}

void TestMigratedRecordKeepsSourceTimestamps() {
  TempStore store("migration_timestamps");
  auto&     migration = *store.app().migration_service;

  auto record                           = Steps(1000, 2000, 10);
  record.metadata.last_modified_time_ms = 1'500'000'000'000;

  migration.StartMigration();
  migration.WriteMigrationData({RecordEntity("steps-1", kAppA, record)});
  migration.FinishMigration();

  core::ReadRecordsRequest request;
  request.record_type = model::RecordType::kSteps;
  const auto read     = store.app().health_data_service->ReadRecords(request);
  assert(read.size() == 1);
  const auto& steps = std::get<model::StepsRecord>(read.front());
  assert(steps.metadata.package_name == kAppA);
  assert(steps.metadata.last_modified_time_ms == 1'500'000'000'000);
  assert(steps.count == 10);
}

void TestInvalidPermissionRejectsOnlyThatEntity() {
  TempStore store("migration_bad_permission");
  auto&     migration = *store.app().migration_service;

  const std::vector<MigrationEntity> batch = {
      PermissionEntity("perm-a", kAppA, {kWriteSteps, kReadSteps}),
      PermissionEntity("perm-bad", kAppB, {kWriteSteps, "android.permission.health.WRITE_TELEPORTATION"}),
      RecordEntity("steps-1", kAppA, Steps(1000, 2000, 10)),
  };

  migration.StartMigration();
  auto failures = WriteExpectingFailures(migration, batch);
  assert(failures.size() == 1);
  assert(failures.front().entity_id == "perm-bad");
  assert(failures.front().kind == util::EntityFailureKind::kInvalidPermission);

  // rejected entities are not recorded as migrated: a retry fails the same way
  failures = WriteExpectingFailures(migration, batch);
  assert(failures.size() == 1);
  assert(failures.front().entity_id == "perm-bad");
  migration.FinishMigration();

  auto& api = *store.app().health_data_service;
  assert(api.GetGrantedPermissions(kAppA).size() == 2);
  assert(api.GetGrantedPermissions(kAppB).empty());
  assert(CountSteps(store) == 1);
}

void TestPriorityMergesWithExistingOrder() {
  TempStore store("migration_priority_merge");
  auto&     migration = *store.app().migration_service;

  migration.StartMigration();
  migration.WriteMigrationData({PermissionEntity("perm-a", kAppA, {kWriteSteps}), PriorityEntity("priority-1", {kAppA})});
  migration.WriteMigrationData({PermissionEntity("perm-b", kAppB, {kWriteSteps}), PriorityEntity("priority-2", {kAppB, kAppA})});
  migration.FinishMigration();

  const auto order = store.app().health_data_service->GetHealthDataCategoryPriority(model::HealthDataCategory::kActivity);
  assert((order == std::vector<std::string>{kAppB, kAppA}));
}

void TestPriorityDropsPackagesWithoutWritePermission() {
  TempStore store("migration_priority_prune");
  auto&     migration = *store.app().migration_service;

  migration.StartMigration();
  migration.WriteMigrationData({PermissionEntity("perm-a", kAppA, {kWriteSteps}), PriorityEntity("priority-1", {kAppA})});
  migration.WriteMigrationData({PermissionEntity("perm-b", kAppB, {kReadSteps}), PriorityEntity("priority-2", {kAppB, kAppA})});
  migration.FinishMigration();

  auto&      api   = *store.app().health_data_service;
  const auto order = api.GetHealthDataCategoryPriority(model::HealthDataCategory::kActivity);
  assert((order == std::vector<std::string>{kAppA}));

  bool threw = false;
  try {
    api.UpdateHealthDataCategoryPriority(model::HealthDataCategory::kActivity, {kAppA, kAppB});
  } catch (const util::ValidationError&) {
    threw = true;
  }
  assert(threw && "a new order must reorder the current one");
}

void TestRevokingWriteAccessRemovesPackageFromPriority() {
  TempStore store("migration_priority_revoke");
  auto&     migration = *store.app().migration_service;

  migration.StartMigration();
  migration.WriteMigrationData({PermissionEntity("perm-a", kAppA, {kWriteSteps}), PermissionEntity("perm-b", kAppB, {kWriteSteps, kReadSteps}),
                                PriorityEntity("priority", {kAppA, kAppB})});
  migration.FinishMigration();

  auto& api = *store.app().health_data_service;

  api.RevokeHealthPermissions(kAppB, {kReadSteps});
  assert((api.GetHealthDataCategoryPriority(model::HealthDataCategory::kActivity) == std::vector<std::string>{kAppA, kAppB}));
  assert((api.GetGrantedPermissions(kAppB) == std::vector<std::string>{kWriteSteps}));

  api.RevokeHealthPermissions(kAppB, {kWriteSteps});
  assert((api.GetHealthDataCategoryPriority(model::HealthDataCategory::kActivity) == std::vector<std::string>{kAppA}));
  assert(api.GetGrantedPermissions(kAppB).empty());

  bool threw = false;
  try {
    api.RevokeHealthPermissions(kAppA, {kWriteSteps, "android.permission.health.WRITE_TELEPORTATION"});
  } catch (const util::InvalidPermission&) {
    threw = true;
  }
  assert(threw);
  assert((api.GetGrantedPermissions(kAppA) == std::vector<std::string>{kWriteSteps}));
}

model::AppInfo FindContributor(const std::vector<model::AppInfo>& contributors, const std::string& package) {
  for (const auto& info : contributors) {
    if (info.package_name == package) return info;
  }
  return {};
}

void TestAppInfoBeforeRecordsIsStagedUntilFinish() {
  TempStore store("migration_app_info_staged");
  auto&     migration = *store.app().migration_service;

  migration.StartMigration();
  migration.WriteMigrationData({AppInfoEntity("app-a", kAppA, "App A"), AppInfoEntity("app-b", kAppB, "App B")});
  migration.WriteMigrationData({RecordEntity("steps-a", kAppA, Steps(1000, 2000, 10))});
  migration.FinishMigration();

  const auto contributors = store.app().health_data_service->GetContributorApplicationsInfo();
  // B never contributed records
  assert(contributors.size() == 1);
  const auto a = FindContributor(contributors, kAppA);
  assert(a.name == "App A");
  assert((a.icon == std::vector<std::uint8_t>{0x89, 0x50, 0x4e, 0x47}));
}

void TestAppInfoAfterRecordsAppliesImmediately() {
  TempStore store("migration_app_info_direct");
  auto&     migration = *store.app().migration_service;

  migration.StartMigration();
  migration.WriteMigrationData({RecordEntity("steps-a", kAppA, Steps(1000, 2000, 10)), AppInfoEntity("app-a", kAppA, "App A")});
  migration.FinishMigration();

  auto& api = *store.app().health_data_service;
  assert(api.GetContributorApplicationsInfo().size() == 1);
  assert(FindContributor(api.GetContributorApplicationsInfo(), kAppA).name == "App A");

  // an installed package is listed under its installed label
  store.app().packages->Install({kAppA, "App A (installed)"});
  assert(FindContributor(api.GetContributorApplicationsInfo(), kAppA).name == "App A (installed)");

  store.app().packages->Uninstall(kAppA);
  assert(FindContributor(api.GetContributorApplicationsInfo(), kAppA).name == "App A");
}

void TestAppInfoOfInstalledPackageIsIgnored() {
  TempStore store("migration_app_info_installed");
  auto&     migration = *store.app().migration_service;

  migration.StartMigration();
  migration.WriteMigrationData({RecordEntity("steps-i", kInstalled, Steps(1000, 2000, 10)), AppInfoEntity("app-i", kInstalled, "Stale Name")});
  migration.FinishMigration();

  const auto contributors = store.app().health_data_service->GetContributorApplicationsInfo();
  assert(contributors.size() == 1);
  assert(FindContributor(contributors, kInstalled).name == std::string(healthstore::testing::kInstalledAppName));
}

void TestMetadataSetsRetentionPeriod() {
  TempStore store("migration_metadata");
  auto&     migration = *store.app().migration_service;
  auto&     api       = *store.app().health_data_service;

  assert(api.GetRecordRetentionPeriodInDays() == 0);

  migration.StartMigration();
  const auto failures = WriteExpectingFailures(migration, {{"metadata-bad", model::MetadataPayload{-5}}, {"metadata", model::MetadataPayload{30}}});
  assert(failures.size() == 1);
  assert(failures.front().entity_id == "metadata-bad");
  assert(failures.front().kind == util::EntityFailureKind::kInvalidEntity);
  migration.FinishMigration();

  assert(api.GetRecordRetentionPeriodInDays() == 30);
}

void TestCorrectedCopyInSameBatchIsApplied() {
  TempStore store("migration_corrected_copy");
  auto&     migration = *store.app().migration_service;

  migration.StartMigration();
  const auto failures = WriteExpectingFailures(migration, {{"metadata", model::MetadataPayload{-5}}, {"metadata", model::MetadataPayload{21}}});
  assert(failures.size() == 1);
  assert(failures.front().entity_id == "metadata");

  // the corrected copy was recorded, so a third copy is a duplicate
  assert(WriteExpectingFailures(migration, {{"metadata", model::MetadataPayload{-5}}}).empty());
  migration.FinishMigration();

  assert(store.app().health_data_service->GetRecordRetentionPeriodInDays() == 21);
}

void TestAbortKeepsCommittedBatches() {
  TempStore store("migration_abort");
  auto&     migration = *store.app().migration_service;

  migration.StartMigration();
  migration.WriteMigrationData({RecordEntity("steps-1", kAppA, Steps(1000, 2000, 10))});
  migration.AbortMigration();

  assert(store.app().migration_state->GetPhase() == model::MigrationPhase::kIdle);
  assert(CountSteps(store) == 1);

  // a restarted migration still skips what was applied before
  migration.StartMigration();
  migration.WriteMigrationData({RecordEntity("steps-1", kAppA, Steps(1000, 2000, 10))});
  migration.FinishMigration();
  assert(CountSteps(store) == 1);
}

} // namespace

int main() {
  TestEntitiesApplyExactlyOnce();
  TestWriteRequiresMigrationInProgress();
  TestMigratedRecordKeepsSourceTimestamps();
  TestInvalidPermissionRejectsOnlyThatEntity();
  TestPriorityMergesWithExistingOrder();
  TestPriorityDropsPackagesWithoutWritePermission();
  TestRevokingWriteAccessRemovesPackageFromPriority();
  TestAppInfoBeforeRecordsIsStagedUntilFinish();
  TestAppInfoAfterRecordsAppliesImmediately();
  TestAppInfoOfInstalledPackageIsIgnored();
  TestMetadataSetsRetentionPeriod();
  TestCorrectedCopyInSameBatchIsApplied();
  TestAbortKeepsCommittedBatches();

  std::cout << "health_store_unit_data_migration: pass\n";
  return 0;
}
