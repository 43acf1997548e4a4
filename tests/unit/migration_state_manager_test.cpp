#include <cassert>
#include <functional>
#include <iostream>
#include <string>

#include "internal/util/errors.hpp"
#include "support/temp_store.hpp"

using namespace healthstore;
using healthstore::model::MigrationPhase;
using healthstore::testing::Steps;
using healthstore::testing::TempStore;

namespace {

const std::string kPackage(healthstore::testing::kInstalledPackage);

template <typename Error>
bool Throws(const std::function<void()>& fn) {
  try {
    fn();
  } catch (const Error&) {
    return true;
  }
  return false;
}

void TestLifecycle() {
  TempStore store("state_lifecycle");
  auto&     state = *store.app().migration_state;

  assert(state.GetPhase() == MigrationPhase::kIdle);
  assert(Throws<util::InvalidState>([&] { state.AbortMigration(); }));
  assert(Throws<util::InvalidState>([&] { state.FinishMigration(); }));

  state.StartMigration();
  assert(state.GetPhase() == MigrationPhase::kInProgress);
  assert(Throws<util::InvalidState>([&] { state.StartMigration(); }));
  assert(Throws<util::InvalidState>([&] { state.ResetMigrationState(); }));

  state.FinishMigration();
  assert(state.GetPhase() == MigrationPhase::kComplete);
  state.FinishMigration();  // already complete
  assert(state.GetPhase() == MigrationPhase::kComplete);
  assert(Throws<util::InvalidState>([&] { state.StartMigration(); }));

  state.ResetMigrationState();
  assert(state.GetPhase() == MigrationPhase::kIdle);
  state.ResetMigrationState();
  assert(state.GetPhase() == MigrationPhase::kIdle);

  state.StartMigration();
  state.AbortMigration();
  assert(state.GetPhase() == MigrationPhase::kIdle);
}

void TestApiBlockedWhileInProgress() {
  TempStore store("state_blocks_api");
  auto&     service = *store.app().health_data_service;

  store.app().migration_service->StartMigration();
  assert(Throws<util::MigrationInProgress>([&] { service.InsertRecords(kPackage, {Steps(1000, 2000, 1)}); }));
  assert(Throws<util::MigrationInProgress>([&] { (void)service.GetRecordRetentionPeriodInDays(); }));

  store.app().migration_service->FinishMigration();
  assert(service.InsertRecords(kPackage, {Steps(1000, 2000, 1)}).size() == 1);
}

void TestPhaseSurvivesRestart() {
  TempStore store("state_restart");

  store.app().migration_service->StartMigration();
  store.Reopen();
  assert(store.app().migration_state->GetPhase() == MigrationPhase::kInProgress);

  store.app().migration_service->FinishMigration();
  store.Reopen();
  assert(store.app().migration_state->GetPhase() == MigrationPhase::kComplete);
}

void TestMinSdkExtensionVersion() {
  TempStore store("state_min_version", /*module_sdk_extension_version=*/10);
  auto&     service = *store.app().migration_service;

  assert(Throws<util::ValidationError>([&] { service.InsertMinDataMigrationSdkExtensionVersion(-1); }));

  service.InsertMinDataMigrationSdkExtensionVersion(9);
  assert(service.GetMigrationState().phase == MigrationPhase::kIdle);
  assert(service.GetMigrationState().min_sdk_extension_version == 9);

  service.InsertMinDataMigrationSdkExtensionVersion(11);
  assert(service.GetMigrationState().phase == MigrationPhase::kError);
  assert(Throws<util::InvalidState>([&] { service.StartMigration(); }));

  store.Reopen();
  assert(store.app().migration_service->GetMigrationState().phase == MigrationPhase::kError);
  assert(store.app().migration_service->GetMigrationState().min_sdk_extension_version == 11);

  store.app().migration_service->InsertMinDataMigrationSdkExtensionVersion(10);
  assert(store.app().migration_service->GetMigrationState().phase == MigrationPhase::kIdle);

  store.app().migration_service->StartMigration();
  assert(Throws<util::InvalidState>([&] { store.app().migration_service->InsertMinDataMigrationSdkExtensionVersion(1); }));
}

void TestResetLeavesErrorPhase() {
  TempStore store("state_reset_error", 1);
  auto&     service = *store.app().migration_service;

  service.InsertMinDataMigrationSdkExtensionVersion(5);
  assert(service.GetMigrationState().phase == MigrationPhase::kError);
  service.ResetMigrationState();
  assert(service.GetMigrationState().phase == MigrationPhase::kIdle);
}

} // namespace

int main() {
  TestLifecycle();
  TestApiBlockedWhileInProgress();
  TestPhaseSurvivesRestart();
  TestMinSdkExtensionVersion();
  TestResetLeavesErrorPhase();

  std::cout << "health_store_unit_migration_state: pass\n";
  return 0;
}
