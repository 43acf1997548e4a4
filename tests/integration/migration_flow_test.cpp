#include <cassert>
#include <iostream>
#include <string>
#include <variant>
#include <vector>

#include "internal/migration/migration_codec.hpp"
#include "internal/util/errors.hpp"
#include "support/temp_store.hpp"

using namespace healthstore;
using healthstore::migration::MigrationCodec;
using healthstore::testing::TempStore;

namespace {

// One JSON-encoded entity per line, as exported by a migration source.
const std::vector<std::string> kExport = {
    R"({"entityId":"perm-fit","payloadKind":"PAYLOAD_KIND_PERMISSIONS","permissions":{"packageName":"com.example.fitness","firstGrantTime":"2023-01-01T00:00:00Z","permissions":["android.permission.health.WRITE_STEPS","android.permission.health.READ_HEART_RATE"]}})",
    R"({"entityId":"app-fit","payloadKind":"PAYLOAD_KIND_APP_INFO","appInfo":{"packageName":"com.example.fitness","appName":"Fitness","appIcon":"iVBORw=="}})",
    R"({"entityId":"priority-activity","payloadKind":"PAYLOAD_KIND_PRIORITY","priority":{"dataCategory":1,"packageNames":["com.example.fitness"]}})",
    R"({"entityId":"steps-1","payloadKind":"PAYLOAD_KIND_RECORD","record":{"originPackageName":"com.example.fitness","record":{"recordType":"RECORD_TYPE_STEPS","metadata":{"clientRecordId":"walk-1","clientRecordVersion":"3"},"interval":{"startTime":"2023-06-01T08:00:00Z","endTime":"2023-06-01T08:30:00Z"},"value":2400}}})",
    R"({"entityId":"hr-1","payloadKind":"PAYLOAD_KIND_RECORD","record":{"originPackageName":"com.example.fitness","record":{"recordType":"RECORD_TYPE_HEART_RATE","interval":{"startTime":"2023-06-01T08:00:00Z","endTime":"2023-06-01T08:01:00Z"},"samples":[{"value":71,"time":"2023-06-01T08:00:10Z"},{"value":74,"time":"2023-06-01T08:00:40Z"}]}}})",
    R"({"entityId":"meta","payloadKind":"PAYLOAD_KIND_METADATA","metadata":{"recordRetentionPeriodDays":90}})",
};

migration::v1::MigrationBatch Batch(std::size_t from, std::size_t to) {
  migration::v1::MigrationBatch batch;
  for (std::size_t i = from; i < to; ++i) *batch.add_entities() = MigrationCodec::ParseJson(kExport[i]);
  return batch;
}

void TestImportSurvivesRestart() {
  TempStore store("migration_flow_restart");

  store.app().migration_service->InsertMinDataMigrationSdkExtensionVersion(10);
  store.app().migration_service->StartMigration();
  store.app().migration_service->WriteMigrationData(Batch(0, 3));

  // the process dies mid-migration; the source resends everything
  store.Reopen();
  auto& migration = *store.app().migration_service;
  assert(migration.GetMigrationState().phase == model::MigrationPhase::kInProgress);

  bool blocked = false;
  try {
    (void)store.app().health_data_service->GetContributorApplicationsInfo();
  } catch (const util::MigrationInProgress&) {
    blocked = true;
  }
  assert(blocked);

  migration.WriteMigrationData(Batch(0, kExport.size()));
  migration.FinishMigration();
  assert(migration.GetMigrationState().phase == model::MigrationPhase::kComplete);

  auto& api = *store.app().health_data_service;
  assert(api.GetRecordRetentionPeriodInDays() == 90);
  assert(api.GetGrantedPermissions("com.example.fitness").size() == 2);
  assert((api.GetHealthDataCategoryPriority(model::HealthDataCategory::kActivity) == std::vector<std::string>{"com.example.fitness"}));

  const auto contributors = api.GetContributorApplicationsInfo();
  assert(contributors.size() == 1);
  assert(contributors.front().name == "Fitness");
  assert(contributors.front().icon.size() == 4);

  core::ReadRecordsRequest steps;
  steps.record_type = model::RecordType::kSteps;
  const auto read   = api.ReadRecords(steps);
  assert(read.size() == 1);
  const auto& record = std::get<model::StepsRecord>(read.front());
  assert(record.count == 2400);
  assert(record.metadata.client_record_id == "walk-1");
  assert(record.metadata.client_record_version == 3);
  assert(record.interval.EndTimeMs() - record.interval.StartTimeMs() == 30 * 60 * 1000);

  core::ReadRecordsRequest heart_rate;
  heart_rate.record_type = model::RecordType::kHeartRate;
  const auto hr          = std::get<model::HeartRateRecord>(api.ReadRecords(heart_rate).front());
  assert(hr.samples.size() == 2);
  assert(hr.samples[1].value == 74);
}

void TestMigratedRecordsAppearInChangeLogsAfterFinish() {
  TempStore store("migration_flow_change_logs");
  auto&     api   = *store.app().health_data_service;
  const auto token = api.GetChangeLogToken("com.example.sync", {});

  auto& migration = *store.app().migration_service;
  migration.StartMigration();
  migration.WriteMigrationData(Batch(3, 5));
  migration.FinishMigration();

  const auto changes = api.GetChangeLogs("com.example.sync", token);
  assert(changes.upserted_records.size() == 2);
  assert(!changes.has_more_data);
}

} // namespace

int main() {
  TestImportSurvivesRestart();
  TestMigratedRecordsAppearInChangeLogsAfterFinish();

  std::cout << "health_store_integration_migration_flow: pass\n";
  return 0;
}
