#include <cassert>
#include <cstdint>
#include <iostream>
#include <string>
#include <variant>
#include <vector>

#include "internal/core/record_store.hpp"
#include "internal/storage/utils/storage_utils.hpp"
#include "internal/util/errors.hpp"
#include "support/temp_store.hpp"

using namespace healthstore;
using healthstore::testing::HeartRate;
using healthstore::testing::Interval;
using healthstore::testing::Metadata;
using healthstore::testing::TempStore;

namespace {

const std::string kPackage(healthstore::testing::kInstalledPackage);

model::Record ReadOne(TempStore& store, model::RecordType type, const std::string& uuid) {
  core::ReadRecordsRequest request;
  request.record_type = type;
  request.uuids       = {uuid};
  auto records        = store.app().health_data_service->ReadRecords(request);
  assert(records.size() == 1);
  return records.front();
}

// Fills the store-owned fields of expected from what was read back.
void AssertStoredAs(model::Record expected, const model::Record& actual, const std::string& uuid) {
  auto& metadata                 = model::MetadataOf(expected);
  metadata.id                    = uuid;
  metadata.package_name          = kPackage;
  metadata.last_modified_time_ms = model::MetadataOf(actual).last_modified_time_ms;
  assert(metadata.last_modified_time_ms > 0);
  assert(expected == actual);
}

void TestIntervalRejectsEndNotAfterStart() {
  bool threw = false;
  try {
    (void)model::IntervalTime::Create(1000, 0, 1000, 0);
  } catch (const util::ValidationError&) {
    threw = true;
  }
  assert(threw && "equal start and end must be rejected");

  threw = false;
  try {
    (void)model::IntervalTime::Create(2000, 0, 1000, 0);
  } catch (const util::ValidationError&) {
    threw = true;
  }
  assert(threw && "end before start must be rejected");

  const auto interval = model::IntervalTime::Create(1000, -3600, 1001, 7200);
  assert(interval.StartTimeMs() == 1000);
  assert(interval.EndTimeMs() == 1001);
  assert(interval.StartZoneOffsetSeconds() == -3600);
  assert(interval.EndZoneOffsetSeconds() == 7200);
}

void TestEveryRecordKindRoundTrips() {
  TempStore store("record_round_trip");

  const std::vector<model::Record> records = {
      model::HeightRecord{Metadata("height-1", 2), {1'700'000'000'000, 3600}, 1.82},
      model::WeightRecord{Metadata(), {1'700'000'000'001, 0}, 72500.5},
      model::LeanBodyMassRecord{Metadata(), {1'700'000'000'002, 0}, 60000.0},
      model::BodyFatRecord{Metadata(), {1'700'000'000'003, -1800}, 18.25},
      model::RestingHeartRateRecord{Metadata(), {1'700'000'000'004, 0}, 52},
      model::BasalMetabolicRateRecord{Metadata(), {1'700'000'000'005, 0}, 80.5},
      model::StepsRecord{Metadata("steps-1", 1), Interval(1'700'000'000'000, 1'700'000'060'000), 120},
      model::DistanceRecord{Metadata(), Interval(1'700'000'000'000, 1'700'000'060'000), 95.5},
      model::ActiveCaloriesBurnedRecord{Metadata(), Interval(1'700'000'000'000, 1'700'000'060'000), 12.75},
      HeartRate(1'700'000'000'000, 1'700'000'060'000, {{72, 1'700'000'000'000}, {75, 1'700'000'030'000}}),
      model::SpeedRecord{Metadata(), Interval(1'700'000'000'000, 1'700'000'060'000), {{1.5, 1'700'000'000'000}}},
      model::PowerRecord{Metadata(), Interval(1'700'000'000'000, 1'700'000'060'000), {{210.0, 1'700'000'010'000}, {250.5, 1'700'000'020'000}}},
      model::StepsCadenceRecord{Metadata(), Interval(1'700'000'000'000, 1'700'000'060'000), {{160.0, 1'700'000'005'000}}},
  };
  assert(records.size() == model::AllRecordTypes().size());

  const auto uuids = store.app().health_data_service->InsertRecords(kPackage, records);
  assert(uuids.size() == records.size());

  for (std::size_t i = 0; i < records.size(); ++i) {
    assert(!uuids[i].empty());
    AssertStoredAs(records[i], ReadOne(store, model::TypeOf(records[i]), uuids[i]), uuids[i]);
  }
}

void TestSeriesWithoutSamplesReadsBackEmpty() {
  TempStore store("series_zero_samples");

  // the empty record sits between two with samples so grouping must not leak rows
  const std::vector<model::Record> records = {
      HeartRate(1000, 2000, {{60, 1000}, {61, 1500}}),
      HeartRate(3000, 4000, {}),
      HeartRate(5000, 6000, {{90, 5500}}),
  };
  const auto uuids = store.app().health_data_service->InsertRecords(kPackage, records);

  core::ReadRecordsRequest request;
  request.record_type = model::RecordType::kHeartRate;
  const auto read     = store.app().health_data_service->ReadRecords(request);
  assert(read.size() == 3);

  for (const auto& record : read) {
    const auto& heart_rate = std::get<model::HeartRateRecord>(record);
    if (heart_rate.metadata.id == uuids[0]) {
      assert(heart_rate.samples.size() == 2);
    } else if (heart_rate.metadata.id == uuids[1]) {
      assert(heart_rate.samples.empty());
    } else {
      assert(heart_rate.metadata.id == uuids[2]);
      assert(heart_rate.samples.size() == 1);
      assert(heart_rate.samples.front().value == 90);
    }
  }
}

void TestSeriesKeepsIdenticalTimestampSamples() {
  TempStore store("series_identical_timestamps");

  const auto record = model::SpeedRecord{Metadata(), Interval(1000, 2000), {{1.0, 1500}, {2.0, 1500}, {3.0, 1500}}};
  const auto uuids  = store.app().health_data_service->InsertRecords(kPackage, {record});

  const auto read  = ReadOne(store, model::RecordType::kSpeed, uuids.front());
  const auto speed = std::get<model::SpeedRecord>(read);
  assert(speed.samples.size() == 3);
  assert(speed.samples[0].value == 1.0);
  assert(speed.samples[1].value == 2.0);
  assert(speed.samples[2].value == 3.0);
}

void TestClientRecordIdReplacesOlderVersion() {
  TempStore store("client_record_id");
  auto&     service = *store.app().health_data_service;

  auto       first  = model::StepsRecord{Metadata("walk", 1), Interval(1000, 2000), 10};
  const auto uuid_1 = service.InsertRecords(kPackage, {first}).front();

  auto       newer  = model::StepsRecord{Metadata("walk", 2), Interval(1000, 2000), 25};
  const auto uuid_2 = service.InsertRecords(kPackage, {newer}).front();
  assert(uuid_1 == uuid_2);
  assert(std::get<model::StepsRecord>(ReadOne(store, model::RecordType::kSteps, uuid_1)).count == 25);

  auto       older  = model::StepsRecord{Metadata("walk", 1), Interval(1000, 2000), 99};
  const auto uuid_3 = service.InsertRecords(kPackage, {older}).front();
  assert(uuid_3 == uuid_1);
  assert(std::get<model::StepsRecord>(ReadOne(store, model::RecordType::kSteps, uuid_1)).count == 25);
}

void TestUpdateAndDeleteAreScopedToOwner() {
  TempStore store("owner_scope");
  auto&     service = *store.app().health_data_service;

  const auto uuid = service.InsertRecords(kPackage, {HeartRate(1000, 2000, {{70, 1500}})}).front();

  auto update        = HeartRate(1000, 2000, {{80, 1200}, {82, 1800}});
  update.metadata.id = uuid;

  bool threw = false;
  try {
    service.UpdateRecords("com.example.other", {update});
  } catch (const util::NotFound&) {
    threw = true;
  }
  assert(threw && "another package must not update the record");
  assert(service.DeleteRecords("com.example.other", model::RecordType::kHeartRate, {uuid}) == 0);

  service.UpdateRecords(kPackage, {update});
  const auto updated = std::get<model::HeartRateRecord>(ReadOne(store, model::RecordType::kHeartRate, uuid));
  assert(updated.samples.size() == 2);
  assert(updated.samples[1].value == 82);

  assert(service.DeleteRecords(kPackage, model::RecordType::kHeartRate, {uuid}) == 1);

  core::ReadRecordsRequest request;
  request.record_type = model::RecordType::kHeartRate;
  assert(service.ReadRecords(request).empty());
}

void TestReadFiltersByTimeRange() {
  TempStore store("time_range");
  auto&     service = *store.app().health_data_service;

  service.InsertRecords(kPackage, {healthstore::testing::Weight(1000, 70000), healthstore::testing::Weight(2000, 71000),
                                   healthstore::testing::Weight(3000, 72000)});

  core::ReadRecordsRequest request;
  request.record_type   = model::RecordType::kWeight;
  request.start_time_ms = 2000;
  request.end_time_ms   = 3000;
  const auto read       = service.ReadRecords(request);
  assert(read.size() == 1);
  assert(std::get<model::WeightRecord>(read.front()).weight_grams == 71000);
}

void TestListColumnsDecodeEveryElement() {
  std::vector<std::string> packages;
  std::vector<int32_t>     types;
  for (int32_t i = 0; i < 64; ++i) {
    packages.push_back("com.example.package" + std::to_string(i));
    types.push_back(i * 3);
  }
  assert(storage::DecodeStringList(storage::EncodeStringList(packages)) == packages);
  assert(storage::DecodeIntList(storage::EncodeIntList(types)) == types);
  assert(storage::DecodeStringList(storage::EncodeStringList({})).empty());

  bool threw = false;
  try {
    storage::DecodeIntList(R"([1, 2.5])");
  } catch (const util::InternalError&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestIntervalRejectsEndNotAfterStart();
  TestEveryRecordKindRoundTrips();
  TestSeriesWithoutSamplesReadsBackEmpty();
  TestSeriesKeepsIdenticalTimestampSamples();
  TestClientRecordIdReplacesOlderVersion();
  TestUpdateAndDeleteAreScopedToOwner();
  TestReadFiltersByTimeRange();
  TestListColumnsDecodeEveryElement();

  std::cout << "health_store_unit_record_helpers: pass\n";
  return 0;
}
