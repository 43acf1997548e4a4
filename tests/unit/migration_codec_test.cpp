#include <cassert>
#include <cstdint>
#include <functional>
#include <iostream>
#include <limits>
#include <string>
#include <variant>

#include "internal/migration/migration_codec.hpp"
#include "internal/util/errors.hpp"
#include "support/temp_store.hpp"

using namespace healthstore;
using healthstore::migration::MigrationCodec;
namespace v1 = healthstore::migration::v1;

namespace {

template <typename Error>
bool Throws(const std::function<void()>& fn) {
  try {
    fn();
  } catch (const Error&) {
    return true;
  }
  return false;
}

v1::MigrationEntity StepsEntity(const std::string& id, double count) {
  v1::MigrationEntity wire;
  wire.set_entity_id(id);
  wire.set_payload_kind(v1::PAYLOAD_KIND_RECORD);

  auto* payload = wire.mutable_record();
  payload->set_origin_package_name("com.example.a");
  auto* record = payload->mutable_record();
  record->set_record_type(v1::RECORD_TYPE_STEPS);
  record->mutable_interval()->mutable_start_time()->set_seconds(1000);
  record->mutable_interval()->mutable_end_time()->set_seconds(1060);
  record->set_value(count);
  return wire;
}

void TestDecodesRecordEntity() {
  const auto entity = MigrationCodec::Decode(StepsEntity("steps-1", 42));
  assert(entity.entity_id == "steps-1");

  const auto& payload = std::get<model::RecordPayload>(entity.payload);
  assert(payload.origin_package_name == "com.example.a");
  const auto& steps = std::get<model::StepsRecord>(payload.record);
  assert(steps.count == 42);
  assert(steps.interval.StartTimeMs() == 1'000'000);
  assert(steps.interval.EndTimeMs() == 1'060'000);
}

void TestEncodeMatchesDecode() {
  model::MigrationEntity entity{"hr-1", model::RecordPayload{"com.example.a", model::HeartRateRecord{{}, model::IntervalTime::Create(1000, 0, 2000, 0), {{70, 1500}}}}};
  const auto             decoded = MigrationCodec::Decode(MigrationCodec::Encode(entity));
  assert(std::get<model::RecordPayload>(decoded.payload).record == std::get<model::RecordPayload>(entity.payload).record);
}

void TestUnsupportedPayloadKinds() {
  auto unspecified = StepsEntity("e", 1);
  unspecified.set_payload_kind(v1::PAYLOAD_KIND_UNSPECIFIED);
  assert(Throws<util::UnsupportedType>([&] { MigrationCodec::Decode(unspecified); }));

  auto unknown = StepsEntity("e", 1);
  unknown.set_payload_kind(static_cast<v1::PayloadKind>(42));
  assert(Throws<util::UnsupportedType>([&] { MigrationCodec::Decode(unknown); }));

  auto mismatched = StepsEntity("e", 1);
  mismatched.set_payload_kind(v1::PAYLOAD_KIND_METADATA);
  assert(Throws<util::UnsupportedType>([&] { MigrationCodec::Decode(mismatched); }));

  auto unknown_record = StepsEntity("e", 1);
  unknown_record.mutable_record()->mutable_record()->set_record_type(static_cast<v1::RecordType>(4));
  assert(Throws<util::UnsupportedType>([&] { MigrationCodec::Decode(unknown_record); }));

  auto no_record_type = StepsEntity("e", 1);
  no_record_type.mutable_record()->mutable_record()->set_record_type(v1::RECORD_TYPE_UNKNOWN);
  assert(Throws<util::UnsupportedType>([&] { MigrationCodec::Decode(no_record_type); }));
}

void TestMalformedRecords() {
  assert(Throws<util::ValidationError>([&] { MigrationCodec::Decode(StepsEntity("e", 1.5)); }));

  auto wrong_time = StepsEntity("e", 1);
  wrong_time.mutable_record()->mutable_record()->set_record_type(v1::RECORD_TYPE_WEIGHT);
  assert(Throws<util::ValidationError>([&] { MigrationCodec::Decode(wrong_time); }));

  auto backwards = StepsEntity("e", 1);
  backwards.mutable_record()->mutable_record()->mutable_interval()->mutable_end_time()->set_seconds(900);
  assert(Throws<util::ValidationError>([&] { MigrationCodec::Decode(backwards); }));

  v1::MigrationEntity priority;
  priority.set_entity_id("p");
  priority.set_payload_kind(v1::PAYLOAD_KIND_PRIORITY);
  priority.mutable_priority()->set_data_category(99);
  assert(Throws<util::ValidationError>([&] { MigrationCodec::Decode(priority); }));
}

void TestTimestampsBeyondNanosecondClockRange() {
  // 2300-01-01, past the year 2262 limit of int64 nanoseconds
  auto late     = StepsEntity("late", 5);
  auto interval = late.mutable_record()->mutable_record()->mutable_interval();
  interval->mutable_start_time()->set_seconds(10'413'792'000);
  interval->mutable_end_time()->set_seconds(10'413'792'060);
  interval->mutable_end_time()->set_nanos(250'000'000);

  const auto entity = MigrationCodec::Decode(late);
  const auto& steps = std::get<model::StepsRecord>(std::get<model::RecordPayload>(entity.payload).record);
  assert(steps.interval.StartTimeMs() == 10'413'792'000'000);
  assert(steps.interval.EndTimeMs() == 10'413'792'060'250);

  const auto encoded = MigrationCodec::Encode(entity);
  assert(encoded.record().record().interval().end_time().seconds() == 10'413'792'060);
  assert(encoded.record().record().interval().end_time().nanos() == 250'000'000);

  // before the epoch
  auto early = StepsEntity("early", 5);
  early.mutable_record()->mutable_record()->mutable_interval()->mutable_start_time()->set_seconds(-86'400);
  const auto decoded = MigrationCodec::Decode(early);
  assert(std::get<model::StepsRecord>(std::get<model::RecordPayload>(decoded.payload).record).interval.StartTimeMs() == -86'400'000);
}

void TestTimestampsOutsideProtoRangeAreRejected() {
  auto too_late = StepsEntity("too-late", 5);
  too_late.mutable_record()->mutable_record()->mutable_interval()->mutable_end_time()->set_seconds(253'402'300'800);
  std::string message;
  try {
    MigrationCodec::Decode(too_late);
  } catch (const util::ValidationError& e) {
    message = e.what();
  }
  assert(message.find("too-late") != std::string::npos);

  auto too_early = StepsEntity("too-early", 5);
  too_early.mutable_record()->mutable_record()->mutable_interval()->mutable_start_time()->set_seconds(-62'135'596'801);
  assert(Throws<util::ValidationError>([&] { MigrationCodec::Decode(too_early); }));

  auto bad_nanos = StepsEntity("bad-nanos", 5);
  bad_nanos.mutable_record()->mutable_record()->mutable_interval()->mutable_end_time()->set_nanos(-1);
  assert(Throws<util::ValidationError>([&] { MigrationCodec::Decode(bad_nanos); }));

  v1::MigrationEntity permissions;
  permissions.set_entity_id("perm");
  permissions.set_payload_kind(v1::PAYLOAD_KIND_PERMISSIONS);
  permissions.mutable_permissions()->set_package_name("com.example.a");
  permissions.mutable_permissions()->mutable_first_grant_time()->set_seconds(INT64_MAX);
  assert(Throws<util::ValidationError>([&] { MigrationCodec::Decode(permissions); }));

  model::MigrationEntity unencodable{"far", model::RecordPayload{"com.example.a", model::WeightRecord{{}, {INT64_MAX, 0}, 70'000}}};
  assert(Throws<util::ValidationError>([&] { MigrationCodec::Encode(unencodable); }));
}

void TestWholeNumbersOutsideInt64AreRejected() {
  assert(Throws<util::ValidationError>([&] { MigrationCodec::Decode(StepsEntity("e", 1e30)); }));
  assert(Throws<util::ValidationError>([&] { MigrationCodec::Decode(StepsEntity("e", -1e30)); }));
  assert(Throws<util::ValidationError>([&] { MigrationCodec::Decode(StepsEntity("e", 9223372036854775808.0)); }));
  assert(Throws<util::ValidationError>([&] { MigrationCodec::Decode(StepsEntity("e", std::numeric_limits<double>::infinity())); }));
  assert(Throws<util::ValidationError>([&] { MigrationCodec::Decode(StepsEntity("e", std::numeric_limits<double>::quiet_NaN())); }));

  // largest double below 2^63
  const auto entity = MigrationCodec::Decode(StepsEntity("e", 9223372036854774784.0));
  assert(std::get<model::StepsRecord>(std::get<model::RecordPayload>(entity.payload).record).count == 9223372036854774784LL);

  auto heart_rate = StepsEntity("hr", 0);
  auto record     = heart_rate.mutable_record()->mutable_record();
  record->set_record_type(v1::RECORD_TYPE_HEART_RATE);
  auto sample = record->add_samples();
  sample->set_value(1e19);
  sample->mutable_time()->set_seconds(1030);
  assert(Throws<util::ValidationError>([&] { MigrationCodec::Decode(heart_rate); }));
}

void TestJsonParsing() {
  const auto wire = MigrationCodec::ParseJson(
      R"({"entityId":"meta-1","payloadKind":"PAYLOAD_KIND_METADATA","metadata":{"recordRetentionPeriodDays":14}})");
  const auto entity = MigrationCodec::Decode(wire);
  assert(std::get<model::MetadataPayload>(entity.payload).record_retention_period_days == 14);

  assert(Throws<util::ValidationError>([&] { MigrationCodec::ParseJson("{not json"); }));
  assert(Throws<util::ValidationError>([&] { MigrationCodec::ParseBinary("\xff\xff\xff"); }));

  const auto json = MigrationCodec::ToJson(wire);
  assert(MigrationCodec::ParseJson(json).metadata().record_retention_period_days() == 14);
}

void TestUndecodableEntitiesAreReportedWithBatch() {
  healthstore::testing::TempStore store("codec_batch_failures");
  auto&                           migration = *store.app().migration_service;

  v1::MigrationBatch batch;
  *batch.add_entities() = StepsEntity("good", 10);
  auto bad              = StepsEntity("bad", 10);
  bad.set_payload_kind(v1::PAYLOAD_KIND_UNSPECIFIED);
  *batch.add_entities() = bad;

  migration.StartMigration();
  std::vector<util::EntityFailure> failures;
  try {
    migration.WriteMigrationData(batch);
  } catch (const util::MigrationEntityError& e) {
    failures = e.Failures();
  }
  migration.FinishMigration();

  assert(failures.size() == 1);
  assert(failures.front().entity_id == "bad");
  assert(failures.front().kind == util::EntityFailureKind::kUnsupportedType);

  core::ReadRecordsRequest request;
  request.record_type = model::RecordType::kSteps;
  assert(store.app().health_data_service->ReadRecords(request).size() == 1);
}

} // namespace

int main() {
  TestDecodesRecordEntity();
  TestEncodeMatchesDecode();
  TestUnsupportedPayloadKinds();
  TestMalformedRecords();
  TestTimestampsBeyondNanosecondClockRange();
  TestTimestampsOutsideProtoRangeAreRejected();
  TestWholeNumbersOutsideInt64AreRejected();
  TestJsonParsing();
  TestUndecodableEntitiesAreReportedWithBatch();

  std::cout << "health_store_unit_migration_codec: pass\n";
  return 0;
}
