#include "migration_codec.hpp"

#include <google/protobuf/util/json_util.h>

#include <cmath>
#include <type_traits>

#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace healthstore::migration {

namespace {

std::int64_t ToMillis(const google::protobuf::Timestamp& ts) {
  return util::TimestampToMillis(ts);
}

google::protobuf::Timestamp FromMillis(std::int64_t ms) {
  return util::MillisToTimestamp(ms);
}

model::RecordMetadata DecodeMetadata(const v1::RecordMetadata& wire) {
  model::RecordMetadata metadata;
  metadata.client_record_id      = wire.client_record_id();
  metadata.client_record_version = wire.client_record_version();
  metadata.device.manufacturer   = wire.device().manufacturer();
  metadata.device.model          = wire.device().model();
  metadata.device.type           = wire.device().type();
  if (wire.has_last_modified_time()) {
    metadata.last_modified_time_ms = ToMillis(wire.last_modified_time());
  }
  return metadata;
}

void EncodeMetadata(const model::RecordMetadata& metadata, v1::RecordMetadata* wire) {
  wire->set_client_record_id(metadata.client_record_id);
  wire->set_client_record_version(metadata.client_record_version);
  wire->mutable_device()->set_manufacturer(metadata.device.manufacturer);
  wire->mutable_device()->set_model(metadata.device.model);
  wire->mutable_device()->set_type(metadata.device.type);
  if (metadata.last_modified_time_ms != 0) {
    *wire->mutable_last_modified_time() = FromMillis(metadata.last_modified_time_ms);
  }
}

model::InstantTime DecodeInstant(const v1::Record& wire) {
  if (!wire.has_instant()) {
    throw util::ValidationError("record of type " + v1::RecordType_Name(wire.record_type()) + " needs an instant time");
  }
  return {ToMillis(wire.instant().time()), wire.instant().zone_offset_seconds()};
}

model::IntervalTime DecodeInterval(const v1::Record& wire) {
  if (!wire.has_interval()) {
    throw util::ValidationError("record of type " + v1::RecordType_Name(wire.record_type()) + " needs an interval time");
  }
  const auto& interval = wire.interval();
  return model::IntervalTime::Create(ToMillis(interval.start_time()), interval.start_zone_offset_seconds(), ToMillis(interval.end_time()),
                                     interval.end_zone_offset_seconds());
}

// Doubles in [-2^63, 2^63) convert to int64 exactly.
constexpr double kInt64Lower = -9223372036854775808.0;
constexpr double kInt64Upper = 9223372036854775808.0;

std::int64_t ToWholeNumber(double value, std::string_view field) {
  if (!std::isfinite(value) || std::trunc(value) != value) {
    throw util::ValidationError(std::string(field) + " must be a whole number");
  }
  if (value < kInt64Lower || value >= kInt64Upper) {
    throw util::ValidationError(std::string(field) + " is out of range");
  }
  return static_cast<std::int64_t>(value);
}

template <typename T>
T DecodeSeries(const v1::Record& wire, model::RecordMetadata metadata) {
  T record{std::move(metadata), DecodeInterval(wire), {}};
  for (const auto& sample : wire.samples()) {
    using Value = decltype(T::Sample::value);
    Value value;
    if constexpr (std::is_integral_v<Value>) {
      value = ToWholeNumber(sample.value(), "series sample value");
    } else {
      value = sample.value();
    }
    record.samples.push_back({value, ToMillis(sample.time())});
  }
  return record;
}

template <typename T>
void EncodeSamples(const T& record, v1::Record* wire) {
  for (const auto& sample : record.samples) {
    auto* out = wire->add_samples();
    out->set_value(static_cast<double>(sample.value));
    *out->mutable_time() = FromMillis(sample.epoch_millis);
  }
}

// Scalar value of the kinds that carry one.
double ScalarValue(const model::HeightRecord& r) { return r.height_meters; }
double ScalarValue(const model::WeightRecord& r) { return r.weight_grams; }
double ScalarValue(const model::LeanBodyMassRecord& r) { return r.mass_grams; }
double ScalarValue(const model::BodyFatRecord& r) { return r.percentage; }
double ScalarValue(const model::RestingHeartRateRecord& r) { return static_cast<double>(r.beats_per_minute); }
double ScalarValue(const model::BasalMetabolicRateRecord& r) { return r.basal_metabolic_rate_watts; }
double ScalarValue(const model::StepsRecord& r) { return static_cast<double>(r.count); }
double ScalarValue(const model::DistanceRecord& r) { return r.distance_meters; }
double ScalarValue(const model::ActiveCaloriesBurnedRecord& r) { return r.energy_calories; }

std::string Describe(const v1::MigrationEntity& wire) {
  return "entity '" + wire.entity_id() + "'";
}

v1::MigrationEntity::PayloadCase ExpectedPayloadCase(v1::PayloadKind kind) {
  switch (kind) {
    case v1::PAYLOAD_KIND_RECORD:
      return v1::MigrationEntity::kRecord;
    case v1::PAYLOAD_KIND_PERMISSIONS:
      return v1::MigrationEntity::kPermissions;
    case v1::PAYLOAD_KIND_PRIORITY:
      return v1::MigrationEntity::kPriority;
    case v1::PAYLOAD_KIND_APP_INFO:
      return v1::MigrationEntity::kAppInfo;
    case v1::PAYLOAD_KIND_METADATA:
      return v1::MigrationEntity::kMetadata;
    default:
      return v1::MigrationEntity::PAYLOAD_NOT_SET;
  }
}

} // namespace

model::Record MigrationCodec::DecodeRecord(const v1::Record& wire) {
  const auto type = model::RecordTypeFromId(static_cast<std::int32_t>(wire.record_type()));
  if (!type) {
    throw util::UnsupportedType("unsupported record type " + std::to_string(static_cast<int>(wire.record_type())));
  }

  auto metadata = DecodeMetadata(wire.metadata());
  switch (*type) {
    case model::RecordType::kHeight:
      return model::HeightRecord{std::move(metadata), DecodeInstant(wire), wire.value()};
    case model::RecordType::kWeight:
      return model::WeightRecord{std::move(metadata), DecodeInstant(wire), wire.value()};
    case model::RecordType::kLeanBodyMass:
      return model::LeanBodyMassRecord{std::move(metadata), DecodeInstant(wire), wire.value()};
    case model::RecordType::kBodyFat:
      return model::BodyFatRecord{std::move(metadata), DecodeInstant(wire), wire.value()};
    case model::RecordType::kRestingHeartRate:
      return model::RestingHeartRateRecord{std::move(metadata), DecodeInstant(wire), ToWholeNumber(wire.value(), "resting heart rate")};
    case model::RecordType::kBasalMetabolicRate:
      return model::BasalMetabolicRateRecord{std::move(metadata), DecodeInstant(wire), wire.value()};
    case model::RecordType::kSteps:
      return model::StepsRecord{std::move(metadata), DecodeInterval(wire), ToWholeNumber(wire.value(), "step count")};
    case model::RecordType::kDistance:
      return model::DistanceRecord{std::move(metadata), DecodeInterval(wire), wire.value()};
    case model::RecordType::kActiveCaloriesBurned:
      return model::ActiveCaloriesBurnedRecord{std::move(metadata), DecodeInterval(wire), wire.value()};
    case model::RecordType::kHeartRate:
      return DecodeSeries<model::HeartRateRecord>(wire, std::move(metadata));
    case model::RecordType::kSpeed:
      return DecodeSeries<model::SpeedRecord>(wire, std::move(metadata));
    case model::RecordType::kPower:
      return DecodeSeries<model::PowerRecord>(wire, std::move(metadata));
    case model::RecordType::kStepsCadence:
      return DecodeSeries<model::StepsCadenceRecord>(wire, std::move(metadata));
    case model::RecordType::kUnknown:
      break;
  }
  throw util::UnsupportedType("unsupported record type " + std::to_string(model::ToId(*type)));
}

v1::Record MigrationCodec::EncodeRecord(const model::Record& record) {
  v1::Record wire;
  wire.set_record_type(static_cast<v1::RecordType>(model::ToId(model::TypeOf(record))));
  EncodeMetadata(model::MetadataOf(record), wire.mutable_metadata());

  std::visit(
      [&](const auto& r) {
        if constexpr (requires { r.time.time_ms; }) {
          *wire.mutable_instant()->mutable_time() = FromMillis(r.time.time_ms);
          wire.mutable_instant()->set_zone_offset_seconds(r.time.zone_offset_seconds);
        } else {
          auto* interval                  = wire.mutable_interval();
          *interval->mutable_start_time() = FromMillis(r.interval.StartTimeMs());
          interval->set_start_zone_offset_seconds(r.interval.StartZoneOffsetSeconds());
          *interval->mutable_end_time() = FromMillis(r.interval.EndTimeMs());
          interval->set_end_zone_offset_seconds(r.interval.EndZoneOffsetSeconds());
        }

        if constexpr (requires { r.samples; }) {
          EncodeSamples(r, &wire);
        } else {
          wire.set_value(ScalarValue(r));
        }
      },
      record);
  return wire;
}

model::MigrationEntity MigrationCodec::Decode(const v1::MigrationEntity& wire) {
  const auto expected = ExpectedPayloadCase(wire.payload_kind());
  if (expected == v1::MigrationEntity::PAYLOAD_NOT_SET) {
    throw util::UnsupportedType(Describe(wire) + " has unsupported payload kind " + std::to_string(static_cast<int>(wire.payload_kind())));
  }
  if (wire.payload_case() != expected) {
    throw util::UnsupportedType(Describe(wire) + " payload does not match payload kind " + v1::PayloadKind_Name(wire.payload_kind()));
  }

  try {
    return DecodePayload(wire);
  } catch (const util::UnsupportedType& e) {
    throw util::UnsupportedType(Describe(wire) + ": " + e.what());
  } catch (const util::ValidationError& e) {
    throw util::ValidationError(Describe(wire) + ": " + e.what());
  }
}

model::MigrationEntity MigrationCodec::DecodePayload(const v1::MigrationEntity& wire) {
  model::MigrationEntity entity{wire.entity_id(), model::MetadataPayload{}};
  switch (wire.payload_case()) {
    case v1::MigrationEntity::kRecord:
      entity.payload = model::RecordPayload{wire.record().origin_package_name(), DecodeRecord(wire.record().record())};
      break;
    case v1::MigrationEntity::kPermissions: {
      const auto& p = wire.permissions();
      entity.payload = model::PermissionPayload{p.package_name(), p.has_first_grant_time() ? ToMillis(p.first_grant_time()) : 0,
                                                {p.permissions().begin(), p.permissions().end()}};
      break;
    }
    case v1::MigrationEntity::kPriority: {
      const auto& p        = wire.priority();
      const auto  category = model::CategoryFromId(p.data_category());
      if (!category || *category == model::HealthDataCategory::kUnknown) {
        throw util::ValidationError("unknown data category " + std::to_string(p.data_category()));
      }
      entity.payload = model::PriorityPayload{*category, {p.package_names().begin(), p.package_names().end()}};
      break;
    }
    case v1::MigrationEntity::kAppInfo: {
      const auto& p = wire.app_info();
      entity.payload = model::AppInfoPayload{p.package_name(), p.app_name(), {p.app_icon().begin(), p.app_icon().end()}};
      break;
    }
    case v1::MigrationEntity::kMetadata:
      entity.payload = model::MetadataPayload{wire.metadata().record_retention_period_days()};
      break;
    case v1::MigrationEntity::PAYLOAD_NOT_SET:
      break;
  }
  return entity;
}

v1::MigrationEntity MigrationCodec::Encode(const model::MigrationEntity& entity) {
  v1::MigrationEntity wire;
  wire.set_entity_id(entity.entity_id);

  std::visit(
      [&](const auto& p) {
        using T = std::decay_t<decltype(p)>;
        if constexpr (std::is_same_v<T, model::RecordPayload>) {
          wire.set_payload_kind(v1::PAYLOAD_KIND_RECORD);
          wire.mutable_record()->set_origin_package_name(p.origin_package_name);
          *wire.mutable_record()->mutable_record() = EncodeRecord(p.record);
        } else if constexpr (std::is_same_v<T, model::PermissionPayload>) {
          wire.set_payload_kind(v1::PAYLOAD_KIND_PERMISSIONS);
          auto* out = wire.mutable_permissions();
          out->set_package_name(p.package_name);
          if (p.first_grant_time_ms != 0) {
            *out->mutable_first_grant_time() = FromMillis(p.first_grant_time_ms);
          }
          for (const auto& permission : p.permissions) out->add_permissions(permission);
        } else if constexpr (std::is_same_v<T, model::PriorityPayload>) {
          wire.set_payload_kind(v1::PAYLOAD_KIND_PRIORITY);
          auto* out = wire.mutable_priority();
          out->set_data_category(model::ToId(p.data_category));
          for (const auto& package : p.package_names) out->add_package_names(package);
        } else if constexpr (std::is_same_v<T, model::AppInfoPayload>) {
          wire.set_payload_kind(v1::PAYLOAD_KIND_APP_INFO);
          auto* out = wire.mutable_app_info();
          out->set_package_name(p.package_name);
          out->set_app_name(p.app_name);
          out->set_app_icon(std::string(p.app_icon.begin(), p.app_icon.end()));
        } else {
          static_assert(std::is_same_v<T, model::MetadataPayload>);
          wire.set_payload_kind(v1::PAYLOAD_KIND_METADATA);
          wire.mutable_metadata()->set_record_retention_period_days(p.record_retention_period_days);
        }
      },
      entity.payload);
  return wire;
}

v1::MigrationEntity MigrationCodec::ParseJson(const std::string& json) {
  v1::MigrationEntity wire;
  auto                status = google::protobuf::util::JsonStringToMessage(json, &wire);
  if (!status.ok()) {
    throw util::ValidationError("parse migration entity json: " + std::string(status.message()));
  }
  return wire;
}

v1::MigrationEntity MigrationCodec::ParseBinary(const std::string& bytes) {
  v1::MigrationEntity wire;
  if (!wire.ParseFromString(bytes)) {
    throw util::ValidationError("parse migration entity: malformed protobuf");
  }
  return wire;
}

std::string MigrationCodec::ToJson(const v1::MigrationEntity& wire) {
  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(wire, &json);
  if (!status.ok()) {
    throw util::InternalError("encode migration entity json: " + std::string(status.message()));
  }
  return json;
}

} // namespace healthstore::migration
