#pragma once

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

#include "internal/model/record_type.hpp"

namespace healthstore::model {

struct Device {
  std::string  manufacturer;
  std::string  model;
  std::int32_t type = 0;

  bool operator==(const Device&) const = default;
};

/*
  Store-owned identity (id, package_name, last_modified_time_ms) is
  assigned on insert; callers only supply the client fields.
*/
struct RecordMetadata {
  std::string  id;
  std::string  package_name;
  std::string  client_record_id;
  std::int64_t client_record_version = 0;
  Device       device;
  std::int64_t last_modified_time_ms = 0;

  bool operator==(const RecordMetadata&) const = default;
};

struct InstantTime {
  std::int64_t time_ms             = 0;
  std::int32_t zone_offset_seconds = 0;

  bool operator==(const InstantTime&) const = default;
};

/*
  Start/end pair with end strictly after start. The only way to
  obtain one is Create(), so every IntervalTime is valid.
*/
class IntervalTime {
 public:
  // Throws util::ValidationError unless end_ms > start_ms.
  static IntervalTime Create(std::int64_t start_ms, std::int32_t start_zone_offset_seconds, std::int64_t end_ms,
                             std::int32_t end_zone_offset_seconds);

  std::int64_t StartTimeMs() const {
    return start_ms_;
  }
  std::int32_t StartZoneOffsetSeconds() const {
    return start_zone_offset_seconds_;
  }
  std::int64_t EndTimeMs() const {
    return end_ms_;
  }
  std::int32_t EndZoneOffsetSeconds() const {
    return end_zone_offset_seconds_;
  }

  bool operator==(const IntervalTime&) const = default;

 private:
  IntervalTime(std::int64_t start_ms, std::int32_t start_offset, std::int64_t end_ms, std::int32_t end_offset)
      : start_ms_(start_ms), start_zone_offset_seconds_(start_offset), end_ms_(end_ms), end_zone_offset_seconds_(end_offset) {
  }

  std::int64_t start_ms_;
  std::int32_t start_zone_offset_seconds_;
  std::int64_t end_ms_;
  std::int32_t end_zone_offset_seconds_;
};

template <typename V>
struct SeriesSample {
  V            value{};
  std::int64_t epoch_millis = 0;

  bool operator==(const SeriesSample&) const = default;
};

// ------------------------------------------------------------------
// Instant records
// ------------------------------------------------------------------

struct HeightRecord {
  static constexpr RecordType kRecordType = RecordType::kHeight;

  RecordMetadata metadata;
  InstantTime    time;
  double         height_meters = 0;

  bool operator==(const HeightRecord&) const = default;
};

struct WeightRecord {
  static constexpr RecordType kRecordType = RecordType::kWeight;

  RecordMetadata metadata;
  InstantTime    time;
  double         weight_grams = 0;

  bool operator==(const WeightRecord&) const = default;
};

struct LeanBodyMassRecord {
  static constexpr RecordType kRecordType = RecordType::kLeanBodyMass;

  RecordMetadata metadata;
  InstantTime    time;
  double         mass_grams = 0;

  bool operator==(const LeanBodyMassRecord&) const = default;
};

struct BodyFatRecord {
  static constexpr RecordType kRecordType = RecordType::kBodyFat;

  RecordMetadata metadata;
  InstantTime    time;
  double         percentage = 0;

  bool operator==(const BodyFatRecord&) const = default;
};

struct RestingHeartRateRecord {
  static constexpr RecordType kRecordType = RecordType::kRestingHeartRate;

  RecordMetadata metadata;
  InstantTime    time;
  std::int64_t   beats_per_minute = 0;

  bool operator==(const RestingHeartRateRecord&) const = default;
};

struct BasalMetabolicRateRecord {
  static constexpr RecordType kRecordType = RecordType::kBasalMetabolicRate;

  RecordMetadata metadata;
  InstantTime    time;
  double         basal_metabolic_rate_watts = 0;

  bool operator==(const BasalMetabolicRateRecord&) const = default;
};

// ------------------------------------------------------------------
// Interval records
// ------------------------------------------------------------------

struct StepsRecord {
  static constexpr RecordType kRecordType = RecordType::kSteps;

  RecordMetadata metadata;
  IntervalTime   interval;
  std::int64_t   count = 0;

  bool operator==(const StepsRecord&) const = default;
};

struct DistanceRecord {
  static constexpr RecordType kRecordType = RecordType::kDistance;

  RecordMetadata metadata;
  IntervalTime   interval;
  double         distance_meters = 0;

  bool operator==(const DistanceRecord&) const = default;
};

struct ActiveCaloriesBurnedRecord {
  static constexpr RecordType kRecordType = RecordType::kActiveCaloriesBurned;

  RecordMetadata metadata;
  IntervalTime   interval;
  double         energy_calories = 0;

  bool operator==(const ActiveCaloriesBurnedRecord&) const = default;
};

// ------------------------------------------------------------------
// Series records: {metadata, interval, samples} in that order.
// Samples keep caller order; they are not sorted or checked.
// ------------------------------------------------------------------

struct HeartRateRecord {
  static constexpr RecordType kRecordType = RecordType::kHeartRate;
  using Sample                            = SeriesSample<std::int64_t>;  // beats per minute

  RecordMetadata      metadata;
  IntervalTime        interval;
  std::vector<Sample> samples;

  bool operator==(const HeartRateRecord&) const = default;
};

struct SpeedRecord {
  static constexpr RecordType kRecordType = RecordType::kSpeed;
  using Sample                            = SeriesSample<double>;  // meters per second

  RecordMetadata      metadata;
  IntervalTime        interval;
  std::vector<Sample> samples;

  bool operator==(const SpeedRecord&) const = default;
};

struct PowerRecord {
  static constexpr RecordType kRecordType = RecordType::kPower;
  using Sample                            = SeriesSample<double>;  // watts

  RecordMetadata      metadata;
  IntervalTime        interval;
  std::vector<Sample> samples;

  bool operator==(const PowerRecord&) const = default;
};

struct StepsCadenceRecord {
  static constexpr RecordType kRecordType = RecordType::kStepsCadence;
  using Sample                            = SeriesSample<double>;  // steps per minute

  RecordMetadata      metadata;
  IntervalTime        interval;
  std::vector<Sample> samples;

  bool operator==(const StepsCadenceRecord&) const = default;
};

/*
  The closed set of record kinds. Adding an alternative without a
  matching record helper fails to compile.
*/
using Record = std::variant<StepsRecord, HeartRateRecord, BasalMetabolicRateRecord, PowerRecord, SpeedRecord, StepsCadenceRecord,
                            DistanceRecord, ActiveCaloriesBurnedRecord, BodyFatRecord, HeightRecord, LeanBodyMassRecord,
                            RestingHeartRateRecord, WeightRecord>;

RecordType TypeOf(const Record& record);

RecordMetadata&       MetadataOf(Record& record);
const RecordMetadata& MetadataOf(const Record& record);

// Start of the record's time span: instant time or interval start.
std::int64_t StartTimeOf(const Record& record);

} // namespace healthstore::model
