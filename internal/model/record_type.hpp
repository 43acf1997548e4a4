#pragma once

#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace healthstore::model {

// Stable ids; persisted in record tables, change logs and tokens.
enum class RecordType : std::int32_t {
  kUnknown              = 0,
  kSteps                = 1,
  kHeartRate            = 2,
  kBasalMetabolicRate   = 3,
  kPower                = 5,
  kSpeed                = 6,
  kStepsCadence         = 7,
  kDistance             = 8,
  kActiveCaloriesBurned = 13,
  kBodyFat              = 23,
  kHeight               = 27,
  kLeanBodyMass         = 29,
  kRestingHeartRate     = 33,
  kWeight               = 35,
};

enum class HealthDataCategory : std::int32_t {
  kUnknown          = 0,
  kActivity         = 1,
  kBodyMeasurements = 2,
  kCycleTracking    = 3,
  kNutrition        = 4,
  kSleep            = 5,
  kVitals           = 6,
};

const std::vector<RecordType>& AllRecordTypes();

std::optional<RecordType> RecordTypeFromId(std::int32_t id);
std::string_view          RecordTypeName(RecordType type);
HealthDataCategory        CategoryOf(RecordType type);

std::optional<HealthDataCategory> CategoryFromId(std::int32_t id);
std::string_view                  CategoryName(HealthDataCategory category);

constexpr std::int32_t ToId(RecordType type) {
  return static_cast<std::int32_t>(type);
}

constexpr std::int32_t ToId(HealthDataCategory category) {
  return static_cast<std::int32_t>(category);
}

} // namespace healthstore::model
