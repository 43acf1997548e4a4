#include "record_type.hpp"

namespace healthstore::model {

const std::vector<RecordType>& AllRecordTypes() {
  static const std::vector<RecordType> kTypes = {
      RecordType::kSteps,        RecordType::kHeartRate, RecordType::kBasalMetabolicRate, RecordType::kPower,
      RecordType::kSpeed,        RecordType::kStepsCadence, RecordType::kDistance,        RecordType::kActiveCaloriesBurned,
      RecordType::kBodyFat,      RecordType::kHeight,    RecordType::kLeanBodyMass,       RecordType::kRestingHeartRate,
      RecordType::kWeight,
  };
  return kTypes;
}

std::optional<RecordType> RecordTypeFromId(std::int32_t id) {
  for (const auto type : AllRecordTypes()) {
    if (ToId(type) == id) {
      return type;
    }
  }
  return std::nullopt;
}

std::string_view RecordTypeName(RecordType type) {
  switch (type) {
    case RecordType::kSteps:
      return "STEPS";
    case RecordType::kHeartRate:
      return "HEART_RATE";
    case RecordType::kBasalMetabolicRate:
      return "BASAL_METABOLIC_RATE";
    case RecordType::kPower:
      return "POWER";
    case RecordType::kSpeed:
      return "SPEED";
    case RecordType::kStepsCadence:
      return "STEPS_CADENCE";
    case RecordType::kDistance:
      return "DISTANCE";
    case RecordType::kActiveCaloriesBurned:
      return "ACTIVE_CALORIES_BURNED";
    case RecordType::kBodyFat:
      return "BODY_FAT";
    case RecordType::kHeight:
      return "HEIGHT";
    case RecordType::kLeanBodyMass:
      return "LEAN_BODY_MASS";
    case RecordType::kRestingHeartRate:
      return "RESTING_HEART_RATE";
    case RecordType::kWeight:
      return "WEIGHT";
    case RecordType::kUnknown:
      break;
  }
  return "UNKNOWN";
}

HealthDataCategory CategoryOf(RecordType type) {
  switch (type) {
    case RecordType::kSteps:
    case RecordType::kPower:
    case RecordType::kSpeed:
    case RecordType::kStepsCadence:
    case RecordType::kDistance:
    case RecordType::kActiveCaloriesBurned:
      return HealthDataCategory::kActivity;
    case RecordType::kBasalMetabolicRate:
    case RecordType::kBodyFat:
    case RecordType::kHeight:
    case RecordType::kLeanBodyMass:
    case RecordType::kWeight:
      return HealthDataCategory::kBodyMeasurements;
    case RecordType::kHeartRate:
    case RecordType::kRestingHeartRate:
      return HealthDataCategory::kVitals;
    case RecordType::kUnknown:
      break;
  }
  return HealthDataCategory::kUnknown;
}

std::optional<HealthDataCategory> CategoryFromId(std::int32_t id) {
  if (id < ToId(HealthDataCategory::kActivity) || id > ToId(HealthDataCategory::kVitals)) {
    return std::nullopt;
  }
  return static_cast<HealthDataCategory>(id);
}

std::string_view CategoryName(HealthDataCategory category) {
  switch (category) {
    case HealthDataCategory::kActivity:
      return "ACTIVITY";
    case HealthDataCategory::kBodyMeasurements:
      return "BODY_MEASUREMENTS";
    case HealthDataCategory::kCycleTracking:
      return "CYCLE_TRACKING";
    case HealthDataCategory::kNutrition:
      return "NUTRITION";
    case HealthDataCategory::kSleep:
      return "SLEEP";
    case HealthDataCategory::kVitals:
      return "VITALS";
    case HealthDataCategory::kUnknown:
      break;
  }
  return "UNKNOWN";
}

} // namespace healthstore::model
