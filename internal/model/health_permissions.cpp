#include "health_permissions.hpp"

namespace healthstore::model {
namespace {

constexpr std::string_view kReadPrefix  = "READ_";
constexpr std::string_view kWritePrefix = "WRITE_";

} // namespace

const std::vector<HealthPermissionType>& AllHealthPermissionTypes() {
  static const std::vector<HealthPermissionType> kTypes = {
      {"ACTIVE_CALORIES_BURNED", HealthDataCategory::kActivity, {RecordType::kActiveCaloriesBurned}},
      {"DISTANCE", HealthDataCategory::kActivity, {RecordType::kDistance}},
      {"POWER", HealthDataCategory::kActivity, {RecordType::kPower}},
      {"SPEED", HealthDataCategory::kActivity, {RecordType::kSpeed}},
      {"STEPS", HealthDataCategory::kActivity, {RecordType::kSteps, RecordType::kStepsCadence}},
      {"BASAL_METABOLIC_RATE", HealthDataCategory::kBodyMeasurements, {RecordType::kBasalMetabolicRate}},
      {"BODY_FAT", HealthDataCategory::kBodyMeasurements, {RecordType::kBodyFat}},
      {"HEIGHT", HealthDataCategory::kBodyMeasurements, {RecordType::kHeight}},
      {"LEAN_BODY_MASS", HealthDataCategory::kBodyMeasurements, {RecordType::kLeanBodyMass}},
      {"WEIGHT", HealthDataCategory::kBodyMeasurements, {RecordType::kWeight}},
      {"HEART_RATE", HealthDataCategory::kVitals, {RecordType::kHeartRate}},
      {"RESTING_HEART_RATE", HealthDataCategory::kVitals, {RecordType::kRestingHeartRate}},
  };
  return kTypes;
}

std::string PermissionName(PermissionAccess access, std::string_view type_name) {
  std::string name(kHealthPermissionPrefix);
  name += access == PermissionAccess::kRead ? kReadPrefix : kWritePrefix;
  name += type_name;
  return name;
}

std::optional<HealthPermissionInfo> LookupHealthPermission(std::string_view permission) {
  if (permission.substr(0, kHealthPermissionPrefix.size()) != kHealthPermissionPrefix) {
    return std::nullopt;
  }
  auto rest = permission.substr(kHealthPermissionPrefix.size());

  PermissionAccess access;
  if (rest.substr(0, kReadPrefix.size()) == kReadPrefix) {
    access = PermissionAccess::kRead;
    rest.remove_prefix(kReadPrefix.size());
  } else if (rest.substr(0, kWritePrefix.size()) == kWritePrefix) {
    access = PermissionAccess::kWrite;
    rest.remove_prefix(kWritePrefix.size());
  } else {
    return std::nullopt;
  }

  for (const auto& type : AllHealthPermissionTypes()) {
    if (type.name == rest) {
      return HealthPermissionInfo{std::string(permission), access, &type};
    }
  }
  return std::nullopt;
}

bool IsValidHealthPermission(std::string_view permission) {
  return LookupHealthPermission(permission).has_value();
}

std::vector<std::string> WritePermissionsForCategory(HealthDataCategory category) {
  std::vector<std::string> permissions;
  for (const auto& type : AllHealthPermissionTypes()) {
    if (type.category == category) {
      permissions.push_back(PermissionName(PermissionAccess::kWrite, type.name));
    }
  }
  return permissions;
}

} // namespace healthstore::model
