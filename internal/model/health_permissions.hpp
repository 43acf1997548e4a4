#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/model/record_type.hpp"

namespace healthstore::model {

inline constexpr std::string_view kHealthPermissionPrefix = "android.permission.health.";

enum class PermissionAccess {
  kRead,
  kWrite,
};

/*
  One permission type guards one or more record kinds; STEPS guards
  both steps and steps cadence.
*/
struct HealthPermissionType {
  std::string_view        name;
  HealthDataCategory      category;
  std::vector<RecordType> record_types;
};

struct HealthPermissionInfo {
  std::string                 name;
  PermissionAccess            access;
  const HealthPermissionType* type;
};

const std::vector<HealthPermissionType>& AllHealthPermissionTypes();

// Full permission name, e.g. android.permission.health.WRITE_STEPS
std::string PermissionName(PermissionAccess access, std::string_view type_name);

std::optional<HealthPermissionInfo> LookupHealthPermission(std::string_view permission);

bool IsValidHealthPermission(std::string_view permission);

std::vector<std::string> WritePermissionsForCategory(HealthDataCategory category);

} // namespace healthstore::model
