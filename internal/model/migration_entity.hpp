#pragma once

#include <cstdint>
#include <iterator>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "internal/model/record.hpp"
#include "internal/model/record_type.hpp"

namespace healthstore::model {

// Record written on behalf of origin_package_name, installed or not.
struct RecordPayload {
  std::string origin_package_name;
  Record      record;
};

struct PermissionPayload {
  std::string              package_name;
  std::int64_t             first_grant_time_ms = 0;
  std::vector<std::string> permissions;
};

struct PriorityPayload {
  HealthDataCategory       data_category = HealthDataCategory::kUnknown;
  std::vector<std::string> package_names;
};

struct AppInfoPayload {
  std::string               package_name;
  std::string               app_name;
  std::vector<std::uint8_t> app_icon;
};

struct MetadataPayload {
  std::int32_t record_retention_period_days = 0;
};

using MigrationPayload = std::variant<RecordPayload, PermissionPayload, PriorityPayload, AppInfoPayload, MetadataPayload>;

struct MigrationEntity {
  std::string      entity_id;
  MigrationPayload payload;
};

inline std::string_view PayloadKindName(const MigrationPayload& payload) {
  constexpr std::string_view kNames[] = {"RECORD", "PERMISSIONS", "PRIORITY", "APP_INFO", "METADATA"};
  static_assert(std::size(kNames) == std::variant_size_v<MigrationPayload>);
  return kNames[payload.index()];
}

} // namespace healthstore::model
