#include "record_helper.hpp"

#include "internal/storage/datatypehelpers/app_info_helper.hpp"
#include "internal/storage/utils/storage_utils.hpp"
#include "internal/util/errors.hpp"

namespace healthstore::storage {

CreateTableRequest RecordHelper::GetCreateTableRequest() const {
  std::vector<ColumnInfo> columns = {
      {std::string(kPrimaryColumnName), kPrimaryAutoincrement},
      {std::string(kUuidColumnName), kTextNotNullUnique},
      {std::string(kAppInfoIdColumnName), kIntegerNotNull},
      {std::string(kLastModifiedTimeColumnName), kIntegerNotNull},
      {std::string(kClientRecordIdColumnName), kTextNull},
      {std::string(kClientRecordVersionColumnName), kInteger},
      {std::string(kDeviceManufacturerColumnName), kTextNull},
      {std::string(kDeviceModelColumnName), kTextNull},
      {std::string(kDeviceTypeColumnName), kInteger},
  };
  for (auto& column : GetSpecificColumnInfo()) {
    columns.push_back(std::move(column));
  }

  CreateTableRequest request(GetMainTableName(), std::move(columns));
  request.AddForeignKey({std::string(kAppInfoIdColumnName), std::string(AppInfoHelper::kTableName),
                        std::string(AppInfoHelper::kPrimaryColumnName), true});
  request.CreateIndexOn(GetStartTimeColumnName());
  request.CreateIndexOn(std::string(kAppInfoIdColumnName));
  request.SetChildTableRequests(GetChildTableCreateRequests());
  return request;
}

UpsertTableRequest RecordHelper::GetUpsertTableRequest(const model::Record& record, std::int64_t app_info_id, ConflictPolicy policy) const {
  if (model::TypeOf(record) != GetRecordType()) {
    throw util::InternalError("record helper for " + std::string(model::RecordTypeName(GetRecordType())) + " given a " +
                              std::string(model::RecordTypeName(model::TypeOf(record))) + " record");
  }

  const auto& metadata = model::MetadataOf(record);
  if (metadata.id.empty()) {
    throw util::InternalError("record written without a uuid");
  }

  ContentValues values;
  values.Put(std::string(kUuidColumnName), metadata.id);
  values.Put(std::string(kAppInfoIdColumnName), app_info_id);
  values.Put(std::string(kLastModifiedTimeColumnName), metadata.last_modified_time_ms);
  values.Put(std::string(kClientRecordIdColumnName), metadata.client_record_id);
  values.Put(std::string(kClientRecordVersionColumnName), metadata.client_record_version);
  values.Put(std::string(kDeviceManufacturerColumnName), metadata.device.manufacturer);
  values.Put(std::string(kDeviceModelColumnName), metadata.device.model);
  values.Put(std::string(kDeviceTypeColumnName), metadata.device.type);
  PopulateSpecificContentValues(values, record);

  UpsertTableRequest request(GetMainTableName(), std::move(values));
  request.SetConflict({std::string(kUuidColumnName)}, policy);
  request.SetChildTableRequests(GetChildTableUpsertRequests(record));
  return request;
}

ReadTableRequest RecordHelper::GetReadTableRequest(const ReadRecordsFilter& filter) const {
  WhereClauses where;
  if (!filter.uuids.empty()) {
    where.AddWhereInClause(Qualified(kUuidColumnName), filter.uuids);
  }
  if (filter.app_ids) {
    where.AddWhereInIntsClause(Qualified(kAppInfoIdColumnName), *filter.app_ids);
  }
  if (filter.start_time_ms) {
    where.AddWhereGreaterThanOrEqualClause(Qualified(GetStartTimeColumnName()), *filter.start_time_ms);
  }
  if (filter.end_time_ms) {
    where.AddWhereLessThanClause(Qualified(GetStartTimeColumnName()), *filter.end_time_ms);
  }

  ReadTableRequest request(GetMainTableName());
  request.SetWhereClause(std::move(where));
  request.SetOrderBy({Qualified(kPrimaryColumnName) + " ASC"});
  return request;
}

DeleteTableRequest RecordHelper::GetDeleteTableRequest(const std::vector<std::string>& uuids) const {
  WhereClauses where;
  where.AddWhereInClause(std::string(kUuidColumnName), uuids);
  return DeleteTableRequest(GetMainTableName(), std::move(where));
}

model::RecordMetadata RecordHelper::ReadMetadata(const db::sql::Row& row, const AppIdToPackageMap& packages) const {
  model::RecordMetadata metadata;
  metadata.id = GetCursorString(row, kUuidColumnName);

  const auto app_id  = GetCursorLong(row, kAppInfoIdColumnName);
  const auto package = packages.find(app_id);
  if (package == packages.end()) {
    throw util::InternalError("record " + metadata.id + " references unknown app info id " + std::to_string(app_id));
  }
  metadata.package_name = package->second;

  metadata.last_modified_time_ms = GetCursorLong(row, kLastModifiedTimeColumnName);
  metadata.client_record_id      = GetCursorString(row, kClientRecordIdColumnName);
  metadata.client_record_version = GetCursorLong(row, kClientRecordVersionColumnName);
  metadata.device.manufacturer   = GetCursorString(row, kDeviceManufacturerColumnName);
  metadata.device.model          = GetCursorString(row, kDeviceModelColumnName);
  metadata.device.type           = GetCursorInt(row, kDeviceTypeColumnName);
  return metadata;
}

} // namespace healthstore::storage
