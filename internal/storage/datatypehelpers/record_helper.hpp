#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "internal/db/sql/sql_row.hpp"
#include "internal/model/record.hpp"
#include "internal/storage/request/create_table_request.hpp"
#include "internal/storage/request/delete_table_request.hpp"
#include "internal/storage/request/read_table_request.hpp"
#include "internal/storage/request/upsert_table_request.hpp"

namespace healthstore::storage {

using AppIdToPackageMap = std::unordered_map<std::int64_t, std::string>;

struct ReadRecordsFilter {
  std::vector<std::string>                 uuids;    // empty: any
  std::optional<std::vector<std::int64_t>> app_ids;  // nullopt: any, empty: none
  std::optional<std::int64_t>              start_time_ms;
  std::optional<std::int64_t>              end_time_ms;
};

/*
  Maps one record kind to its main table (and child tables) and back.

  Every main table carries the same identity and metadata columns;
  subclasses add their time and value columns. Helpers never own a
  connection: they build requests that the TransactionManager runs
  inside the caller's transaction, and read from cursors it returns.
*/
class RecordHelper {
 public:
  static constexpr std::string_view kPrimaryColumnName             = "row_id";
  static constexpr std::string_view kUuidColumnName                = "uuid";
  static constexpr std::string_view kAppInfoIdColumnName           = "app_info_id";
  static constexpr std::string_view kLastModifiedTimeColumnName    = "last_modified_time";
  static constexpr std::string_view kClientRecordIdColumnName      = "client_record_id";
  static constexpr std::string_view kClientRecordVersionColumnName = "client_record_version";
  static constexpr std::string_view kDeviceManufacturerColumnName  = "device_manufacturer";
  static constexpr std::string_view kDeviceModelColumnName         = "device_model";
  static constexpr std::string_view kDeviceTypeColumnName          = "device_type";

  virtual ~RecordHelper() = default;

  virtual model::RecordType GetRecordType() const = 0;
  virtual std::string       GetMainTableName() const = 0;

  // Column holding the start of the record's time span.
  virtual std::string GetStartTimeColumnName() const = 0;

  CreateTableRequest GetCreateTableRequest() const;

  // kReplace upserts on uuid, keeping the row id of an existing record.
  UpsertTableRequest GetUpsertTableRequest(const model::Record& record, std::int64_t app_info_id,
                                           ConflictPolicy policy = ConflictPolicy::kAbort) const;

  virtual ReadTableRequest GetReadTableRequest(const ReadRecordsFilter& filter) const;

  DeleteTableRequest GetDeleteTableRequest(const std::vector<std::string>& uuids) const;

  // Child rows to drop before an update rewrites them.
  virtual std::vector<DeleteTableRequest> GetChildDeleteTableRequests(const std::vector<std::string>& uuids) const {
    (void)uuids;
    return {};
  }

  // Consumes the whole cursor produced by GetReadTableRequest.
  virtual std::vector<model::Record> ReadRecords(db::sql::Cursor& cursor, const AppIdToPackageMap& packages) const = 0;

 protected:
  virtual std::vector<ColumnInfo> GetSpecificColumnInfo() const = 0;
  virtual void PopulateSpecificContentValues(ContentValues& values, const model::Record& record) const = 0;

  virtual std::vector<CreateTableRequest> GetChildTableCreateRequests() const {
    return {};
  }

  virtual std::vector<UpsertTableRequest> GetChildTableUpsertRequests(const model::Record& record) const {
    (void)record;
    return {};
  }

  model::RecordMetadata ReadMetadata(const db::sql::Row& row, const AppIdToPackageMap& packages) const;

  std::string Qualified(std::string_view column) const {
    return GetMainTableName() + "." + std::string(column);
  }
};

} // namespace healthstore::storage
