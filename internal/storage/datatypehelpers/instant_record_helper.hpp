#pragma once

#include <string>
#include <vector>

#include "internal/storage/datatypehelpers/record_helper.hpp"
#include "internal/storage/utils/storage_utils.hpp"

namespace healthstore::storage {

/*
  Record kinds measured at a single instant: one row per record,
  time + zone offset + kind-specific value columns.
*/
template <typename T>
class InstantRecordHelper : public RecordHelper {
 public:
  static constexpr std::string_view kTimeColumnName       = "time";
  static constexpr std::string_view kZoneOffsetColumnName = "zone_offset";

  model::RecordType GetRecordType() const final {
    return T::kRecordType;
  }

  std::string GetStartTimeColumnName() const final {
    return std::string(kTimeColumnName);
  }

  std::vector<model::Record> ReadRecords(db::sql::Cursor& cursor, const AppIdToPackageMap& packages) const final {
    std::vector<model::Record> records;
    while (cursor.MoveToNext()) {
      model::InstantTime time{GetCursorLong(cursor, kTimeColumnName), GetCursorInt(cursor, kZoneOffsetColumnName)};
      records.emplace_back(BuildRecord(cursor, ReadMetadata(cursor, packages), time));
    }
    return records;
  }

 protected:
  virtual std::vector<ColumnInfo> GetInstantRecordColumnInfo() const = 0;
  virtual void PopulateInstantRecordValues(ContentValues& values, const T& record) const = 0;
  virtual T BuildRecord(const db::sql::Row& row, model::RecordMetadata metadata, model::InstantTime time) const = 0;

  std::vector<ColumnInfo> GetSpecificColumnInfo() const final {
    std::vector<ColumnInfo> columns = {
        {std::string(kTimeColumnName), kIntegerNotNull},
        {std::string(kZoneOffsetColumnName), kInteger},
    };
    for (auto& column : GetInstantRecordColumnInfo()) {
      columns.push_back(std::move(column));
    }
    return columns;
  }

  void PopulateSpecificContentValues(ContentValues& values, const model::Record& record) const final {
    const auto& typed = std::get<T>(record);
    values.Put(std::string(kTimeColumnName), typed.time.time_ms);
    values.Put(std::string(kZoneOffsetColumnName), typed.time.zone_offset_seconds);
    PopulateInstantRecordValues(values, typed);
  }
};

} // namespace healthstore::storage
