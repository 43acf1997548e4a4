#pragma once

#include <string>
#include <vector>

#include "internal/storage/datatypehelpers/record_helper.hpp"
#include "internal/storage/utils/storage_utils.hpp"
#include "internal/util/errors.hpp"

namespace healthstore::storage {

/*
  Record kinds spanning [start, end).
*/
template <typename T>
class IntervalRecordHelper : public RecordHelper {
 public:
  static constexpr std::string_view kStartTimeColumnName       = "start_time";
  static constexpr std::string_view kStartZoneOffsetColumnName = "start_zone_offset";
  static constexpr std::string_view kEndTimeColumnName         = "end_time";
  static constexpr std::string_view kEndZoneOffsetColumnName   = "end_zone_offset";

  model::RecordType GetRecordType() const final {
    return T::kRecordType;
  }

  std::string GetStartTimeColumnName() const final {
    return std::string(kStartTimeColumnName);
  }

  std::vector<model::Record> ReadRecords(db::sql::Cursor& cursor, const AppIdToPackageMap& packages) const override {
    std::vector<model::Record> records;
    while (cursor.MoveToNext()) {
      records.emplace_back(BuildRecord(cursor, ReadMetadata(cursor, packages), ReadInterval(cursor)));
    }
    return records;
  }

 protected:
  virtual std::vector<ColumnInfo> GetIntervalRecordColumnInfo() const = 0;
  virtual void PopulateIntervalRecordValues(ContentValues& values, const T& record) const = 0;
  virtual T BuildRecord(const db::sql::Row& row, model::RecordMetadata metadata, model::IntervalTime interval) const = 0;

  // Stored intervals were validated on write; a bad one means the store is inconsistent.
  static model::IntervalTime ReadInterval(const db::sql::Row& row) {
    try {
      return model::IntervalTime::Create(GetCursorLong(row, kStartTimeColumnName), GetCursorInt(row, kStartZoneOffsetColumnName),
                                         GetCursorLong(row, kEndTimeColumnName), GetCursorInt(row, kEndZoneOffsetColumnName));
    } catch (const util::ValidationError& e) {
      throw util::InternalError(std::string("stored interval is invalid: ") + e.what());
    }
  }

  std::vector<ColumnInfo> GetSpecificColumnInfo() const final {
    std::vector<ColumnInfo> columns = {
        {std::string(kStartTimeColumnName), kIntegerNotNull},
        {std::string(kStartZoneOffsetColumnName), kInteger},
        {std::string(kEndTimeColumnName), kIntegerNotNull},
        {std::string(kEndZoneOffsetColumnName), kInteger},
    };
    for (auto& column : GetIntervalRecordColumnInfo()) {
      columns.push_back(std::move(column));
    }
    return columns;
  }

  void PopulateSpecificContentValues(ContentValues& values, const model::Record& record) const final {
    const auto& typed = std::get<T>(record);
    values.Put(std::string(kStartTimeColumnName), typed.interval.StartTimeMs());
    values.Put(std::string(kStartZoneOffsetColumnName), typed.interval.StartZoneOffsetSeconds());
    values.Put(std::string(kEndTimeColumnName), typed.interval.EndTimeMs());
    values.Put(std::string(kEndZoneOffsetColumnName), typed.interval.EndZoneOffsetSeconds());
    PopulateIntervalRecordValues(values, typed);
  }
};

} // namespace healthstore::storage
