#pragma once

#include "internal/storage/datatypehelpers/interval_record_helper.hpp"

namespace healthstore::storage {

class ActiveCaloriesBurnedRecordHelper final : public IntervalRecordHelper<model::ActiveCaloriesBurnedRecord> {
 public:
  static constexpr std::string_view kTableName       = "active_calories_burned_record_table";
  static constexpr std::string_view kValueColumnName = "energy";

  std::string GetMainTableName() const override {
    return std::string(kTableName);
  }

 protected:
  std::vector<ColumnInfo> GetIntervalRecordColumnInfo() const override;
  void PopulateIntervalRecordValues(ContentValues& values, const model::ActiveCaloriesBurnedRecord& record) const override;
  model::ActiveCaloriesBurnedRecord BuildRecord(const db::sql::Row& row, model::RecordMetadata metadata, model::IntervalTime interval) const override;
};

} // namespace healthstore::storage
