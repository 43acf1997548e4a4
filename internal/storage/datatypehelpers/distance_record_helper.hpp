#pragma once

#include "internal/storage/datatypehelpers/interval_record_helper.hpp"

namespace healthstore::storage {

class DistanceRecordHelper final : public IntervalRecordHelper<model::DistanceRecord> {
 public:
  static constexpr std::string_view kTableName       = "distance_record_table";
  static constexpr std::string_view kValueColumnName = "distance";

  std::string GetMainTableName() const override {
    return std::string(kTableName);
  }

 protected:
  std::vector<ColumnInfo> GetIntervalRecordColumnInfo() const override;
  void PopulateIntervalRecordValues(ContentValues& values, const model::DistanceRecord& record) const override;
  model::DistanceRecord BuildRecord(const db::sql::Row& row, model::RecordMetadata metadata, model::IntervalTime interval) const override;
};

} // namespace healthstore::storage
