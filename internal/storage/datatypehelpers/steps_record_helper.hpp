#pragma once

#include "internal/storage/datatypehelpers/interval_record_helper.hpp"

namespace healthstore::storage {

class StepsRecordHelper final : public IntervalRecordHelper<model::StepsRecord> {
 public:
  static constexpr std::string_view kTableName       = "steps_record_table";
  static constexpr std::string_view kValueColumnName = "count";

  std::string GetMainTableName() const override {
    return std::string(kTableName);
  }

 protected:
  std::vector<ColumnInfo> GetIntervalRecordColumnInfo() const override;
  void PopulateIntervalRecordValues(ContentValues& values, const model::StepsRecord& record) const override;
  model::StepsRecord BuildRecord(const db::sql::Row& row, model::RecordMetadata metadata, model::IntervalTime interval) const override;
};

} // namespace healthstore::storage
