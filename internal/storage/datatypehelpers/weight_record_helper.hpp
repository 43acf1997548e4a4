#pragma once

#include "internal/storage/datatypehelpers/instant_record_helper.hpp"

namespace healthstore::storage {

class WeightRecordHelper final : public InstantRecordHelper<model::WeightRecord> {
 public:
  static constexpr std::string_view kTableName       = "weight_record_table";
  static constexpr std::string_view kValueColumnName = "weight";

  std::string GetMainTableName() const override {
    return std::string(kTableName);
  }

 protected:
  std::vector<ColumnInfo> GetInstantRecordColumnInfo() const override;
  void PopulateInstantRecordValues(ContentValues& values, const model::WeightRecord& record) const override;
  model::WeightRecord BuildRecord(const db::sql::Row& row, model::RecordMetadata metadata, model::InstantTime time) const override;
};

} // namespace healthstore::storage
