#pragma once

#include "internal/storage/datatypehelpers/instant_record_helper.hpp"

namespace healthstore::storage {

class HeightRecordHelper final : public InstantRecordHelper<model::HeightRecord> {
 public:
  static constexpr std::string_view kTableName       = "height_record_table";
  static constexpr std::string_view kValueColumnName = "height";

  std::string GetMainTableName() const override {
    return std::string(kTableName);
  }

 protected:
  std::vector<ColumnInfo> GetInstantRecordColumnInfo() const override;
  void PopulateInstantRecordValues(ContentValues& values, const model::HeightRecord& record) const override;
  model::HeightRecord BuildRecord(const db::sql::Row& row, model::RecordMetadata metadata, model::InstantTime time) const override;
};

} // namespace healthstore::storage
