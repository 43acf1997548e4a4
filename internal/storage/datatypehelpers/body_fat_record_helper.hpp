#pragma once

#include "internal/storage/datatypehelpers/instant_record_helper.hpp"

namespace healthstore::storage {

class BodyFatRecordHelper final : public InstantRecordHelper<model::BodyFatRecord> {
 public:
  static constexpr std::string_view kTableName       = "body_fat_record_table";
  static constexpr std::string_view kValueColumnName = "percentage";

  std::string GetMainTableName() const override {
    return std::string(kTableName);
  }

 protected:
  std::vector<ColumnInfo> GetInstantRecordColumnInfo() const override;
  void PopulateInstantRecordValues(ContentValues& values, const model::BodyFatRecord& record) const override;
  model::BodyFatRecord BuildRecord(const db::sql::Row& row, model::RecordMetadata metadata, model::InstantTime time) const override;
};

} // namespace healthstore::storage
