#pragma once

#include "internal/storage/datatypehelpers/instant_record_helper.hpp"

namespace healthstore::storage {

class RestingHeartRateRecordHelper final : public InstantRecordHelper<model::RestingHeartRateRecord> {
 public:
  static constexpr std::string_view kTableName       = "resting_heart_rate_record_table";
  static constexpr std::string_view kValueColumnName = "beats_per_minute";

  std::string GetMainTableName() const override {
    return std::string(kTableName);
  }

 protected:
  std::vector<ColumnInfo> GetInstantRecordColumnInfo() const override;
  void PopulateInstantRecordValues(ContentValues& values, const model::RestingHeartRateRecord& record) const override;
  model::RestingHeartRateRecord BuildRecord(const db::sql::Row& row, model::RecordMetadata metadata, model::InstantTime time) const override;
};

} // namespace healthstore::storage
