#pragma once

#include "internal/storage/datatypehelpers/instant_record_helper.hpp"

namespace healthstore::storage {

class BasalMetabolicRateRecordHelper final : public InstantRecordHelper<model::BasalMetabolicRateRecord> {
 public:
  static constexpr std::string_view kTableName       = "basal_metabolic_rate_record_table";
  static constexpr std::string_view kValueColumnName = "basal_metabolic_rate";

  std::string GetMainTableName() const override {
    return std::string(kTableName);
  }

 protected:
  std::vector<ColumnInfo> GetInstantRecordColumnInfo() const override;
  void PopulateInstantRecordValues(ContentValues& values, const model::BasalMetabolicRateRecord& record) const override;
  model::BasalMetabolicRateRecord BuildRecord(const db::sql::Row& row, model::RecordMetadata metadata, model::InstantTime time) const override;
};

} // namespace healthstore::storage
