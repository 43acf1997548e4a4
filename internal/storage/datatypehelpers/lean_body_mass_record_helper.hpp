#pragma once

#include "internal/storage/datatypehelpers/instant_record_helper.hpp"

namespace healthstore::storage {

class LeanBodyMassRecordHelper final : public InstantRecordHelper<model::LeanBodyMassRecord> {
 public:
  static constexpr std::string_view kTableName       = "lean_body_mass_record_table";
  static constexpr std::string_view kValueColumnName = "mass";

  std::string GetMainTableName() const override {
    return std::string(kTableName);
  }

 protected:
  std::vector<ColumnInfo> GetInstantRecordColumnInfo() const override;
  void PopulateInstantRecordValues(ContentValues& values, const model::LeanBodyMassRecord& record) const override;
  model::LeanBodyMassRecord BuildRecord(const db::sql::Row& row, model::RecordMetadata metadata, model::InstantTime time) const override;
};

} // namespace healthstore::storage
