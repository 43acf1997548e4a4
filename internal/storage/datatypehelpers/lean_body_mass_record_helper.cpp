#include "lean_body_mass_record_helper.hpp"

namespace healthstore::storage {

std::vector<ColumnInfo> LeanBodyMassRecordHelper::GetInstantRecordColumnInfo() const {
  return {{std::string(kValueColumnName), kRealNotNull}};
}

void LeanBodyMassRecordHelper::PopulateInstantRecordValues(ContentValues& values, const model::LeanBodyMassRecord& record) const {
  values.Put(std::string(kValueColumnName), record.mass_grams);
}

model::LeanBodyMassRecord LeanBodyMassRecordHelper::BuildRecord(const db::sql::Row& row, model::RecordMetadata metadata, model::InstantTime time) const {
  return {std::move(metadata), time, GetCursorDouble(row, kValueColumnName)};
}

} // namespace healthstore::storage
