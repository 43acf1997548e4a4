#include "basal_metabolic_rate_record_helper.hpp"

namespace healthstore::storage {

std::vector<ColumnInfo> BasalMetabolicRateRecordHelper::GetInstantRecordColumnInfo() const {
  return {{std::string(kValueColumnName), kRealNotNull}};
}

void BasalMetabolicRateRecordHelper::PopulateInstantRecordValues(ContentValues& values, const model::BasalMetabolicRateRecord& record) const {
  values.Put(std::string(kValueColumnName), record.basal_metabolic_rate_watts);
}

model::BasalMetabolicRateRecord BasalMetabolicRateRecordHelper::BuildRecord(const db::sql::Row& row, model::RecordMetadata metadata, model::InstantTime time) const {
  return {std::move(metadata), time, GetCursorDouble(row, kValueColumnName)};
}

} // namespace healthstore::storage
