#include "weight_record_helper.hpp"

namespace healthstore::storage {

std::vector<ColumnInfo> WeightRecordHelper::GetInstantRecordColumnInfo() const {
  return {{std::string(kValueColumnName), kRealNotNull}};
}

void WeightRecordHelper::PopulateInstantRecordValues(ContentValues& values, const model::WeightRecord& record) const {
  values.Put(std::string(kValueColumnName), record.weight_grams);
}

model::WeightRecord WeightRecordHelper::BuildRecord(const db::sql::Row& row, model::RecordMetadata metadata, model::InstantTime time) const {
  return {std::move(metadata), time, GetCursorDouble(row, kValueColumnName)};
}

} // namespace healthstore::storage
