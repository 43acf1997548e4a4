#include "height_record_helper.hpp"

namespace healthstore::storage {

std::vector<ColumnInfo> HeightRecordHelper::GetInstantRecordColumnInfo() const {
  return {{std::string(kValueColumnName), kRealNotNull}};
}

void HeightRecordHelper::PopulateInstantRecordValues(ContentValues& values, const model::HeightRecord& record) const {
  values.Put(std::string(kValueColumnName), record.height_meters);
}

model::HeightRecord HeightRecordHelper::BuildRecord(const db::sql::Row& row, model::RecordMetadata metadata, model::InstantTime time) const {
  return {std::move(metadata), time, GetCursorDouble(row, kValueColumnName)};
}

} // namespace healthstore::storage
