#include "distance_record_helper.hpp"

namespace healthstore::storage {

std::vector<ColumnInfo> DistanceRecordHelper::GetIntervalRecordColumnInfo() const {
  return {{std::string(kValueColumnName), kRealNotNull}};
}

void DistanceRecordHelper::PopulateIntervalRecordValues(ContentValues& values, const model::DistanceRecord& record) const {
  values.Put(std::string(kValueColumnName), record.distance_meters);
}

model::DistanceRecord DistanceRecordHelper::BuildRecord(const db::sql::Row& row, model::RecordMetadata metadata, model::IntervalTime interval) const {
  return {std::move(metadata), interval, GetCursorDouble(row, kValueColumnName)};
}

} // namespace healthstore::storage
