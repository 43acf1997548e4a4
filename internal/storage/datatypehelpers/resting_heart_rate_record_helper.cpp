#include "resting_heart_rate_record_helper.hpp"

namespace healthstore::storage {

std::vector<ColumnInfo> RestingHeartRateRecordHelper::GetInstantRecordColumnInfo() const {
  return {{std::string(kValueColumnName), kIntegerNotNull}};
}

void RestingHeartRateRecordHelper::PopulateInstantRecordValues(ContentValues& values, const model::RestingHeartRateRecord& record) const {
  values.Put(std::string(kValueColumnName), record.beats_per_minute);
}

model::RestingHeartRateRecord RestingHeartRateRecordHelper::BuildRecord(const db::sql::Row& row, model::RecordMetadata metadata, model::InstantTime time) const {
  return {std::move(metadata), time, GetCursorLong(row, kValueColumnName)};
}

} // namespace healthstore::storage
