#include "active_calories_burned_record_helper.hpp"

namespace healthstore::storage {

std::vector<ColumnInfo> ActiveCaloriesBurnedRecordHelper::GetIntervalRecordColumnInfo() const {
  return {{std::string(kValueColumnName), kRealNotNull}};
}

void ActiveCaloriesBurnedRecordHelper::PopulateIntervalRecordValues(ContentValues& values, const model::ActiveCaloriesBurnedRecord& record) const {
  values.Put(std::string(kValueColumnName), record.energy_calories);
}

model::ActiveCaloriesBurnedRecord ActiveCaloriesBurnedRecordHelper::BuildRecord(const db::sql::Row& row, model::RecordMetadata metadata, model::IntervalTime interval) const {
  return {std::move(metadata), interval, GetCursorDouble(row, kValueColumnName)};
}

} // namespace healthstore::storage
