#include "steps_record_helper.hpp"

namespace healthstore::storage {

std::vector<ColumnInfo> StepsRecordHelper::GetIntervalRecordColumnInfo() const {
  return {{std::string(kValueColumnName), kIntegerNotNull}};
}

void StepsRecordHelper::PopulateIntervalRecordValues(ContentValues& values, const model::StepsRecord& record) const {
  values.Put(std::string(kValueColumnName), record.count);
}

model::StepsRecord StepsRecordHelper::BuildRecord(const db::sql::Row& row, model::RecordMetadata metadata, model::IntervalTime interval) const {
  return {std::move(metadata), interval, GetCursorLong(row, kValueColumnName)};
}

} // namespace healthstore::storage
