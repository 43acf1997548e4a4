#include "body_fat_record_helper.hpp"

namespace healthstore::storage {

std::vector<ColumnInfo> BodyFatRecordHelper::GetInstantRecordColumnInfo() const {
  return {{std::string(kValueColumnName), kRealNotNull}};
}

void BodyFatRecordHelper::PopulateInstantRecordValues(ContentValues& values, const model::BodyFatRecord& record) const {
  values.Put(std::string(kValueColumnName), record.percentage);
}

model::BodyFatRecord BodyFatRecordHelper::BuildRecord(const db::sql::Row& row, model::RecordMetadata metadata, model::InstantTime time) const {
  return {std::move(metadata), time, GetCursorDouble(row, kValueColumnName)};
}

} // namespace healthstore::storage
