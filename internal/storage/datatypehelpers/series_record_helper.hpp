#pragma once

#include <string>
#include <type_traits>
#include <vector>

#include "internal/storage/datatypehelpers/interval_record_helper.hpp"
#include "internal/storage/datatypehelpers/row_group_reader.hpp"

namespace healthstore::storage {

/*
  Interval records that own an ordered list of samples.

  Samples live in a child table keyed by the parent's uuid; their
  order is the child row id, i.e. insertion order. A read is a single
  LEFT JOIN sorted by (parent row id, child row id), regrouped with
  RowGroupReader into one record per uuid. A record without samples
  yields one row whose sample columns are NULL.
*/
template <typename T>
class SeriesRecordHelper : public IntervalRecordHelper<T> {
 public:
  using Sample      = typename T::Sample;
  using SampleValue = decltype(Sample::value);

  static constexpr std::string_view kParentKeyColumnName   = "parent_uuid";
  static constexpr std::string_view kEpochMillisColumnName = "epoch_millis";
  static constexpr std::string_view kSampleValueAlias      = "series_value";
  static constexpr std::string_view kSampleTimeAlias       = "series_epoch_millis";

  ReadTableRequest GetReadTableRequest(const ReadRecordsFilter& filter) const override {
    const auto series = GetSeriesDataTableName();
    auto       request = RecordHelper::GetReadTableRequest(filter);
    request.SetColumnNames({this->GetMainTableName() + ".*",
                            series + "." + GetSampleValueColumnName() + " AS " + std::string(kSampleValueAlias),
                            series + "." + std::string(kEpochMillisColumnName) + " AS " + std::string(kSampleTimeAlias)});
    request.SetJoinClause({series, std::string(RecordHelper::kUuidColumnName), std::string(kParentKeyColumnName)});
    request.SetOrderBy({this->Qualified(RecordHelper::kPrimaryColumnName) + " ASC", series + "." + std::string(RecordHelper::kPrimaryColumnName) + " ASC"});
    return request;
  }

  std::vector<DeleteTableRequest> GetChildDeleteTableRequests(const std::vector<std::string>& uuids) const override {
    WhereClauses where;
    where.AddWhereInClause(std::string(kParentKeyColumnName), uuids);
    return {DeleteTableRequest(GetSeriesDataTableName(), std::move(where))};
  }

  std::vector<model::Record> ReadRecords(db::sql::Cursor& cursor, const AppIdToPackageMap& packages) const override {
    std::vector<model::Record> records;
    RowGroupReader             groups(cursor, std::string(RecordHelper::kUuidColumnName));
    while (auto group = groups.Next()) {
      const auto& head   = group->rows.front();
      T           record = BuildRecord(head, this->ReadMetadata(head, packages), this->ReadInterval(head));
      for (const auto& row : group->rows) {
        if (IsNullValue(row, kSampleTimeAlias)) {
          continue;
        }
        record.samples.push_back(Sample{ReadSampleValue(row), GetCursorLong(row, kSampleTimeAlias)});
      }
      records.emplace_back(std::move(record));
    }
    return records;
  }

 protected:
  virtual std::string GetSeriesDataTableName() const = 0;
  virtual std::string GetSampleValueColumnName() const = 0;

  std::vector<ColumnInfo> GetIntervalRecordColumnInfo() const final {
    return {};
  }

  void PopulateIntervalRecordValues(ContentValues& values, const T& record) const final {
    (void)values;
    (void)record;
  }

  T BuildRecord(const db::sql::Row& row, model::RecordMetadata metadata, model::IntervalTime interval) const final {
    (void)row;
    return T{std::move(metadata), interval, {}};
  }

  std::vector<CreateTableRequest> GetChildTableCreateRequests() const final {
    CreateTableRequest request(GetSeriesDataTableName(),
                               {
                                   {std::string(RecordHelper::kPrimaryColumnName), kPrimaryAutoincrement},
                                   {std::string(kParentKeyColumnName), kTextNotNull},
                                   {GetSampleValueColumnName(), std::is_integral_v<SampleValue> ? kIntegerNotNull : kRealNotNull},
                                   {std::string(kEpochMillisColumnName), kIntegerNotNull},
                               });
    request.AddForeignKey({std::string(kParentKeyColumnName), this->GetMainTableName(), std::string(RecordHelper::kUuidColumnName), true});
    request.CreateIndexOn(std::string(kParentKeyColumnName));
    return {std::move(request)};
  }

  std::vector<UpsertTableRequest> GetChildTableUpsertRequests(const model::Record& record) const final {
    const auto&                     typed = std::get<T>(record);
    std::vector<UpsertTableRequest> requests;
    requests.reserve(typed.samples.size());
    for (const auto& sample : typed.samples) {
      ContentValues values;
      values.Put(std::string(kParentKeyColumnName), typed.metadata.id);
      values.Put(GetSampleValueColumnName(), sample.value);
      values.Put(std::string(kEpochMillisColumnName), sample.epoch_millis);
      requests.emplace_back(GetSeriesDataTableName(), std::move(values));
    }
    return requests;
  }

 private:
  static SampleValue ReadSampleValue(const db::sql::Row& row) {
    if constexpr (std::is_integral_v<SampleValue>) {
      return static_cast<SampleValue>(GetCursorLong(row, kSampleValueAlias));
    } else {
      return static_cast<SampleValue>(GetCursorDouble(row, kSampleValueAlias));
    }
  }
};

} // namespace healthstore::storage
