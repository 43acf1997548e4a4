#pragma once

#include "internal/storage/datatypehelpers/series_record_helper.hpp"

namespace healthstore::storage {

class StepsCadenceRecordHelper final : public SeriesRecordHelper<model::StepsCadenceRecord> {
 public:
  static constexpr std::string_view kTableName             = "StepsCadenceRecordTable";
  static constexpr std::string_view kSeriesTableName       = "steps_cadence_record_table";
  static constexpr std::string_view kSampleValueColumnName = "rate";

  std::string GetMainTableName() const override {
    return std::string(kTableName);
  }

 protected:
  std::string GetSeriesDataTableName() const override {
    return std::string(kSeriesTableName);
  }

  std::string GetSampleValueColumnName() const override {
    return std::string(kSampleValueColumnName);
  }
};

} // namespace healthstore::storage
