#pragma once

#include "internal/storage/datatypehelpers/series_record_helper.hpp"

namespace healthstore::storage {

class SpeedRecordHelper final : public SeriesRecordHelper<model::SpeedRecord> {
 public:
  static constexpr std::string_view kTableName             = "SpeedRecordTable";
  static constexpr std::string_view kSeriesTableName       = "speed_record_table";
  static constexpr std::string_view kSampleValueColumnName = "speed";

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
