#pragma once

#include "internal/storage/datatypehelpers/series_record_helper.hpp"

namespace healthstore::storage {

class HeartRateRecordHelper final : public SeriesRecordHelper<model::HeartRateRecord> {
 public:
  static constexpr std::string_view kTableName             = "HeartRateRecordTable";
  static constexpr std::string_view kSeriesTableName       = "heart_rate_record_table";
  static constexpr std::string_view kSampleValueColumnName = "beats_per_minute";

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
