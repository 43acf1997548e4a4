#pragma once

#include "internal/storage/datatypehelpers/series_record_helper.hpp"

namespace healthstore::storage {

class PowerRecordHelper final : public SeriesRecordHelper<model::PowerRecord> {
 public:
  static constexpr std::string_view kTableName             = "PowerRecordTable";
  static constexpr std::string_view kSeriesTableName       = "power_record_table";
  static constexpr std::string_view kSampleValueColumnName = "power";

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
