#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "internal/core/record_store.hpp"
#include "internal/model/app_info.hpp"
#include "internal/model/change_log.hpp"
#include "internal/model/record.hpp"
#include "service_context.hpp"

namespace healthstore::service {

/*
  Caller-facing data API. Every call fails with
  util::MigrationInProgress while a migration is running; writes
  check again once they hold the writer lock.

  Reads check the phase once, before taking a reader connection, and
  are not serialized with StartMigration. A read racing a migration
  start returns committed rows, possibly including the first migrated
  batches.
*/
class HealthDataService {
 public:
  explicit HealthDataService(ServiceContext ctx);

  std::vector<std::string> InsertRecords(const std::string& package_name, std::vector<model::Record> records);
  void                     UpdateRecords(const std::string& package_name, std::vector<model::Record> records);
  int DeleteRecords(const std::string& package_name, model::RecordType type, const std::vector<std::string>& uuids);

  std::vector<model::Record> ReadRecords(const core::ReadRecordsRequest& request);

  std::int64_t GetChangeLogToken(const std::string& package_name, const model::ChangeLogTokenRequest& request);

  // page_size defaults to the configured change-log page size.
  model::ChangeLogsResponse GetChangeLogs(const std::string& package_name, std::int64_t token, std::optional<int> page_size = std::nullopt);

  std::vector<model::AppInfo> GetContributorApplicationsInfo();

  std::vector<std::string> GetHealthDataCategoryPriority(model::HealthDataCategory category);

  // packages must be a reordering of the current priority list.
  void UpdateHealthDataCategoryPriority(model::HealthDataCategory category, const std::vector<std::string>& packages);

  std::int32_t GetRecordRetentionPeriodInDays();

  std::vector<std::string> GetGrantedPermissions(const std::string& package_name);

  // A package left without write access to a category is removed from that category's priority order.
  void RevokeHealthPermissions(const std::string& package_name, const std::vector<std::string>& permissions);

 private:
  template <typename Fn>
  auto Write(Fn&& fn);

  template <typename Fn>
  auto Read(Fn&& fn);

  ServiceContext ctx_;
};

} // namespace healthstore::service
