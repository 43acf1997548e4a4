#include "health_data_service.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

#include "internal/migration/migration_state_manager.hpp"
#include "internal/model/health_permissions.hpp"
#include "internal/storage/datatypehelpers/database_helpers.hpp"
#include "internal/util/errors.hpp"
#include "observe_call.hpp"

namespace healthstore::service {

HealthDataService::HealthDataService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

template <typename Fn>
auto HealthDataService::Write(Fn&& fn) {
  ctx_.migration_state->EnsureNotInProgress();
  return ctx_.helpers->transactions->RunAsTransaction([&](db::Transaction& tx) {
    // a migration may have started while waiting for the writer
    ctx_.migration_state->EnsureNotInProgress();
    return fn(tx);
  });
}

template <typename Fn>
auto HealthDataService::Read(Fn&& fn) {
  ctx_.migration_state->EnsureNotInProgress();
  return ctx_.helpers->transactions->RunAsReadTransaction([&](db::Transaction& tx) { return fn(tx); });
}

std::vector<std::string> HealthDataService::InsertRecords(const std::string& package_name, std::vector<model::Record> records) {
  return ObserveCall("HealthDataService.InsertRecords", [&] {
    return Write([&](db::Transaction& tx) { return ctx_.records->InsertRecords(tx, package_name, std::move(records)); });
  });
}

void HealthDataService::UpdateRecords(const std::string& package_name, std::vector<model::Record> records) {
  ObserveCall("HealthDataService.UpdateRecords", [&] {
    Write([&](db::Transaction& tx) { ctx_.records->UpdateRecords(tx, package_name, std::move(records)); });
  });
}

int HealthDataService::DeleteRecords(const std::string& package_name, model::RecordType type, const std::vector<std::string>& uuids) {
  return ObserveCall("HealthDataService.DeleteRecords", [&] {
    return Write([&](db::Transaction& tx) { return ctx_.records->DeleteRecords(tx, package_name, type, uuids); });
  });
}

std::vector<model::Record> HealthDataService::ReadRecords(const core::ReadRecordsRequest& request) {
  return ObserveCall("HealthDataService.ReadRecords", [&] {
    return Read([&](db::Transaction& tx) { return ctx_.records->ReadRecords(tx, request); });
  });
}

std::int64_t HealthDataService::GetChangeLogToken(const std::string& package_name, const model::ChangeLogTokenRequest& request) {
  return ObserveCall("HealthDataService.GetChangeLogToken", [&] {
    return Write([&](db::Transaction& tx) { return ctx_.helpers->change_log_requests->GetToken(tx, package_name, request); });
  });
}

model::ChangeLogsResponse HealthDataService::GetChangeLogs(const std::string& package_name, std::int64_t token, std::optional<int> page_size) {
  return ObserveCall("HealthDataService.GetChangeLogs", [&] {
    const int size = page_size.value_or(ctx_.change_logs_page_size);
    // issuing the next-page token writes a request row
    return Write([&](db::Transaction& tx) { return ctx_.records->GetChangeLogs(tx, package_name, token, size); });
  });
}

std::vector<model::AppInfo> HealthDataService::GetContributorApplicationsInfo() {
  return ObserveCall("HealthDataService.GetContributorApplicationsInfo", [&] {
    return Read([&](db::Transaction& tx) { return ctx_.helpers->app_info->GetContributorApplicationsInfo(tx, *ctx_.packages); });
  });
}

std::vector<std::string> HealthDataService::GetHealthDataCategoryPriority(model::HealthDataCategory category) {
  return ObserveCall("HealthDataService.GetHealthDataCategoryPriority", [&] {
    return Read([&](db::Transaction& tx) { return ctx_.helpers->priority->GetPriorityOrder(tx, category); });
  });
}

void HealthDataService::UpdateHealthDataCategoryPriority(model::HealthDataCategory category, const std::vector<std::string>& packages) {
  ObserveCall("HealthDataService.UpdateHealthDataCategoryPriority", [&] {
    Write([&](db::Transaction& tx) {
      auto current   = ctx_.helpers->priority->GetPriorityOrder(tx, category);
      auto requested = packages;
      std::sort(current.begin(), current.end());
      std::sort(requested.begin(), requested.end());
      if (current != requested) {
        throw util::ValidationError("new priority order for " + std::string(model::CategoryName(category)) +
                                    " must contain exactly the packages of the current order");
      }
      ctx_.helpers->priority->SetPriorityOrder(tx, category, packages);
    });
  });
}

std::int32_t HealthDataService::GetRecordRetentionPeriodInDays() {
  return ObserveCall("HealthDataService.GetRecordRetentionPeriodInDays", [&] {
    return Read([&](db::Transaction& tx) -> std::int32_t {
      const auto stored = ctx_.helpers->preferences->GetPreference(tx, storage::PreferenceHelper::kRecordRetentionPeriodDaysKey);
      if (!stored) {
        return ctx_.default_retention_period_days;
      }
      try {
        return std::stoi(*stored);
      } catch (const std::logic_error&) {
        throw util::InternalError("stored record retention period is not a number: '" + *stored + "'");
      }
    });
  });
}

std::vector<std::string> HealthDataService::GetGrantedPermissions(const std::string& package_name) {
  return ObserveCall("HealthDataService.GetGrantedPermissions", [&] {
    return Read([&](db::Transaction& tx) {
      std::vector<std::string> permissions;
      for (auto& grant : ctx_.helpers->permissions->GetGrantedPermissions(tx, package_name)) {
        permissions.push_back(std::move(grant.permission));
      }
      return permissions;
    });
  });
}

void HealthDataService::RevokeHealthPermissions(const std::string& package_name, const std::vector<std::string>& permissions) {
  ObserveCall("HealthDataService.RevokeHealthPermissions", [&] {
    std::vector<model::HealthDataCategory> write_categories;
    for (const auto& permission : permissions) {
      const auto info = model::LookupHealthPermission(permission);
      if (!info) {
        throw util::InvalidPermission("invalid permission " + permission + " for " + package_name);
      }
      if (info->access == model::PermissionAccess::kWrite) write_categories.push_back(info->type->category);
    }

    Write([&](db::Transaction& tx) {
      ctx_.helpers->permissions->RevokePermissions(tx, package_name, permissions);
      for (const auto category : write_categories) {
        if (ctx_.helpers->permissions->HasWritePermissionForCategory(tx, package_name, category)) continue;

        auto       order = ctx_.helpers->priority->GetPriorityOrder(tx, category);
        const auto it    = std::remove(order.begin(), order.end(), package_name);
        if (it == order.end()) continue;
        order.erase(it, order.end());
        ctx_.helpers->priority->SetPriorityOrder(tx, category, order);
      }
    });
  });
}

} // namespace healthstore::service
