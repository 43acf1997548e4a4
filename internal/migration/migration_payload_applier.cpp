#include "migration_payload_applier.hpp"

#include <string>
#include <variant>

#include "internal/model/health_permissions.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace healthstore::migration {

namespace {

template <typename... Fns>
struct Overloaded : Fns... {
  using Fns::operator()...;
};

template <typename... Fns>
Overloaded(Fns...) -> Overloaded<Fns...>;

void RequirePackage(const std::string& package_name, std::string_view payload_kind) {
  if (package_name.empty()) {
    throw util::ValidationError(std::string(payload_kind) + " payload without a package name");
  }
}

} // namespace

MigrationPayloadApplier::MigrationPayloadApplier(std::shared_ptr<storage::DatabaseHelpers> helpers, std::shared_ptr<core::RecordStore> records,
                                                 std::shared_ptr<core::PackageRegistry> packages)
    : helpers_(std::move(helpers)), records_(std::move(records)), packages_(std::move(packages)) {
}

void MigrationPayloadApplier::Apply(db::Transaction& tx, const model::MigrationPayload& payload) const {
  std::visit(Overloaded{
                 [&](const model::RecordPayload& p) { ApplyRecord(tx, p); },
                 [&](const model::PermissionPayload& p) { ApplyPermissions(tx, p); },
                 [&](const model::PriorityPayload& p) { ApplyPriority(tx, p); },
                 [&](const model::AppInfoPayload& p) { ApplyAppInfo(tx, p); },
                 [&](const model::MetadataPayload& p) { ApplyMetadata(tx, p); },
             },
             payload);
}

void MigrationPayloadApplier::ApplyRecord(db::Transaction& tx, const model::RecordPayload& payload) const {
  RequirePackage(payload.origin_package_name, "record");
  records_->InsertRecords(tx, payload.origin_package_name, {payload.record}, core::InsertMode::kMigration);
}

void MigrationPayloadApplier::ApplyPermissions(db::Transaction& tx, const model::PermissionPayload& payload) const {
  RequirePackage(payload.package_name, "permission");
  for (const auto& permission : payload.permissions) {
    if (!model::IsValidHealthPermission(permission)) {
      throw util::InvalidPermission("invalid permission " + permission + " for " + payload.package_name);
    }
  }

  const auto first_grant_time_ms = payload.first_grant_time_ms > 0 ? payload.first_grant_time_ms : util::NowMillis();
  helpers_->permissions->GrantPermissions(tx, payload.package_name, payload.permissions, first_grant_time_ms);
}

void MigrationPayloadApplier::ApplyPriority(db::Transaction& tx, const model::PriorityPayload& payload) const {
  if (payload.data_category == model::HealthDataCategory::kUnknown ||
      !model::CategoryFromId(model::ToId(payload.data_category))) {
    throw util::ValidationError("priority payload for unknown data category " + std::to_string(model::ToId(payload.data_category)));
  }

  const auto existing = helpers_->priority->GetPriorityOrder(tx, payload.data_category);
  const auto merged   = storage::HealthDataCategoryPriorityHelper::MergePriorityOrder(
      existing, payload.package_names,
      [&](const std::string& package) { return helpers_->permissions->HasWritePermissionForCategory(tx, package, payload.data_category); });
  helpers_->priority->SetPriorityOrder(tx, payload.data_category, merged);
}

void MigrationPayloadApplier::ApplyAppInfo(db::Transaction& tx, const model::AppInfoPayload& payload) const {
  RequirePackage(payload.package_name, "app info");

  if (packages_->IsInstalled(payload.package_name)) {
    HEALTHSTORE_LOG_DEBUG("Ignoring migrated app info of installed package", {observability::StringField("package", payload.package_name)});
    return;
  }

  model::AppInfo info{payload.package_name, payload.app_name, payload.app_icon};
  if (helpers_->app_info->HasRecords(tx, payload.package_name)) {
    helpers_->app_info->UpdateAppInfo(tx, info);
    return;
  }

  HEALTHSTORE_LOG_DEBUG("Staging migrated app info until records arrive", {observability::StringField("package", payload.package_name)});
  helpers_->app_info->StageAppInfo(tx, info);
}

void MigrationPayloadApplier::ApplyMetadata(db::Transaction& tx, const model::MetadataPayload& payload) const {
  if (payload.record_retention_period_days < 0) {
    throw util::ValidationError("record retention period must not be negative");
  }
  helpers_->preferences->InsertOrReplacePreference(tx, storage::PreferenceHelper::kRecordRetentionPeriodDaysKey,
                                                   std::to_string(payload.record_retention_period_days));
}

void MigrationPayloadApplier::ResolveStagedAppInfo(db::Transaction& tx) const {
  for (const auto& info : helpers_->app_info->GetStagedAppInfo(tx)) {
    const bool installed = packages_->IsInstalled(info.package_name);
    if (installed || !helpers_->app_info->HasRecords(tx, info.package_name)) {
      HEALTHSTORE_LOG_DEBUG("Dropping staged app info",
                            {observability::StringField("package", info.package_name), observability::BoolField("installed", installed)});
      continue;
    }
    helpers_->app_info->UpdateAppInfo(tx, info);
  }
  helpers_->app_info->ClearStagedAppInfo(tx);
}

} // namespace healthstore::migration
