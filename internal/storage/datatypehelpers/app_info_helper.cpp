#include "app_info_helper.hpp"

#include <algorithm>

#include "internal/storage/utils/storage_utils.hpp"
#include "internal/util/errors.hpp"

namespace healthstore::storage {

namespace {

std::string Column(std::string_view name) {
  return std::string(name);
}

} // namespace

AppInfoHelper::AppInfoHelper(std::shared_ptr<TransactionManager> transactions) : transactions_(std::move(transactions)) {
}

CreateTableRequest AppInfoHelper::GetCreateTableRequest() const {
  return CreateTableRequest(Column(kTableName), {
                                                    {Column(kPrimaryColumnName), kPrimaryAutoincrement},
                                                    {Column(kPackageColumnName), kTextNotNullUnique},
                                                    {Column(kAppNameColumnName), kTextNull},
                                                    {Column(kAppIconColumnName), kBlob},
                                                    {Column(kRecordTypesUsedColumnName), kTextNull},
                                                });
}

CreateTableRequest AppInfoHelper::GetStagingCreateTableRequest() const {
  return CreateTableRequest(Column(kStagingTableName), {
                                                           {Column(kPrimaryColumnName), kPrimaryAutoincrement},
                                                           {Column(kPackageColumnName), kTextNotNullUnique},
                                                           {Column(kAppNameColumnName), kTextNull},
                                                           {Column(kAppIconColumnName), kBlob},
                                                       });
}

AppInfoHelper::Row AppInfoHelper::ToRow(const db::sql::Row& row) {
  Row out;
  out.id                = GetCursorLong(row, kPrimaryColumnName);
  out.info.package_name = GetCursorString(row, kPackageColumnName);
  out.info.name         = GetCursorString(row, kAppNameColumnName);
  out.info.icon         = GetCursorBlob(row, kAppIconColumnName);
  out.record_types_used = DecodeIntList(GetCursorString(row, kRecordTypesUsedColumnName));
  return out;
}

std::optional<AppInfoHelper::Row> AppInfoHelper::ReadRow(db::Transaction& tx, const std::string& package_name) const {
  WhereClauses where;
  where.AddWhereEqualsClause(Column(kPackageColumnName), package_name);

  ReadTableRequest request{Column(kTableName)};
  request.SetWhereClause(std::move(where));

  auto cursor = transactions_->Read(tx, request);
  if (!cursor->MoveToNext()) {
    return std::nullopt;
  }
  return ToRow(*cursor);
}

std::optional<std::int64_t> AppInfoHelper::GetAppInfoId(db::Transaction& tx, const std::string& package_name) const {
  auto row = ReadRow(tx, package_name);
  if (!row) return std::nullopt;
  return row->id;
}

std::int64_t AppInfoHelper::GetOrInsertAppInfoId(db::Transaction& tx, const std::string& package_name) const {
  if (package_name.empty()) {
    throw util::ValidationError("package name must not be empty");
  }
  if (auto id = GetAppInfoId(tx, package_name)) {
    return *id;
  }

  ContentValues values;
  values.Put(Column(kPackageColumnName), package_name);
  values.Put(Column(kRecordTypesUsedColumnName), EncodeIntList({}));

  std::int64_t id = 0;
  ThrowIfError(transactions_->Insert(tx, UpsertTableRequest(Column(kTableName), std::move(values)), &id), "insert app info " + package_name);
  return id;
}

std::vector<std::int64_t> AppInfoHelper::GetAppInfoIds(db::Transaction& tx, const std::vector<std::string>& package_names) const {
  WhereClauses where;
  where.AddWhereInClause(Column(kPackageColumnName), package_names);

  ReadTableRequest request{Column(kTableName)};
  request.SetColumnNames({Column(kPrimaryColumnName)}).SetWhereClause(std::move(where));

  std::vector<std::int64_t> ids;
  auto                      cursor = transactions_->Read(tx, request);
  while (cursor->MoveToNext()) {
    ids.push_back(GetCursorLong(*cursor, kPrimaryColumnName));
  }
  return ids;
}

AppIdToPackageMap AppInfoHelper::GetIdToPackageNameMap(db::Transaction& tx) const {
  ReadTableRequest request{Column(kTableName)};
  request.SetColumnNames({Column(kPrimaryColumnName), Column(kPackageColumnName)});

  AppIdToPackageMap map;
  auto              cursor = transactions_->Read(tx, request);
  while (cursor->MoveToNext()) {
    map.emplace(GetCursorLong(*cursor, kPrimaryColumnName), GetCursorString(*cursor, kPackageColumnName));
  }
  return map;
}

void AppInfoHelper::AddRecordTypeUsed(db::Transaction& tx, std::int64_t app_info_id, model::RecordType type) const {
  WhereClauses where;
  where.AddWhereEqualsClause(Column(kPrimaryColumnName), app_info_id);

  ReadTableRequest request{Column(kTableName)};
  request.SetWhereClause(where);

  auto cursor = transactions_->Read(tx, request);
  if (!cursor->MoveToNext()) {
    throw util::InternalError("app info id " + std::to_string(app_info_id) + " does not exist");
  }
  auto used = ToRow(*cursor).record_types_used;
  cursor.reset();

  if (std::find(used.begin(), used.end(), model::ToId(type)) != used.end()) {
    return;
  }
  used.push_back(model::ToId(type));
  std::sort(used.begin(), used.end());

  ContentValues values;
  values.Put(Column(kRecordTypesUsedColumnName), EncodeIntList(used));
  ThrowIfError(transactions_->Update(tx, Column(kTableName), values, where), "update record types used");
}

bool AppInfoHelper::HasRecords(db::Transaction& tx, const std::string& package_name) const {
  auto row = ReadRow(tx, package_name);
  return row && !row->record_types_used.empty();
}

void AppInfoHelper::UpdateAppInfo(db::Transaction& tx, const model::AppInfo& info) const {
  const auto id = GetOrInsertAppInfoId(tx, info.package_name);

  WhereClauses where;
  where.AddWhereEqualsClause(Column(kPrimaryColumnName), id);

  ContentValues values;
  values.Put(Column(kAppNameColumnName), info.name);
  values.Put(Column(kAppIconColumnName), info.icon);
  ThrowIfError(transactions_->Update(tx, Column(kTableName), values, where), "update app info " + info.package_name);
}

void AppInfoHelper::StageAppInfo(db::Transaction& tx, const model::AppInfo& info) const {
  ContentValues values;
  values.Put(Column(kPackageColumnName), info.package_name);
  values.Put(Column(kAppNameColumnName), info.name);
  values.Put(Column(kAppIconColumnName), info.icon);

  UpsertTableRequest request(Column(kStagingTableName), std::move(values));
  request.SetConflict({Column(kPackageColumnName)}, ConflictPolicy::kReplace);
  ThrowIfError(transactions_->Insert(tx, request), "stage app info " + info.package_name);
}

std::vector<model::AppInfo> AppInfoHelper::GetStagedAppInfo(db::Transaction& tx) const {
  ReadTableRequest request{Column(kStagingTableName)};
  request.SetOrderBy({Column(kPrimaryColumnName) + " ASC"});

  std::vector<model::AppInfo> staged;
  auto                        cursor = transactions_->Read(tx, request);
  while (cursor->MoveToNext()) {
    staged.push_back({GetCursorString(*cursor, kPackageColumnName), GetCursorString(*cursor, kAppNameColumnName),
                      GetCursorBlob(*cursor, kAppIconColumnName)});
  }
  return staged;
}

void AppInfoHelper::ClearStagedAppInfo(db::Transaction& tx) const {
  ThrowIfError(transactions_->Delete(tx, DeleteTableRequest(Column(kStagingTableName), WhereClauses{})), "clear staged app info");
}

std::vector<model::AppInfo> AppInfoHelper::GetContributorApplicationsInfo(db::Transaction& tx, const core::PackageRegistry& packages) const {
  ReadTableRequest request{Column(kTableName)};
  request.SetOrderBy({Column(kPackageColumnName) + " ASC"});

  std::vector<model::AppInfo> contributors;
  auto                        cursor = transactions_->Read(tx, request);
  while (cursor->MoveToNext()) {
    auto row = ToRow(*cursor);
    if (row.record_types_used.empty()) {
      continue;
    }
    if (auto installed_name = packages.GetAppName(row.info.package_name)) {
      row.info.name = *installed_name;
    } else if (row.info.name.empty()) {
      continue;
    }
    contributors.push_back(std::move(row.info));
  }
  return contributors;
}

} // namespace healthstore::storage
