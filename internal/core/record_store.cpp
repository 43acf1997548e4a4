#include "record_store.hpp"

#include <algorithm>
#include <map>
#include <set>

#include "internal/storage/utils/storage_utils.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace healthstore::core {

using storage::RecordHelper;

namespace {

/*
  Collects uuids per (record type, operation) so a call writes one
  change-log entry per group.
*/
class ChangeLogBatch {
 public:
  void Add(model::RecordType type, model::OperationType operation, std::string uuid) {
    for (auto& group : groups_) {
      if (group.type == type && group.operation == operation) {
        group.uuids.push_back(std::move(uuid));
        return;
      }
    }
    groups_.push_back({type, operation, {std::move(uuid)}});
  }

  void Flush(db::Transaction& tx, const storage::ChangeLogsHelper& change_logs, std::int64_t app_id, std::int64_t time_ms) const {
    for (const auto& group : groups_) {
      change_logs.Append(tx, group.operation, group.type, app_id, group.uuids, time_ms);
    }
  }

 private:
  struct Group {
    model::RecordType        type;
    model::OperationType     operation;
    std::vector<std::string> uuids;
  };

  std::vector<Group> groups_;
};

} // namespace

RecordStore::RecordStore(std::shared_ptr<storage::DatabaseHelpers> helpers) : helpers_(std::move(helpers)) {
}

std::optional<RecordStore::StoredIdentity> RecordStore::FindByUuid(db::Transaction& tx, const RecordHelper& helper,
                                                                   const std::string& uuid) const {
  storage::WhereClauses where;
  where.AddWhereEqualsClause(std::string(RecordHelper::kUuidColumnName), uuid);

  storage::ReadTableRequest request(helper.GetMainTableName());
  request.SetColumnNames({std::string(RecordHelper::kUuidColumnName), std::string(RecordHelper::kAppInfoIdColumnName),
                          std::string(RecordHelper::kClientRecordVersionColumnName)})
      .SetWhereClause(std::move(where));

  auto cursor = helpers_->transactions->Read(tx, request);
  if (!cursor->MoveToNext()) {
    return std::nullopt;
  }
  return StoredIdentity{storage::GetCursorString(*cursor, RecordHelper::kUuidColumnName),
                        storage::GetCursorLong(*cursor, RecordHelper::kAppInfoIdColumnName),
                        storage::GetCursorLong(*cursor, RecordHelper::kClientRecordVersionColumnName)};
}

std::optional<RecordStore::StoredIdentity> RecordStore::FindByClientRecordId(db::Transaction& tx, const RecordHelper& helper,
                                                                             std::int64_t app_info_id, const std::string& client_record_id) const {
  storage::WhereClauses where;
  where.AddWhereEqualsClause(std::string(RecordHelper::kAppInfoIdColumnName), app_info_id);
  where.AddWhereEqualsClause(std::string(RecordHelper::kClientRecordIdColumnName), client_record_id);

  storage::ReadTableRequest request(helper.GetMainTableName());
  request.SetColumnNames({std::string(RecordHelper::kUuidColumnName), std::string(RecordHelper::kAppInfoIdColumnName),
                          std::string(RecordHelper::kClientRecordVersionColumnName)})
      .SetWhereClause(std::move(where))
      .SetLimit(1);

  auto cursor = helpers_->transactions->Read(tx, request);
  if (!cursor->MoveToNext()) {
    return std::nullopt;
  }
  return StoredIdentity{storage::GetCursorString(*cursor, RecordHelper::kUuidColumnName), app_info_id,
                        storage::GetCursorLong(*cursor, RecordHelper::kClientRecordVersionColumnName)};
}

void RecordStore::Replace(db::Transaction& tx, const RecordHelper& helper, const model::Record& record, std::int64_t app_info_id) const {
  const auto& uuid = model::MetadataOf(record).id;
  for (const auto& child : helper.GetChildDeleteTableRequests({uuid})) {
    storage::ThrowIfError(helpers_->transactions->Delete(tx, child), "delete samples of " + uuid);
  }
  storage::ThrowIfError(helpers_->transactions->Insert(tx, helper.GetUpsertTableRequest(record, app_info_id, storage::ConflictPolicy::kReplace)),
                        "replace record " + uuid);
}

std::vector<std::string> RecordStore::InsertRecords(db::Transaction& tx, const std::string& package_name, std::vector<model::Record> records,
                                                    InsertMode mode) const {
  const auto app_info_id = helpers_->app_info->GetOrInsertAppInfoId(tx, package_name);
  const auto now_ms      = util::NowMillis();

  std::vector<std::string> uuids;
  uuids.reserve(records.size());
  ChangeLogBatch              batch;
  std::set<model::RecordType> types_used;

  for (auto& record : records) {
    const auto& helper   = helpers_->records->Get(record);
    auto&       metadata = model::MetadataOf(record);
    metadata.package_name = package_name;
    if (mode == InsertMode::kApi || metadata.last_modified_time_ms == 0) {
      metadata.last_modified_time_ms = now_ms;
    }

    std::optional<StoredIdentity> existing;
    if (!metadata.client_record_id.empty()) {
      existing = FindByClientRecordId(tx, helper, app_info_id, metadata.client_record_id);
    }

    if (existing) {
      if (metadata.client_record_version < existing->client_record_version) {
        uuids.push_back(existing->uuid);
        continue;
      }
      metadata.id = existing->uuid;
      Replace(tx, helper, record, app_info_id);
      batch.Add(model::TypeOf(record), model::OperationType::kUpdate, metadata.id);
    } else {
      metadata.id = util::GenerateUUIDString();
      storage::ThrowIfError(helpers_->transactions->Insert(tx, helper.GetUpsertTableRequest(record, app_info_id)), "insert record " + metadata.id);
      batch.Add(model::TypeOf(record), model::OperationType::kInsert, metadata.id);
    }

    types_used.insert(model::TypeOf(record));
    uuids.push_back(metadata.id);
  }

  for (const auto type : types_used) {
    helpers_->app_info->AddRecordTypeUsed(tx, app_info_id, type);
  }
  batch.Flush(tx, *helpers_->change_logs, app_info_id, now_ms);
  return uuids;
}

void RecordStore::UpdateRecords(db::Transaction& tx, const std::string& package_name, std::vector<model::Record> records) const {
  const auto app_info_id = helpers_->app_info->GetAppInfoId(tx, package_name);
  const auto now_ms      = util::NowMillis();

  ChangeLogBatch batch;
  for (auto& record : records) {
    const auto& helper   = helpers_->records->Get(record);
    auto&       metadata = model::MetadataOf(record);

    std::optional<StoredIdentity> stored;
    if (!metadata.id.empty()) {
      stored = FindByUuid(tx, helper, metadata.id);
    }
    if (!app_info_id || !stored || stored->app_info_id != *app_info_id) {
      throw util::NotFound("record '" + metadata.id + "' of type " + std::string(model::RecordTypeName(helper.GetRecordType())) +
                           " does not exist or belongs to another package");
    }

    metadata.package_name          = package_name;
    metadata.last_modified_time_ms = now_ms;
    Replace(tx, helper, record, *app_info_id);
    batch.Add(model::TypeOf(record), model::OperationType::kUpdate, metadata.id);
  }

  if (app_info_id) {
    batch.Flush(tx, *helpers_->change_logs, *app_info_id, now_ms);
  }
}

int RecordStore::DeleteRecords(db::Transaction& tx, const std::string& package_name, model::RecordType type,
                               const std::vector<std::string>& uuids) const {
  const auto app_info_id = helpers_->app_info->GetAppInfoId(tx, package_name);
  if (!app_info_id || uuids.empty()) {
    return 0;
  }
  const auto& helper = helpers_->records->Get(type);

  storage::WhereClauses where;
  where.AddWhereInClause(std::string(RecordHelper::kUuidColumnName), uuids);
  where.AddWhereEqualsClause(std::string(RecordHelper::kAppInfoIdColumnName), *app_info_id);

  storage::ReadTableRequest request(helper.GetMainTableName());
  request.SetColumnNames({std::string(RecordHelper::kUuidColumnName)}).SetWhereClause(std::move(where));

  std::vector<std::string> owned;
  {
    auto cursor = helpers_->transactions->Read(tx, request);
    while (cursor->MoveToNext()) {
      owned.push_back(storage::GetCursorString(*cursor, RecordHelper::kUuidColumnName));
    }
  }
  if (owned.empty()) {
    return 0;
  }

  // sample rows go with their parent through the foreign key cascade
  int deleted = 0;
  storage::ThrowIfError(helpers_->transactions->Delete(tx, helper.GetDeleteTableRequest(owned), &deleted), "delete records");
  helpers_->change_logs->Append(tx, model::OperationType::kDelete, type, *app_info_id, owned, util::NowMillis());
  return deleted;
}

std::vector<model::Record> RecordStore::ReadRecords(db::Transaction& tx, const ReadRecordsRequest& request) const {
  const auto& helper = helpers_->records->Get(request.record_type);

  storage::ReadRecordsFilter filter;
  filter.uuids         = request.uuids;
  filter.start_time_ms = request.start_time_ms;
  filter.end_time_ms   = request.end_time_ms;
  if (!request.package_names.empty()) {
    filter.app_ids = helpers_->app_info->GetAppInfoIds(tx, request.package_names);
  }

  const auto packages = helpers_->app_info->GetIdToPackageNameMap(tx);
  auto       cursor   = helpers_->transactions->Read(tx, helper.GetReadTableRequest(filter));
  return helper.ReadRecords(*cursor, packages);
}

model::ChangeLogsResponse RecordStore::GetChangeLogs(db::Transaction& tx, const std::string& package_name, std::int64_t token,
                                                     int page_size) const {
  const auto request = helpers_->change_log_requests->GetRequest(tx, token);
  if (request.requesting_package_name != package_name) {
    throw util::ValidationError("change log token " + std::to_string(token) + " was not issued to " + package_name);
  }

  std::optional<std::vector<std::int64_t>> app_ids;
  if (!request.package_names_to_filter.empty()) {
    app_ids = helpers_->app_info->GetAppInfoIds(tx, request.package_names_to_filter);
  }

  const auto page = helpers_->change_logs->GetChangeLogs(tx, request, app_ids, page_size);

  model::ChangeLogsResponse                             response;
  std::map<model::RecordType, std::vector<std::string>> upserted;
  std::set<std::string>                                 seen;
  for (const auto& entry : page.entries) {
    for (const auto& uuid : entry.uuids) {
      if (entry.operation == model::OperationType::kDelete) {
        response.deleted_logs.push_back({uuid, entry.record_type, entry.time_ms});
      } else if (seen.insert(uuid).second) {
        upserted[entry.record_type].push_back(uuid);
      }
    }
  }

  for (const auto& [type, uuids] : upserted) {
    ReadRecordsRequest read;
    read.record_type = type;
    read.uuids       = uuids;
    for (auto& record : ReadRecords(tx, read)) {
      response.upserted_records.push_back(std::move(record));
    }
  }

  const auto next_row_id     = page.entries.empty() ? request.row_id_change_logs : page.entries.back().row_id;
  response.next_change_token = helpers_->change_log_requests->GetNextPageToken(tx, request, next_row_id);
  response.has_more_data     = page.has_more;
  return response;
}

} // namespace healthstore::core
