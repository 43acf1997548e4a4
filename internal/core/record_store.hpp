#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/transaction.hpp"
#include "internal/model/change_log.hpp"
#include "internal/model/record.hpp"
#include "internal/storage/datatypehelpers/database_helpers.hpp"

namespace healthstore::core {

enum class InsertMode {
  kApi,        // fresh uuid, last modified = now
  kMigration,  // fresh uuid, keeps a last modified time the source supplied
};

struct ReadRecordsRequest {
  model::RecordType           record_type = model::RecordType::kUnknown;
  std::vector<std::string>    uuids;          // empty: any
  std::vector<std::string>    package_names;  // empty: any
  std::optional<std::int64_t> start_time_ms;  // inclusive
  std::optional<std::int64_t> end_time_ms;    // exclusive
};

/*
  RecordStore

  Record CRUD over the record helpers. Each mutation runs in the
  caller's write transaction and appends its change-log entry in the
  same transaction.

  A record inserted with a client record id that the package already
  used for the same type replaces the stored one when its client
  version is not lower, and is dropped otherwise.
*/
class RecordStore {
 public:
  explicit RecordStore(std::shared_ptr<storage::DatabaseHelpers> helpers);

  // Returns the uuid under which each record is stored, in input order.
  std::vector<std::string> InsertRecords(db::Transaction& tx, const std::string& package_name, std::vector<model::Record> records,
                                         InsertMode mode = InsertMode::kApi) const;

  // Throws util::NotFound unless every uuid names a record of package_name.
  void UpdateRecords(db::Transaction& tx, const std::string& package_name, std::vector<model::Record> records) const;

  // Deletes the listed records owned by package_name; returns how many were removed.
  int DeleteRecords(db::Transaction& tx, const std::string& package_name, model::RecordType type,
                    const std::vector<std::string>& uuids) const;

  std::vector<model::Record> ReadRecords(db::Transaction& tx, const ReadRecordsRequest& request) const;

  model::ChangeLogsResponse GetChangeLogs(db::Transaction& tx, const std::string& package_name, std::int64_t token, int page_size) const;

 private:
  struct StoredIdentity {
    std::string  uuid;
    std::int64_t app_info_id           = 0;
    std::int64_t client_record_version = 0;
  };

  std::optional<StoredIdentity> FindByUuid(db::Transaction& tx, const storage::RecordHelper& helper, const std::string& uuid) const;
  std::optional<StoredIdentity> FindByClientRecordId(db::Transaction& tx, const storage::RecordHelper& helper, std::int64_t app_info_id,
                                                     const std::string& client_record_id) const;

  void Replace(db::Transaction& tx, const storage::RecordHelper& helper, const model::Record& record, std::int64_t app_info_id) const;

  std::shared_ptr<storage::DatabaseHelpers> helpers_;
};

} // namespace healthstore::core
