#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "internal/model/record.hpp"
#include "internal/model/record_type.hpp"

namespace healthstore::model {

enum class OperationType : std::int32_t {
  kInsert = 0,
  kUpdate = 1,
  kDelete = 2,
};

struct ChangeLogEntry {
  std::int64_t             row_id = 0;
  OperationType            operation = OperationType::kInsert;
  RecordType               record_type = RecordType::kUnknown;
  std::int64_t             app_id = 0;
  std::vector<std::string> uuids;
  std::int64_t             time_ms = 0;
};

// Filters a caller asks a token for. Empty means "all".
struct ChangeLogTokenRequest {
  std::vector<std::string>  package_names_to_filter;
  std::vector<std::int32_t> record_types;

  bool operator==(const ChangeLogTokenRequest&) const = default;
};

/*
  What a token resolves to: the filters plus the change-log row id
  the token was issued at. Changes strictly after that row are
  returned for it.
*/
struct TokenRequest {
  std::vector<std::string>  package_names_to_filter;
  std::vector<std::int32_t> record_types;
  std::string               requesting_package_name;
  std::int64_t              row_id_change_logs = -1;

  bool operator==(const TokenRequest&) const = default;
};

struct DeletedLog {
  std::string  uuid;
  RecordType   record_type = RecordType::kUnknown;
  std::int64_t deleted_time_ms = 0;
};

struct ChangeLogsResponse {
  std::vector<Record>     upserted_records;
  std::vector<DeletedLog> deleted_logs;
  std::int64_t            next_change_token = 0;
  bool                    has_more_data = false;
};

} // namespace healthstore::model
