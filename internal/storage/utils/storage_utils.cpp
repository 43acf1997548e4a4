#include "storage_utils.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <cmath>

#include "internal/util/errors.hpp"

namespace healthstore::storage {
namespace {

std::string EncodeList(const google::protobuf::ListValue& list) {
  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(list, &json);
  if (!status.ok()) {
    throw util::InternalError("encode list column: " + std::string(status.message()));
  }
  return json;
}

google::protobuf::ListValue DecodeList(std::string_view encoded) {
  google::protobuf::ListValue list;
  if (encoded.empty()) {
    return list;
  }
  auto status = google::protobuf::util::JsonStringToMessage(std::string(encoded), &list);
  if (!status.ok()) {
    throw util::InternalError("decode list column: " + std::string(status.message()));
  }
  return list;
}

} // namespace

void ThrowIfError(const db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const std::string msg = context + ": " + result.message;
  switch (result.code) {
    case db::ErrorCode::NotFound:
      throw util::NotFound(msg);
    case db::ErrorCode::AlreadyExists:
      throw util::AlreadyExists(msg);
    case db::ErrorCode::Conflict:
    case db::ErrorCode::ConstraintViolation:
      throw util::ValidationError(msg);
    case db::ErrorCode::Busy:
      throw util::ResourceExhausted(msg);
    default:
      throw util::InternalError(msg);
  }
}

std::string EncodeStringList(const std::vector<std::string>& values) {
  google::protobuf::ListValue list;
  for (const auto& value : values) {
    list.add_values()->set_string_value(value);
  }
  return EncodeList(list);
}

std::vector<std::string> DecodeStringList(std::string_view encoded) {
  const auto               list = DecodeList(encoded);
  std::vector<std::string> values;
  for (const auto& value : list.values()) {
    if (value.kind_case() != google::protobuf::Value::kStringValue) {
      throw util::InternalError("decode list column: expected string element");
    }
    values.push_back(value.string_value());
  }
  return values;
}

std::string EncodeIntList(const std::vector<int32_t>& values) {
  google::protobuf::ListValue list;
  for (const auto value : values) {
    list.add_values()->set_number_value(value);
  }
  return EncodeList(list);
}

std::vector<int32_t> DecodeIntList(std::string_view encoded) {
  const auto           list = DecodeList(encoded);
  std::vector<int32_t> values;
  for (const auto& value : list.values()) {
    if (value.kind_case() != google::protobuf::Value::kNumberValue || std::trunc(value.number_value()) != value.number_value()) {
      throw util::InternalError("decode list column: expected integer element");
    }
    values.push_back(static_cast<int32_t>(value.number_value()));
  }
  return values;
}

std::string GetCursorString(const db::sql::Row& row, std::string_view column) {
  return row.GetText(row.ColumnIndex(column));
}

int32_t GetCursorInt(const db::sql::Row& row, std::string_view column) {
  return row.GetInt(row.ColumnIndex(column));
}

int64_t GetCursorLong(const db::sql::Row& row, std::string_view column) {
  return row.GetInt64(row.ColumnIndex(column));
}

double GetCursorDouble(const db::sql::Row& row, std::string_view column) {
  return row.GetDouble(row.ColumnIndex(column));
}

db::sql::Blob GetCursorBlob(const db::sql::Row& row, std::string_view column) {
  return row.GetBlob(row.ColumnIndex(column));
}

bool IsNullValue(const db::sql::Row& row, std::string_view column) {
  return row.IsNull(row.ColumnIndex(column));
}

} // namespace healthstore::storage
