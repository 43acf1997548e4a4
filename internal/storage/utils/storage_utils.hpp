#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/sql/sql_row.hpp"

namespace healthstore::storage {

// Column type declarations shared by every table.
inline constexpr std::string_view kPrimaryAutoincrement = "INTEGER PRIMARY KEY AUTOINCREMENT";
inline constexpr std::string_view kTextNull             = "TEXT";
inline constexpr std::string_view kTextNotNull          = "TEXT NOT NULL";
inline constexpr std::string_view kTextNotNullUnique    = "TEXT NOT NULL UNIQUE";
inline constexpr std::string_view kInteger              = "INTEGER";
inline constexpr std::string_view kIntegerNotNull       = "INTEGER NOT NULL";
inline constexpr std::string_view kIntegerNotNullUnique = "INTEGER NOT NULL UNIQUE";
inline constexpr std::string_view kReal                 = "REAL";
inline constexpr std::string_view kRealNotNull          = "REAL NOT NULL";
inline constexpr std::string_view kBlob                 = "BLOB";

/*
  Maps a failed storage result onto the util exception taxonomy.
  Success is a no-op.
*/
void ThrowIfError(const db::Result& result, const std::string& context);

/*
  Multi-valued columns are stored as JSON arrays, so values may
  contain any character. Malformed stored lists raise InternalError.
*/
std::string              EncodeStringList(const std::vector<std::string>& values);
std::vector<std::string> DecodeStringList(std::string_view encoded);
std::string              EncodeIntList(const std::vector<int32_t>& values);
std::vector<int32_t>     DecodeIntList(std::string_view encoded);

// Column access by name.
std::string     GetCursorString(const db::sql::Row& row, std::string_view column);
int32_t         GetCursorInt(const db::sql::Row& row, std::string_view column);
int64_t         GetCursorLong(const db::sql::Row& row, std::string_view column);
double          GetCursorDouble(const db::sql::Row& row, std::string_view column);
db::sql::Blob   GetCursorBlob(const db::sql::Row& row, std::string_view column);
bool            IsNullValue(const db::sql::Row& row, std::string_view column);

} // namespace healthstore::storage
