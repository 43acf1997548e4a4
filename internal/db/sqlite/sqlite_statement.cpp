#include "sqlite_statement.hpp"

#include <stdexcept>
#include <type_traits>

namespace healthstore::db::sqlite {

SqliteStatement::SqliteStatement(sqlite3* db, const std::string& sql) : db_(db), sql_(sql) {
  int rc = sqlite3_prepare_v2(db_, sql_.c_str(), -1, &stmt_, nullptr);
  if (rc != SQLITE_OK) {
    std::string msg = sqlite3_errmsg(db_);
    sqlite3_finalize(stmt_);
    stmt_ = nullptr;
    throw std::runtime_error("sqlite prepare: " + msg + " [" + sql_ + "]");
  }

  const int count = sqlite3_column_count(stmt_);
  for (int col = 0; col < count; ++col) {
    columns_.emplace(sqlite3_column_name(stmt_, col), col);
  }
}

SqliteStatement::~SqliteStatement() {
  if (stmt_) sqlite3_finalize(stmt_);
}

void SqliteStatement::Bind(int index, const sql::Param& param) {
  const int rc = std::visit(
      [&](const auto& v) -> int {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
          return sqlite3_bind_null(stmt_, index);
        } else if constexpr (std::is_same_v<T, int32_t>) {
          return sqlite3_bind_int(stmt_, index, v);
        } else if constexpr (std::is_same_v<T, int64_t>) {
          return sqlite3_bind_int64(stmt_, index, static_cast<sqlite3_int64>(v));
        } else if constexpr (std::is_same_v<T, double>) {
          return sqlite3_bind_double(stmt_, index, v);
        } else if constexpr (std::is_same_v<T, std::string>) {
          return sqlite3_bind_text(stmt_, index, v.c_str(), static_cast<int>(v.size()), SQLITE_TRANSIENT);
        } else {
          // a null data pointer would bind NULL instead of an empty blob
          if (v.empty()) return sqlite3_bind_zeroblob(stmt_, index, 0);
          return sqlite3_bind_blob(stmt_, index, v.data(), static_cast<int>(v.size()), SQLITE_TRANSIENT);
        }
      },
      param);

  if (rc != SQLITE_OK) {
    throw std::runtime_error("sqlite bind " + std::to_string(index) + ": " + sqlite3_errmsg(db_));
  }
}

void SqliteStatement::BindAll(const sql::Params& params) {
  for (std::size_t i = 0; i < params.size(); ++i) {
    Bind(static_cast<int>(i) + 1, params[i]);
  }
}

Result SqliteStatement::Execute() {
  int rc;
  while ((rc = sqlite3_step(stmt_)) == SQLITE_ROW) {
  }
  done_ = true;
  return Translate(db_, rc);
}

bool SqliteStatement::MoveToNext() {
  if (done_) return false;

  const int rc = sqlite3_step(stmt_);
  if (rc == SQLITE_ROW) return true;

  done_ = true;
  if (rc != SQLITE_DONE) {
    throw std::runtime_error("sqlite step: " + std::string(sqlite3_errmsg(db_)));
  }
  return false;
}

int64_t SqliteStatement::LastInsertRowId() const {
  return static_cast<int64_t>(sqlite3_last_insert_rowid(db_));
}

int SqliteStatement::Changes() const {
  return sqlite3_changes(db_);
}

int SqliteStatement::ColumnCount() const {
  return sqlite3_column_count(stmt_);
}

std::string SqliteStatement::ColumnName(int col) const {
  const char* name = sqlite3_column_name(stmt_, col);
  return name ? name : "";
}

int SqliteStatement::ColumnIndex(std::string_view name) const {
  auto it = columns_.find(std::string(name));
  if (it == columns_.end()) {
    throw std::out_of_range("sqlite: no column named " + std::string(name) + " in [" + sql_ + "]");
  }
  return it->second;
}

std::string SqliteStatement::GetText(int col) const {
  const unsigned char* t = sqlite3_column_text(stmt_, col);
  return t ? std::string(reinterpret_cast<const char*>(t), sqlite3_column_bytes(stmt_, col)) : "";
}

int SqliteStatement::GetInt(int col) const {
  return sqlite3_column_int(stmt_, col);
}

int64_t SqliteStatement::GetInt64(int col) const {
  return static_cast<int64_t>(sqlite3_column_int64(stmt_, col));
}

double SqliteStatement::GetDouble(int col) const {
  return sqlite3_column_double(stmt_, col);
}

sql::Blob SqliteStatement::GetBlob(int col) const {
  const auto* data = static_cast<const uint8_t*>(sqlite3_column_blob(stmt_, col));
  const int   size = sqlite3_column_bytes(stmt_, col);
  return data ? sql::Blob(data, data + size) : sql::Blob{};
}

bool SqliteStatement::IsNull(int col) const {
  return sqlite3_column_type(stmt_, col) == SQLITE_NULL;
}

sql::Param SqliteStatement::GetValue(int col) const {
  switch (sqlite3_column_type(stmt_, col)) {
    case SQLITE_INTEGER:
      return GetInt64(col);
    case SQLITE_FLOAT:
      return GetDouble(col);
    case SQLITE_TEXT:
      return GetText(col);
    case SQLITE_BLOB:
      return GetBlob(col);
    default:
      return nullptr;
  }
}

Result SqliteStatement::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
    return Result::Ok();

  switch (rc & 0xFF) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      if (rc == SQLITE_CONSTRAINT_UNIQUE || rc == SQLITE_CONSTRAINT_PRIMARYKEY)
        return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
    case SQLITE_NOTADB:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

} // namespace healthstore::db::sqlite
