#include "where_clauses.hpp"

namespace healthstore::storage {
namespace {

std::string Placeholders(std::size_t count) {
  std::string out;
  for (std::size_t i = 0; i < count; ++i) {
    out += i == 0 ? "?" : ",?";
  }
  return out;
}

} // namespace

WhereClauses& WhereClauses::AddWhereEqualsClause(const std::string& column, db::sql::Param value) {
  clauses_.push_back(column + " = ?");
  params_.push_back(std::move(value));
  return *this;
}

WhereClauses& WhereClauses::AddWhereInClause(const std::string& column, const std::vector<std::string>& values) {
  if (values.empty()) {
    clauses_.push_back("0 = 1");
    return *this;
  }
  clauses_.push_back(column + " IN (" + Placeholders(values.size()) + ")");
  params_.insert(params_.end(), values.begin(), values.end());
  return *this;
}

WhereClauses& WhereClauses::AddWhereInIntsClause(const std::string& column, const std::vector<int64_t>& values) {
  if (values.empty()) {
    clauses_.push_back("0 = 1");
    return *this;
  }
  clauses_.push_back(column + " IN (" + Placeholders(values.size()) + ")");
  params_.insert(params_.end(), values.begin(), values.end());
  return *this;
}

WhereClauses& WhereClauses::AddWhereGreaterThanClause(const std::string& column, int64_t value) {
  clauses_.push_back(column + " > ?");
  params_.emplace_back(value);
  return *this;
}

WhereClauses& WhereClauses::AddWhereGreaterThanOrEqualClause(const std::string& column, int64_t value) {
  clauses_.push_back(column + " >= ?");
  params_.emplace_back(value);
  return *this;
}

WhereClauses& WhereClauses::AddWhereLessThanClause(const std::string& column, int64_t value) {
  clauses_.push_back(column + " < ?");
  params_.emplace_back(value);
  return *this;
}

std::string WhereClauses::Get(bool with_where_keyword) const {
  if (clauses_.empty()) {
    return {};
  }

  std::string out = with_where_keyword ? " WHERE " : " ";
  for (std::size_t i = 0; i < clauses_.size(); ++i) {
    if (i > 0) out += " AND ";
    out += clauses_[i];
  }
  return out;
}

} // namespace healthstore::storage
