#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "internal/db/sql/sql_params.hpp"

namespace healthstore::storage {

/*
  AND-joined predicates with bound parameters.
*/
class WhereClauses {
 public:
  WhereClauses& AddWhereEqualsClause(const std::string& column, db::sql::Param value);
  WhereClauses& AddWhereInClause(const std::string& column, const std::vector<std::string>& values);
  WhereClauses& AddWhereInIntsClause(const std::string& column, const std::vector<int64_t>& values);
  WhereClauses& AddWhereGreaterThanClause(const std::string& column, int64_t value);
  WhereClauses& AddWhereGreaterThanOrEqualClause(const std::string& column, int64_t value);
  WhereClauses& AddWhereLessThanClause(const std::string& column, int64_t value);

  // [start, end) on a millisecond column

  std::string Get(bool with_where_keyword) const;

  const db::sql::Params& GetParams() const {
    return params_;
  }

 private:
  std::vector<std::string> clauses_;
  db::sql::Params          params_;
};

} // namespace healthstore::storage
