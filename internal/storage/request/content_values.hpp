#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "internal/db/sql/sql_params.hpp"

namespace healthstore::storage {

/*
  Ordered column -> value map for one row. Putting an existing
  column replaces its value in place.
*/
class ContentValues {
 public:
  using Entry = std::pair<std::string, db::sql::Param>;

  void Put(std::string column, db::sql::Param value) {
    for (auto& entry : entries_) {
      if (entry.first == column) {
        entry.second = std::move(value);
        return;
      }
    }
    entries_.emplace_back(std::move(column), std::move(value));
  }

  std::optional<db::sql::Param> Get(const std::string& column) const {
    for (const auto& entry : entries_) {
      if (entry.first == column) return entry.second;
    }
    return std::nullopt;
  }

  const std::vector<Entry>& Entries() const {
    return entries_;
  }

  bool Empty() const {
    return entries_.empty();
  }

 private:
  std::vector<Entry> entries_;
};

} // namespace healthstore::storage
