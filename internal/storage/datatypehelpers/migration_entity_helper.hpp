#pragma once

#include <memory>
#include <string>

#include "internal/db/api/transaction.hpp"
#include "internal/storage/transaction_manager.hpp"

namespace healthstore::storage {

// Ids of migration entities already applied; never cleared.
class MigrationEntityHelper {
 public:
  static constexpr std::string_view kTableName          = "migration_entity_table";
  static constexpr std::string_view kPrimaryColumnName  = "row_id";
  static constexpr std::string_view kEntityIdColumnName = "entity_id";

  explicit MigrationEntityHelper(std::shared_ptr<TransactionManager> transactions);

  CreateTableRequest GetCreateTableRequest() const;

  // False when the id was already recorded.
  bool InsertEntity(db::Transaction& tx, const std::string& entity_id) const;
  bool Contains(db::Transaction& tx, const std::string& entity_id) const;

 private:
  std::shared_ptr<TransactionManager> transactions_;
};

} // namespace healthstore::storage
