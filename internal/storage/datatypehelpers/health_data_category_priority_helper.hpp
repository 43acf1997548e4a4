#pragma once

#include <memory>
#include <string>
#include <vector>

#include "internal/db/api/transaction.hpp"
#include "internal/model/record_type.hpp"
#include "internal/storage/transaction_manager.hpp"

namespace healthstore::storage {

/*
  Per data category, the packages whose data wins when sources
  overlap, highest priority first.
*/
class HealthDataCategoryPriorityHelper {
 public:
  static constexpr std::string_view kTableName                 = "health_data_category_priority_table";
  static constexpr std::string_view kPrimaryColumnName         = "row_id";
  static constexpr std::string_view kCategoryColumnName        = "health_data_category";
  static constexpr std::string_view kPackagePriorityColumnName = "package_priority_order";

  explicit HealthDataCategoryPriorityHelper(std::shared_ptr<TransactionManager> transactions);

  CreateTableRequest GetCreateTableRequest() const;

  std::vector<std::string> GetPriorityOrder(db::Transaction& tx, model::HealthDataCategory category) const;
  void SetPriorityOrder(db::Transaction& tx, model::HealthDataCategory category, const std::vector<std::string>& packages) const;

  /*
    Incoming order first, then existing packages the incoming list
    does not name, each package once. Packages rejected by has_write
    are dropped from the result.
  */
  template <typename HasWrite>
  static std::vector<std::string> MergePriorityOrder(const std::vector<std::string>& existing, const std::vector<std::string>& incoming,
                                                     HasWrite&& has_write) {
    std::vector<std::string> merged;
    auto                     add = [&](const std::string& package) {
      for (const auto& seen : merged) {
        if (seen == package) return;
      }
      merged.push_back(package);
    };
    for (const auto& package : incoming) add(package);
    for (const auto& package : existing) add(package);

    std::vector<std::string> kept;
    for (auto& package : merged) {
      if (has_write(package)) kept.push_back(std::move(package));
    }
    return kept;
  }

 private:
  std::shared_ptr<TransactionManager> transactions_;
};

} // namespace healthstore::storage
