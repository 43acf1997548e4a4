#pragma once

#include <memory>
#include <vector>

#include "internal/model/record.hpp"
#include "internal/storage/datatypehelpers/record_helper.hpp"

namespace healthstore::storage {

/*
  One helper per record kind, built once from the Record variant.
*/
class RecordHelperRegistry {
 public:
  RecordHelperRegistry();

  // Throws util::ValidationError for a type without a helper.
  const RecordHelper& Get(model::RecordType type) const;

  const RecordHelper& Get(const model::Record& record) const {
    return Get(model::TypeOf(record));
  }

  const std::vector<std::unique_ptr<RecordHelper>>& All() const {
    return helpers_;
  }

 private:
  std::vector<std::unique_ptr<RecordHelper>> helpers_;
};

} // namespace healthstore::storage
