#pragma once

#include <memory>

#include "internal/core/package_registry.hpp"
#include "internal/core/record_store.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/model/migration_entity.hpp"
#include "internal/storage/datatypehelpers/database_helpers.hpp"

namespace healthstore::migration {

/*
  Applies one migration payload inside the batch transaction. Bad
  payloads raise util::ValidationError (or a subclass) before or
  while writing; the caller rolls the entity back.
*/
class MigrationPayloadApplier {
 public:
  MigrationPayloadApplier(std::shared_ptr<storage::DatabaseHelpers> helpers, std::shared_ptr<core::RecordStore> records,
                          std::shared_ptr<core::PackageRegistry> packages);

  void Apply(db::Transaction& tx, const model::MigrationPayload& payload) const;

  // App info staged during the run: applied where it now qualifies, then dropped.
  void ResolveStagedAppInfo(db::Transaction& tx) const;

 private:
  void ApplyRecord(db::Transaction& tx, const model::RecordPayload& payload) const;
  void ApplyPermissions(db::Transaction& tx, const model::PermissionPayload& payload) const;
  void ApplyPriority(db::Transaction& tx, const model::PriorityPayload& payload) const;
  void ApplyAppInfo(db::Transaction& tx, const model::AppInfoPayload& payload) const;
  void ApplyMetadata(db::Transaction& tx, const model::MetadataPayload& payload) const;

  std::shared_ptr<storage::DatabaseHelpers> helpers_;
  std::shared_ptr<core::RecordStore>        records_;
  std::shared_ptr<core::PackageRegistry>    packages_;
};

} // namespace healthstore::migration
