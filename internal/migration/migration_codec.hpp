#pragma once

#include <string>

#include "healthstore/migration/v1/migration.pb.h"
#include "internal/model/migration_entity.hpp"

namespace healthstore::migration {

/*
  MigrationCodec

  Wire <-> model conversion for migration entities.

  Decode raises util::UnsupportedType when payload_kind is unspecified,
  unknown, or names a different payload than the one set, and
  util::ValidationError for any other malformed field. Payload errors
  are prefixed with the entity id. Timestamps outside the
  google.protobuf.Timestamp range are rejected in both directions.
*/
class MigrationCodec {
 public:
  static model::MigrationEntity Decode(const v1::MigrationEntity& wire);
  static v1::MigrationEntity    Encode(const model::MigrationEntity& entity);

  static model::Record DecodeRecord(const v1::Record& wire);
  static v1::Record    EncodeRecord(const model::Record& record);

  // Parsing failures raise util::ValidationError.
  static v1::MigrationEntity ParseJson(const std::string& json);
  static v1::MigrationEntity ParseBinary(const std::string& bytes);
  static std::string         ToJson(const v1::MigrationEntity& wire);

 private:
  static model::MigrationEntity DecodePayload(const v1::MigrationEntity& wire);
};

} // namespace healthstore::migration
