#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace healthstore::util {

/*
  UUID helpers

  Record ids are random RFC4122 v4 UUIDs stored in their
  canonical 36 character text form.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);

std::string GenerateUUIDString();

} // namespace healthstore::util
