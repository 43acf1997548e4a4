#pragma once

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace healthstore::db::sql {

/*
  Parameter abstraction.

  SQLite binds ? placeholders in order; every request object
  keeps its parameters in the same order as its placeholders.
*/

using Blob = std::vector<std::uint8_t>;

using Param = std::variant<
    std::nullptr_t,
    int32_t,
    int64_t,
    double,
    std::string,
    Blob
>;

using Params = std::vector<Param>;

}
