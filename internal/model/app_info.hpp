#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace healthstore::model {

struct AppInfo {
  std::string               package_name;
  std::string               name;
  std::vector<std::uint8_t> icon;

  bool operator==(const AppInfo&) const = default;
};

} // namespace healthstore::model
