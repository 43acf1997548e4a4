#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace healthstore::core {

struct InstalledPackage {
  std::string package_name;
  std::string app_name;
};

/*
  Which packages are installed on the device right now. Records and
  migrated app info outlive installation, so the store asks this at
  read time instead of persisting it.
*/
class PackageRegistry {
 public:
  virtual ~PackageRegistry() = default;

  virtual bool IsInstalled(const std::string& package_name) const = 0;

  // nullopt when not installed
  virtual std::optional<std::string> GetAppName(const std::string& package_name) const = 0;
};

// Registry fed from configuration; tests install and uninstall at will.
class StaticPackageRegistry final : public PackageRegistry {
 public:
  StaticPackageRegistry() = default;
  explicit StaticPackageRegistry(const std::vector<InstalledPackage>& packages);

  void Install(InstalledPackage package);
  void Uninstall(const std::string& package_name);

  bool                       IsInstalled(const std::string& package_name) const override;
  std::optional<std::string> GetAppName(const std::string& package_name) const override;

 private:
  mutable std::mutex                           mutex_;
  std::unordered_map<std::string, std::string> packages_;  // package -> app name
};

} // namespace healthstore::core
