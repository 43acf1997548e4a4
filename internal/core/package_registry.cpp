#include "package_registry.hpp"

namespace healthstore::core {

StaticPackageRegistry::StaticPackageRegistry(const std::vector<InstalledPackage>& packages) {
  for (const auto& package : packages) {
    packages_[package.package_name] = package.app_name;
  }
}

void StaticPackageRegistry::Install(InstalledPackage package) {
  std::lock_guard lock(mutex_);
  packages_[package.package_name] = std::move(package.app_name);
}

void StaticPackageRegistry::Uninstall(const std::string& package_name) {
  std::lock_guard lock(mutex_);
  packages_.erase(package_name);
}

bool StaticPackageRegistry::IsInstalled(const std::string& package_name) const {
  std::lock_guard lock(mutex_);
  return packages_.count(package_name) > 0;
}

std::optional<std::string> StaticPackageRegistry::GetAppName(const std::string& package_name) const {
  std::lock_guard lock(mutex_);
  auto it = packages_.find(package_name);
  if (it == packages_.end()) return std::nullopt;
  return it->second;
}

} // namespace healthstore::core
