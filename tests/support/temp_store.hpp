#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/model/record.hpp"

namespace healthstore::testing {

inline constexpr std::string_view kInstalledPackage = "com.example.installed";
inline constexpr std::string_view kInstalledAppName = "Installed App";

/*
  A fully wired store in its own directory under the system temp
  path. The directory is removed on destruction.
*/
class TempStore {
 public:
  explicit TempStore(const std::string& name, std::int32_t module_sdk_extension_version = 10)
      : dir_(std::filesystem::temp_directory_path() / "health_store_tests" / name) {
    std::filesystem::remove_all(dir_);
    std::filesystem::create_directories(dir_);

    config_.mutable_database()->mutable_sqlite()->set_path((dir_ / "health_store.db").string());
    config_.mutable_database()->mutable_sqlite()->set_wal_mode(true);
    config_.mutable_migration()->set_module_sdk_extension_version(module_sdk_extension_version);
    auto* installed = config_.mutable_packages()->add_installed();
    installed->set_package_name(std::string(kInstalledPackage));
    installed->set_app_name(std::string(kInstalledAppName));
    config::ConfigLoader::ApplyDefaults(config_);

    app_ = factory::Build(config_);
  }

  ~TempStore() {
    Close();
    std::error_code ignored;
    std::filesystem::remove_all(dir_, ignored);
  }

  TempStore(const TempStore&)            = delete;
  TempStore& operator=(const TempStore&) = delete;

  // Drops every connection; Reopen() builds a new application over the same file.
  void Close() {
    if (app_.workers) app_.workers->Stop();
    app_ = factory::Application{};
  }

  void Reopen() {
    Close();
    app_ = factory::Build(config_);
  }

  factory::Application& app() {
    return app_;
  }

  healthstore::runtime::config::RuntimeConfig& config() {
    return config_;
  }

 private:
  std::filesystem::path                       dir_;
  healthstore::runtime::config::RuntimeConfig config_;
  factory::Application                        app_;
};

inline model::RecordMetadata Metadata(std::string client_record_id = {}, std::int64_t client_record_version = 0) {
  model::RecordMetadata metadata;
  metadata.client_record_id      = std::move(client_record_id);
  metadata.client_record_version = client_record_version;
  metadata.device                = {"Acme", "Band 2", 3};
  return metadata;
}

inline model::IntervalTime Interval(std::int64_t start_ms, std::int64_t end_ms) {
  return model::IntervalTime::Create(start_ms, 3600, end_ms, 3600);
}

inline model::StepsRecord Steps(std::int64_t start_ms, std::int64_t end_ms, std::int64_t count) {
  return model::StepsRecord{Metadata(), Interval(start_ms, end_ms), count};
}

inline model::WeightRecord Weight(std::int64_t time_ms, double grams) {
  return model::WeightRecord{Metadata(), {time_ms, 0}, grams};
}

inline model::HeartRateRecord HeartRate(std::int64_t start_ms, std::int64_t end_ms, std::vector<model::HeartRateRecord::Sample> samples) {
  return model::HeartRateRecord{Metadata(), Interval(start_ms, end_ms), std::move(samples)};
}

} // namespace healthstore::testing
