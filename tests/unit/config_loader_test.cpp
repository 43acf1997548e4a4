#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "health_store_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void TestScalarEscapingForQuotedAndBackslashValues() {
  const auto yaml_path = WriteYaml("quoted_backslash",
                                   R"(database:
  sqlite:
    path: "C:\\health\\\"quoted\"\\db.sqlite"
    wal_mode: true
)");

  auto config = healthstore::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().sqlite().path() == "C:\\health\\\"quoted\"\\db.sqlite");
  assert(config.database().sqlite().wal_mode());
}

void TestQuotedNumbersStayStrings() {
  auto config = healthstore::config::ConfigLoader::LoadFromYamlString(R"(packages:
  installed:
    - package_name: "com.example.one"
      app_name: "1234"
    - package_name: "com.example.two"
      app_name: "Two ☃"
)");

  assert(config.packages().installed_size() == 2);
  assert(config.packages().installed(0).app_name() == "1234");
  assert(config.packages().installed(1).package_name() == "com.example.two");
  assert(config.packages().installed(1).app_name() == std::string("Two ☃"));
}

void TestDefaultsFillUnsetFields() {
  auto config = healthstore::config::ConfigLoader::LoadFromYamlString(R"(migration:
  module_sdk_extension_version: 12
records:
  default_retention_period_days: 30
)");

  assert(config.database().sqlite().path() == "health_store.db");
  assert(config.database().sqlite().busy_timeout_ms() == 5000);
  assert(config.database().sqlite().max_readers() == 4);
  assert(config.workers().threads() == 4);
  assert(config.workers().queue_capacity() == 256);
  assert(config.records().change_logs_page_size() == 1000);
  assert(config.records().default_retention_period_days() == 30);
  assert(config.migration().module_sdk_extension_version() == 12);
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(database:
  sqlite:
    path: "/tmp/data"
unknown_field: 123
)");

  bool threw = false;
  try {
    (void)healthstore::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestMissingFileIsReported() {
  bool threw = false;
  try {
    (void)healthstore::config::ConfigLoader::LoadFromYaml("/nonexistent/health_store.yaml");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

void TestExampleConfigLoads() {
  const auto config = healthstore::config::ConfigLoader::LoadFromYaml(std::string(HEALTHSTORE_SOURCE_DIR) + "/config/health_store.example.yaml");
  assert(config.database().sqlite().wal_mode());
  assert(config.packages().installed_size() == 2);
  assert(config.migration().module_sdk_extension_version() == 10);
}

} // namespace

int main() {
  TestScalarEscapingForQuotedAndBackslashValues();
  TestQuotedNumbersStayStrings();
  TestDefaultsFillUnsetFields();
  TestUnknownFieldsAreRejected();
  TestMissingFileIsReported();
  TestExampleConfigLoads();

  std::cout << "health_store_unit_config_loader: pass\n";
  return 0;
}
