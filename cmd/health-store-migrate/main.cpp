#include <cstddef>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/migration_importer.hpp"

using healthstore::observability::StringField;

namespace {

constexpr std::size_t kDefaultBatchSize = 100;

void PrintUsage() {
  std::cerr << "Usage: health-store-migrate --config <config.yaml> [--import <entities.jsonl>] [--batch-size <n>]" << std::endl;
}

} // namespace

int main(int argc, char** argv) {
  std::string config_path;
  std::string import_path;
  std::size_t batch_size = kDefaultBatchSize;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (i + 1 >= argc) {
      PrintUsage();
      return 1;
    }
    if (arg == "--config") {
      config_path = argv[++i];
    } else if (arg == "--import") {
      import_path = argv[++i];
    } else if (arg == "--batch-size") {
      try {
        batch_size = std::stoul(argv[++i]);
      } catch (const std::logic_error&) {
        PrintUsage();
        return 1;
      }
    } else {
      PrintUsage();
      return 1;
    }
  }
  if (config_path.empty() || batch_size == 0) {
    PrintUsage();
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = healthstore::config::ConfigLoader::LoadFromYaml(config_path);
    healthstore::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = healthstore::factory::Build(config);

    if (!import_path.empty()) {
      std::ifstream in(import_path);
      if (!in) throw std::runtime_error("failed to open import file: " + import_path);

      healthstore::service::MigrationImporter importer(*app.migration_service, *app.workers, batch_size);
      const auto                              summary = importer.Import(in);

      for (const auto& failure : summary.failures) {
        std::cerr << import_path << ":" << failure.line;
        if (!failure.entity_id.empty()) std::cerr << " entity '" << failure.entity_id << "'";
        std::cerr << ": " << failure.message << std::endl;
      }
      std::cout << "imported=" << summary.entities << " batches=" << summary.batches << " failed=" << summary.failures.size() << std::endl;
    }

    const auto state = app.migration_service->GetMigrationState();
    std::cout << "migration_state=" << healthstore::model::PhaseName(state.phase)
              << " min_sdk_extension_version=" << state.min_sdk_extension_version << std::endl;

    app.workers->Stop();
    healthstore::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    HEALTHSTORE_LOG_ERROR("Fatal error", {StringField("error", e.what())});
    healthstore::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}
