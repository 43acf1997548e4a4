#include <atomic>
#include <cassert>
#include <future>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include "internal/util/errors.hpp"
#include "support/temp_store.hpp"

using namespace healthstore;
using healthstore::testing::HeartRate;
using healthstore::testing::Steps;
using healthstore::testing::TempStore;

namespace {

std::size_t CountRecords(TempStore& store, model::RecordType type) {
  core::ReadRecordsRequest request;
  request.record_type = type;
  return store.app().health_data_service->ReadRecords(request).size();
}

void TestConcurrentWritersAndReaders() {
  TempStore store("concurrent_api");
  auto&     app = store.app();

  const auto token = app.health_data_service->GetChangeLogToken("com.example.observer", {});

  constexpr int kPackages = 4;
  constexpr int kWrites   = 25;

  std::vector<std::future<std::vector<std::string>>> writes;
  std::vector<std::future<std::size_t>>              reads;
  for (int p = 0; p < kPackages; ++p) {
    const std::string package = "com.example.writer" + std::to_string(p);
    for (int i = 0; i < kWrites; ++i) {
      writes.push_back(app.workers->Submit([&app, package, i] {
        return app.health_data_service->InsertRecords(package, {HeartRate(1000 * i + 1, 1000 * i + 900, {{60 + i, 1000 * i + 10}})});
      }));
      if (i % 5 == 0) {
        reads.push_back(app.workers->Submit([&store] { return CountRecords(store, model::RecordType::kHeartRate); }));
      }
    }
  }

  std::size_t inserted = 0;
  for (auto& write : writes) inserted += write.get().size();
  for (auto& read : reads) assert(read.get() <= inserted);

  assert(inserted == kPackages * kWrites);
  assert(CountRecords(store, model::RecordType::kHeartRate) == inserted);

  // every insert is visible exactly once through the change log
  std::size_t from_logs = 0;
  auto        next      = token;
  while (true) {
    const auto page = app.health_data_service->GetChangeLogs("com.example.observer", next, 16);
    from_logs += page.upserted_records.size();
    next = page.next_change_token;
    if (!page.has_more_data) break;
  }
  assert(from_logs == inserted);
}

void TestMigrationStartRacesWithWriters() {
  TempStore store("concurrent_migration_start");
  auto&     app = store.app();

  std::atomic<bool> stop{false};
  std::atomic<int>  accepted{0};
  std::atomic<int>  blocked{0};

  std::thread writer([&] {
    int i = 0;
    while (!stop) {
      try {
        app.health_data_service->InsertRecords("com.example.writer", {Steps(1000 * i + 1, 1000 * i + 500, i)});
        ++accepted;
      } catch (const util::MigrationInProgress&) {
        ++blocked;
      }
      ++i;
    }
  });

  while (accepted < 10) std::this_thread::yield();
  app.migration_service->StartMigration();
  const int accepted_at_start = accepted.load();

  while (blocked < 5) std::this_thread::yield();
  // nothing slips in once the phase changed
  assert(accepted.load() <= accepted_at_start + 1);

  app.migration_service->FinishMigration();
  stop = true;
  writer.join();

  assert(CountRecords(store, model::RecordType::kSteps) == static_cast<std::size_t>(accepted.load()));
}

} // namespace

int main() {
  TestConcurrentWritersAndReaders();
  TestMigrationStartRacesWithWriters();

  std::cout << "health_store_integration_concurrency: pass\n";
  return 0;
}
