#include <algorithm>
#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "internal/util/errors.hpp"
#include "support/temp_store.hpp"

using namespace healthstore;
using healthstore::testing::HeartRate;
using healthstore::testing::Steps;
using healthstore::testing::TempStore;
using healthstore::testing::Weight;

namespace {

const std::string kPackage(healthstore::testing::kInstalledPackage);
const std::string kOtherPackage = "com.example.other";

std::vector<std::string> UpsertedIds(const model::ChangeLogsResponse& response) {
  std::vector<std::string> ids;
  for (const auto& record : response.upserted_records) ids.push_back(model::MetadataOf(record).id);
  std::sort(ids.begin(), ids.end());
  return ids;
}

void TestTokenSeesOnlyLaterChanges() {
  TempStore store("token_later_changes");
  auto&     service = *store.app().health_data_service;

  service.InsertRecords(kPackage, {Steps(1000, 2000, 5)});
  const auto token = service.GetChangeLogToken(kPackage, {});

  auto empty = service.GetChangeLogs(kPackage, token);
  assert(empty.upserted_records.empty());
  assert(empty.deleted_logs.empty());
  assert(!empty.has_more_data);

  const auto uuid     = service.InsertRecords(kPackage, {Steps(3000, 4000, 7)}).front();
  const auto response = service.GetChangeLogs(kPackage, token);
  assert(response.upserted_records.size() == 1);
  assert(model::MetadataOf(response.upserted_records.front()).id == uuid);

  // a token resolves to the same request every time
  const auto again = service.GetChangeLogs(kPackage, token);
  assert(UpsertedIds(again) == UpsertedIds(response));

  // the next-page token starts after what was returned
  const auto next = service.GetChangeLogs(kPackage, response.next_change_token);
  assert(next.upserted_records.empty());
}

void TestTokenFilters() {
  TempStore store("token_filters");
  auto&     service = *store.app().health_data_service;

  model::ChangeLogTokenRequest weight_only;
  weight_only.record_types = {model::ToId(model::RecordType::kWeight)};
  const auto weight_token  = service.GetChangeLogToken(kPackage, weight_only);

  model::ChangeLogTokenRequest other_only;
  other_only.package_names_to_filter = {kOtherPackage};
  const auto other_token             = service.GetChangeLogToken(kPackage, other_only);

  service.InsertRecords(kPackage, {Steps(1000, 2000, 5)});
  const auto weight_uuid = service.InsertRecords(kPackage, {Weight(1000, 70000)}).front();
  const auto other_uuid  = service.InsertRecords(kOtherPackage, {HeartRate(1000, 2000, {{60, 1500}})}).front();

  assert(UpsertedIds(service.GetChangeLogs(kPackage, weight_token)) == std::vector<std::string>{weight_uuid});
  assert(UpsertedIds(service.GetChangeLogs(kPackage, other_token)) == std::vector<std::string>{other_uuid});
}

void TestInvalidTokens() {
  TempStore store("token_invalid");
  auto&     service = *store.app().health_data_service;

  bool threw = false;
  try {
    (void)service.GetChangeLogs(kPackage, 424242);
  } catch (const util::NotFound&) {
    threw = true;
  }
  assert(threw && "unknown token must not resolve");

  const auto token = service.GetChangeLogToken(kPackage, {});
  threw            = false;
  try {
    (void)service.GetChangeLogs(kOtherPackage, token);
  } catch (const util::ValidationError&) {
    threw = true;
  }
  assert(threw && "a token is bound to the package it was issued to");

  model::ChangeLogTokenRequest bad_type;
  bad_type.record_types = {9999};
  threw                 = false;
  try {
    (void)service.GetChangeLogToken(kPackage, bad_type);
  } catch (const util::ValidationError&) {
    threw = true;
  }
  assert(threw && "unknown record type ids are rejected");
}

void TestPagingWalksEveryEntryOnce() {
  TempStore store("change_log_paging");
  auto&     service = *store.app().health_data_service;

  auto token = service.GetChangeLogToken(kPackage, {});

  // one call per record so every insert is its own change-log entry
  std::vector<std::string> inserted;
  for (int i = 0; i < 5; ++i) {
    inserted.push_back(service.InsertRecords(kPackage, {Steps(1000 * (i + 1), 1000 * (i + 1) + 500, i)}).front());
  }
  std::sort(inserted.begin(), inserted.end());

  std::vector<std::string> seen;
  int                      pages = 0;
  while (true) {
    const auto page = service.GetChangeLogs(kPackage, token, 2);
    ++pages;
    for (auto& id : UpsertedIds(page)) seen.push_back(id);
    token = page.next_change_token;
    if (!page.has_more_data) break;
  }
  std::sort(seen.begin(), seen.end());

  assert(pages == 3);
  assert(seen == inserted);
}

void TestDeletesAreReported() {
  TempStore store("change_log_deletes");
  auto&     service = *store.app().health_data_service;

  const auto uuid  = service.InsertRecords(kPackage, {HeartRate(1000, 2000, {{60, 1500}})}).front();
  const auto token = service.GetChangeLogToken(kPackage, {});

  assert(service.DeleteRecords(kPackage, model::RecordType::kHeartRate, {uuid}) == 1);

  const auto response = service.GetChangeLogs(kPackage, token);
  assert(response.upserted_records.empty());
  assert(response.deleted_logs.size() == 1);
  assert(response.deleted_logs.front().uuid == uuid);
  assert(response.deleted_logs.front().record_type == model::RecordType::kHeartRate);
}

void TestInvalidPageSize() {
  TempStore store("change_log_page_size");
  auto&     service = *store.app().health_data_service;

  const auto token = service.GetChangeLogToken(kPackage, {});
  bool       threw = false;
  try {
    (void)service.GetChangeLogs(kPackage, token, 0);
  } catch (const util::ValidationError&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestTokenSeesOnlyLaterChanges();
  TestTokenFilters();
  TestInvalidTokens();
  TestPagingWalksEveryEntryOnce();
  TestDeletesAreReported();
  TestInvalidPageSize();

  std::cout << "health_store_unit_change_logs: pass\n";
  return 0;
}
