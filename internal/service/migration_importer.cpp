#include "migration_importer.hpp"

#include <algorithm>
#include <cstdint>
#include <future>
#include <optional>
#include <unordered_map>
#include <utility>

#include "healthstore/v1.hpp"
#include "internal/migration/migration_codec.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace healthstore::service {

namespace {

struct PendingBatch {
  std::future<std::vector<util::EntityFailure>> result;
  // entity id -> first line it appeared on
  std::unordered_map<std::string, std::size_t> lines;
};

std::vector<util::EntityFailure> WriteBatch(MigrationService& service, const healthstore::v1::MigrationBatch& batch) {
  try {
    service.WriteMigrationData(batch);
  } catch (const util::MigrationEntityError& e) {
    return e.Failures();
  }
  return {};
}

void Collect(std::optional<PendingBatch>& pending, ImportSummary& summary) {
  if (!pending) return;
  for (auto& failure : pending->result.get()) {
    const auto it   = pending->lines.find(failure.entity_id);
    const auto line = it == pending->lines.end() ? std::size_t{0} : it->second;
    HEALTHSTORE_LOG_WARN("Entity rejected", {observability::IntField("line", static_cast<std::int64_t>(line)),
                                             observability::StringField("entity_id", failure.entity_id),
                                             observability::StringField("error", failure.message)});
    summary.failures.push_back({line, std::move(failure.entity_id), std::move(failure.message)});
  }
  pending.reset();
}

} // namespace

MigrationImporter::MigrationImporter(MigrationService& service, runtime::WorkerPool& workers, std::size_t batch_size)
    : service_(service), workers_(workers), batch_size_(batch_size) {
  if (batch_size_ == 0) {
    throw util::ValidationError("import batch size must be positive");
  }
}

ImportSummary MigrationImporter::Import(std::istream& in) {
  Call([this] { service_.StartMigration(); });

  ImportSummary                                summary;
  std::optional<PendingBatch>                  pending;
  healthstore::v1::MigrationBatch              batch;
  std::unordered_map<std::string, std::size_t> lines;

  auto flush = [&] {
    if (batch.entities_size() == 0) return;
    Collect(pending, summary);

    PendingBatch next;
    next.result = workers_.Submit([&service = service_, batch = std::move(batch)] { return WriteBatch(service, batch); });
    next.lines  = std::move(lines);
    pending     = std::move(next);
    ++summary.batches;

    batch.Clear();
    lines.clear();
  };

  std::size_t line_no = 0;
  std::string line;
  while (std::getline(in, line)) {
    ++line_no;
    if (line.find_first_not_of(" \t\r") == std::string::npos) continue;

    try {
      *batch.add_entities() = migration::MigrationCodec::ParseJson(line);
    } catch (const util::ValidationError& e) {
      HEALTHSTORE_LOG_WARN("Skipping malformed line",
                           {observability::IntField("line", static_cast<std::int64_t>(line_no)), observability::StringField("error", e.what())});
      summary.failures.push_back({line_no, {}, e.what()});
      continue;
    }
    lines.emplace(batch.entities(batch.entities_size() - 1).entity_id(), line_no);
    ++summary.entities;

    if (static_cast<std::size_t>(batch.entities_size()) >= batch_size_) flush();
  }
  flush();
  Collect(pending, summary);
  std::stable_sort(summary.failures.begin(), summary.failures.end(),
                   [](const ImportFailure& a, const ImportFailure& b) { return a.line < b.line; });

  Call([this] { service_.FinishMigration(); });

  HEALTHSTORE_LOG_INFO("Import finished", {observability::IntField("entities", static_cast<std::int64_t>(summary.entities)),
                                           observability::IntField("batches", static_cast<std::int64_t>(summary.batches)),
                                           observability::IntField("failed", static_cast<std::int64_t>(summary.failures.size()))});
  return summary;
}

} // namespace healthstore::service
