#pragma once

#include <cstddef>
#include <istream>
#include <string>
#include <vector>

#include "internal/runtime/worker_pool.hpp"
#include "migration_service.hpp"

namespace healthstore::service {

// A line of the export that did not migrate. entity_id is empty when the line did not parse.
struct ImportFailure {
  std::size_t line = 0;
  std::string entity_id;
  std::string message;
};

struct ImportSummary {
  std::size_t                entities = 0;
  std::size_t                batches  = 0;
  std::vector<ImportFailure> failures;
};

/*
  MigrationImporter

  Runs a whole migration (start, batched writes, finish) from a
  JSON-lines export holding one MigrationEntity per line.

  Every migration call is served by the worker pool. A batch is
  written on a worker while the caller parses the next one; at most
  one write is in flight, so batches commit in file order.

  Malformed lines and rejected entities end up in the summary. Other
  errors propagate, including util::ResourceExhausted when the pool
  queue is full.
*/
class MigrationImporter {
 public:
  // Throws util::ValidationError when batch_size is zero.
  MigrationImporter(MigrationService& service, runtime::WorkerPool& workers, std::size_t batch_size);

  ImportSummary Import(std::istream& in);

 private:
  template <typename Fn>
  auto Call(Fn&& fn) {
    return workers_.Submit(std::forward<Fn>(fn)).get();
  }

  MigrationService&    service_;
  runtime::WorkerPool& workers_;
  const std::size_t    batch_size_;
};

} // namespace healthstore::service
