#include "worker_pool.hpp"

#include "internal/observability/logging.hpp"

namespace healthstore::runtime {

WorkerPool::WorkerPool(std::size_t threads, std::size_t queue_capacity) : thread_count_(threads == 0 ? 1 : threads), queue_(queue_capacity) {
}

WorkerPool::~WorkerPool() {
  Stop();
}

void WorkerPool::Start() {
  if (running_.exchange(true)) return;
  for (std::size_t i = 0; i < thread_count_; ++i) {
    threads_.emplace_back(&WorkerPool::Run, this);
  }
  HEALTHSTORE_LOG_INFO("Worker pool started", {observability::IntField("threads", static_cast<std::int64_t>(thread_count_))});
}

void WorkerPool::Stop() {
  queue_.Shutdown();
  running_ = false;
  for (auto& thread : threads_) {
    if (thread.joinable()) thread.join();
  }
  threads_.clear();
}

void WorkerPool::Run() {
  while (auto task = queue_.Dequeue()) {
    // packaged_task stores the task's exception in its future
    (*task)();
  }
}

} // namespace healthstore::runtime
