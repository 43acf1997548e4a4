#pragma once

#include <atomic>
#include <future>
#include <memory>
#include <thread>
#include <type_traits>
#include <vector>

#include "internal/runtime/task_queue.hpp"
#include "internal/util/errors.hpp"

namespace healthstore::runtime {

/*
  Fixed set of threads serving API calls from a bounded queue.

  Exceptions thrown by a task travel to the caller through its
  future. Stop() runs the tasks already queued, then joins.
*/
class WorkerPool {
 public:
  WorkerPool(std::size_t threads, std::size_t queue_capacity);
  ~WorkerPool();

  WorkerPool(const WorkerPool&)            = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;

  void Start();
  void Stop();

  // Throws util::ResourceExhausted when the queue is full or stopped.
  template <typename Fn>
  auto Submit(Fn&& fn) -> std::future<std::invoke_result_t<Fn&>> {
    using Result = std::invoke_result_t<Fn&>;
    auto task    = std::make_shared<std::packaged_task<Result()>>(std::forward<Fn>(fn));
    auto future  = task->get_future();
    if (!queue_.TryEnqueue([task] { (*task)(); })) {
      throw util::ResourceExhausted("worker pool queue is full or stopped");
    }
    return future;
  }

 private:
  void Run();

  const std::size_t        thread_count_;
  TaskQueue                queue_;
  std::vector<std::thread> threads_;
  std::atomic<bool>        running_{false};
};

} // namespace healthstore::runtime
