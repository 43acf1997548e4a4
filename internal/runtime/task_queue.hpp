#pragma once

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <queue>

namespace healthstore::runtime {

using Task = std::function<void()>;

/*
  Bounded thread-safe blocking queue for pool workers.
*/
class TaskQueue {
 public:
  explicit TaskQueue(std::size_t capacity);

  // false when full or shut down
  bool TryEnqueue(Task task);

  // blocking wait; nullopt once shut down and drained
  std::optional<Task> Dequeue();

  void Shutdown();

 private:
  const std::size_t       capacity_;
  std::mutex              mutex_;
  std::condition_variable cv_;
  std::queue<Task>        queue_;
  bool                    shutdown_ = false;
};

} // namespace healthstore::runtime
