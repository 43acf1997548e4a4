#include "task_queue.hpp"

namespace healthstore::runtime {

TaskQueue::TaskQueue(std::size_t capacity) : capacity_(capacity) {
}

bool TaskQueue::TryEnqueue(Task task) {
  {
    std::lock_guard lock(mutex_);
    if (shutdown_ || queue_.size() >= capacity_) return false;
    queue_.push(std::move(task));
  }
  cv_.notify_one();
  return true;
}

std::optional<Task> TaskQueue::Dequeue() {
  std::unique_lock lock(mutex_);

  cv_.wait(lock, [&] { return shutdown_ || !queue_.empty(); });

  if (shutdown_ && queue_.empty()) return std::nullopt;

  Task task = std::move(queue_.front());
  queue_.pop();
  return task;
}

void TaskQueue::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
}

} // namespace healthstore::runtime
