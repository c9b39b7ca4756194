#include "warm_queue.hpp"

namespace tierbridge::tiering {

void WarmQueue::Enqueue(WarmTask task) {
  {
    std::lock_guard lock(mutex_);
    task.seq = next_seq_++;
    queue_.push(std::move(task));
  }
  cv_.notify_one();
}

std::optional<WarmTask> WarmQueue::Dequeue() {
  std::unique_lock lock(mutex_);

  cv_.wait(lock, [&] { return shutdown_ || !queue_.empty(); });

  if (shutdown_) return std::nullopt;

  WarmTask task = queue_.top();
  queue_.pop();
  return task;
}

void WarmQueue::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
}

size_t WarmQueue::Size() const {
  std::lock_guard lock(mutex_);
  return queue_.size();
}

} // namespace tierbridge::tiering
