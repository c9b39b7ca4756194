#include "transfer_scheduler.hpp"

#include <algorithm>

namespace tierbridge::transfer {

TransferScheduler::TransferScheduler(uint32_t per_source_limit) : per_source_limit_(per_source_limit == 0 ? 1 : per_source_limit) {
}

void TransferScheduler::Enqueue(TransferTask task) {
  {
    std::lock_guard lock(mutex_);
    queue_.push_back(std::move(task));
  }
  cv_.notify_all();
}

std::deque<TransferTask>::iterator TransferScheduler::FindRunnable() {
  return std::find_if(queue_.begin(), queue_.end(), [this](const TransferTask& task) {
    auto it = running_.find(task.source_id);
    return it == running_.end() || it->second < per_source_limit_;
  });
}

std::optional<TransferTask> TransferScheduler::Dequeue() {
  std::unique_lock lock(mutex_);

  std::deque<TransferTask>::iterator it;
  cv_.wait(lock, [&] {
    if (shutdown_) return true;
    it = FindRunnable();
    return it != queue_.end();
  });

  if (shutdown_) return std::nullopt;

  TransferTask task = std::move(*it);
  queue_.erase(it);
  ++running_[task.source_id];
  return task;
}

void TransferScheduler::Release(const std::string& source_id) {
  {
    std::lock_guard lock(mutex_);
    auto            it = running_.find(source_id);
    if (it != running_.end() && --it->second == 0) {
      running_.erase(it);
    }
  }
  cv_.notify_all();
}

bool TransferScheduler::Remove(const std::string& transfer_id) {
  std::lock_guard lock(mutex_);
  auto it = std::find_if(queue_.begin(), queue_.end(), [&](const TransferTask& task) { return task.transfer_id == transfer_id; });
  if (it == queue_.end()) return false;
  queue_.erase(it);
  return true;
}

void TransferScheduler::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
}

size_t TransferScheduler::Queued() const {
  std::lock_guard lock(mutex_);
  return queue_.size();
}

uint32_t TransferScheduler::Running(const std::string& source_id) const {
  std::lock_guard lock(mutex_);
  auto            it = running_.find(source_id);
  return it == running_.end() ? 0 : it->second;
}

} // namespace tierbridge::transfer
