#pragma once

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "transfer_task.hpp"

namespace tierbridge::transfer {

/*
  Thread-safe blocking queue for transfer workers.

  FIFO, except that a task is only handed out while its source has a free
  concurrency slot; tasks for saturated sources are skipped, not blocked on.
  Every successful Dequeue must be paired with Release(source_id).
*/
class TransferScheduler {
 public:
  explicit TransferScheduler(uint32_t per_source_limit);

  void Enqueue(TransferTask task);

  // blocking wait; nullopt after Shutdown
  std::optional<TransferTask> Dequeue();

  void Release(const std::string& source_id);

  // Drops a queued (not yet running) task. Returns false if it was not queued.
  bool Remove(const std::string& transfer_id);

  void Shutdown();

  size_t Queued() const;
  uint32_t Running(const std::string& source_id) const;

 private:
  std::deque<TransferTask>::iterator FindRunnable();

  const uint32_t per_source_limit_;

  mutable std::mutex                        mutex_;
  std::condition_variable                   cv_;
  std::deque<TransferTask>                  queue_;
  std::unordered_map<std::string, uint32_t> running_;
  bool                                      shutdown_ = false;
};

} // namespace tierbridge::transfer
