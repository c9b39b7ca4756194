#pragma once

#include <condition_variable>
#include <mutex>
#include <optional>
#include <queue>
#include <vector>

#include "warm_task.hpp"

namespace tierbridge::tiering {

/*
  Thread-safe blocking priority queue for warm workers.
  Higher priority first; equal priorities in submission order.
*/
class WarmQueue {
 public:
  void Enqueue(WarmTask task);

  // blocking wait
  std::optional<WarmTask> Dequeue();

  void Shutdown();

  size_t Size() const;

 private:
  struct Order {
    bool operator()(const WarmTask& a, const WarmTask& b) const {
      if (a.priority != b.priority) return a.priority < b.priority;
      return a.seq > b.seq;
    }
  };

  mutable std::mutex                                          mutex_;
  std::condition_variable                                     cv_;
  std::priority_queue<WarmTask, std::vector<WarmTask>, Order> queue_;
  uint64_t                                                    next_seq_ = 0;
  bool                                                        shutdown_ = false;
};

} // namespace tierbridge::tiering
