#pragma once

#include <chrono>
#include <cstdint>
#include <deque>
#include <optional>
#include <utility>

namespace tierbridge::transfer {

/*
  Short-window moving average of throughput.

  Only samples inside the last `window` count, and the clock starts at the
  last Reset, so time spent paused never dilutes the rate.
*/
class SpeedWindow {
 public:
  using Clock = std::chrono::steady_clock;

  explicit SpeedWindow(std::chrono::milliseconds window = std::chrono::milliseconds(5000));

  void Reset(Clock::time_point now);
  void Clear();

  void Add(uint64_t bytes, Clock::time_point now);

  // bytes/sec; nullopt before Reset or when no time has elapsed.
  std::optional<double> Rate(Clock::time_point now) const;

 private:
  std::chrono::milliseconds                         window_;
  std::optional<Clock::time_point>                  started_;
  std::deque<std::pair<Clock::time_point, uint64_t>> samples_;
};

} // namespace tierbridge::transfer
