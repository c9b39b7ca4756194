#include "speed_window.hpp"

#include <algorithm>

namespace tierbridge::transfer {

SpeedWindow::SpeedWindow(std::chrono::milliseconds window) : window_(window.count() > 0 ? window : std::chrono::milliseconds(1)) {
}

void SpeedWindow::Reset(Clock::time_point now) {
  samples_.clear();
  started_ = now;
}

void SpeedWindow::Clear() {
  samples_.clear();
  started_.reset();
}

void SpeedWindow::Add(uint64_t bytes, Clock::time_point now) {
  if (!started_) started_ = now;
  samples_.emplace_back(now, bytes);
  while (!samples_.empty() && samples_.front().first < now - window_) {
    samples_.pop_front();
  }
}

std::optional<double> SpeedWindow::Rate(Clock::time_point now) const {
  if (!started_) return std::nullopt;

  const auto from    = std::max(*started_, now - std::chrono::duration_cast<Clock::duration>(window_));
  const auto elapsed = std::chrono::duration<double>(now - from).count();
  if (elapsed <= 0.0) return std::nullopt;

  uint64_t bytes = 0;
  for (const auto& [at, n] : samples_) {
    if (at >= from) bytes += n;
  }
  return static_cast<double>(bytes) / elapsed;
}

} // namespace tierbridge::transfer
