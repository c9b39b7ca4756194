#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "config/config.pb.h"
#include "internal/db/api/repository.hpp"
#include "internal/events/event_hub.hpp"
#include "internal/tiering/warm_queue.hpp"
#include "tierbridge/vfs/core/v1/types.pb.h"

namespace tierbridge::source {
class SourceRegistry;
}

namespace tierbridge::tiering {

inline constexpr const char* kWarmProgressTopic = "warm-progress";

/*
  TieringCoordinator

  Tracks the tier of every file (file_tiers table, falling back to the
  source's default tier) and promotes non-resident files to hot.

  Warming:
    - queued by priority, served by `workers` threads
    - waits the configured retrieval latency of the current tier
      (cancellable), then reads the object through the driver so the
      backend materializes it
    - publishes WarmProgress on "warm-progress" until completed/error
    - records the file as hot

  Sources without the tiering capability are always resident.
*/
class TieringCoordinator {
 public:
  using TierStatus   = tierbridge::vfs::core::v1::TierStatus;
  using WarmHandle   = tierbridge::vfs::core::v1::WarmHandle;
  using WarmProgress = tierbridge::vfs::core::v1::WarmProgress;
  using SyncResult   = tierbridge::vfs::core::v1::SyncResult;
  using EventHub     = events::EventHub<WarmProgress>;

  // What a read does when the file is not hot.
  struct ResidencyPolicy {
    bool block = true;
    // 0 waits the retrieval estimate plus a grace period.
    std::chrono::milliseconds timeout{0};
  };

  TieringCoordinator(std::shared_ptr<db::Repository> repository, std::shared_ptr<source::SourceRegistry> registry,
                     tierbridge::runtime::config::TieringConfig config);
  ~TieringCoordinator();

  TieringCoordinator(const TieringCoordinator&)            = delete;
  TieringCoordinator& operator=(const TieringCoordinator&) = delete;

  void Start();
  void Stop();

  TierStatus TierOf(const std::string& source_id, const std::string& path) const;

  uint64_t RetrievalSecFor(TierStatus tier) const;
  uint64_t EstimateRetrievalSec(const std::string& source_id, const std::string& path) const;

  /*
    Requests promotion to hot. A hot file completes immediately; a file
    already being warmed returns the existing handle.
  */
  WarmHandle Warm(const std::string& source_id, const std::string& path, int32_t priority = 0);

  // Latest progress; returns early once completed or errored.
  WarmProgress WaitWarm(const std::string& request_id, std::chrono::milliseconds timeout) const;

  // Stops a queued or latency-waiting request. No-op once terminal.
  void CancelWarm(const std::string& request_id);

  // Returns once the file is hot. Throws RetrievalRequired when the caller
  // does not block, or the estimate exceeds max_blocking_retrieval_sec.
  void EnsureResident(const std::string& source_id, const std::string& path, const ResidencyPolicy& policy);

  SyncResult ChangeTier(const std::string& source_id, const std::vector<std::string>& paths, TierStatus target);

  EventHub& Events() {
    return events_;
  }

 private:
  struct Request {
    WarmHandle   handle;
    WarmProgress latest;
    TierStatus   from     = tierbridge::vfs::core::v1::TIER_STATUS_UNSPECIFIED;
    bool         canceled = false;
  };

  void WorkerLoop();
  void Run(const WarmTask& task);

  void SetTier(const std::string& source_id, const std::string& path, TierStatus tier);

  // Returns false when the request was canceled or the coordinator stopped.
  bool Publish(const std::string& request_id, tierbridge::vfs::core::v1::WarmState state, uint32_t progress,
               std::optional<uint64_t> bytes, std::optional<uint64_t> total, const std::string& error = "");

  // Requires mutex_.
  void Retire(const std::string& request_id);

  std::shared_ptr<db::Repository>             repository_;
  std::shared_ptr<source::SourceRegistry>     registry_;
  tierbridge::runtime::config::TieringConfig config_;

  WarmQueue queue_;
  EventHub  events_;

  mutable std::mutex                         mutex_;
  mutable std::condition_variable            changed_;
  std::unordered_map<std::string, Request>   requests_;
  std::unordered_map<std::string, std::string> active_by_file_; // "<source>\n<path>" -> request id
  std::deque<std::string>                    finished_;

  std::vector<std::thread> workers_;
  std::atomic<bool>        running_{false};
};

} // namespace tierbridge::tiering
