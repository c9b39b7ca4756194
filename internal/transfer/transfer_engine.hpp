#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
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
#include "internal/storage/source_driver.hpp"
#include "internal/transfer/speed_window.hpp"
#include "internal/transfer/transfer_scheduler.hpp"
#include "tierbridge/vfs/core/v1/types.pb.h"

namespace tierbridge::source {
class SourceRegistry;
}

namespace tierbridge::transfer {

inline constexpr const char* kTransferProgressTopic = "transfer-progress";

std::string TransferTopic(const std::string& transfer_id);

/*
  TransferEngine

  Runs uploads (host file -> source) and downloads (source -> host file) as
  persisted, resumable state machines:

      Pending -> InProgress <-> Paused -> {Completed | Failed | Canceled}

  A record is written before the first byte moves and after every part, so a
  restart resumes at part_index. Parts are read in chunks; pause and cancel
  are honored between chunks and an interrupted part is simply re-read.

  Events carry full record snapshots on "transfer:<id>" (state changes and
  parts) and "transfer-progress" (ticker for every active transfer).
*/
class TransferEngine {
 public:
  using Record   = tierbridge::vfs::core::v1::TransferRecord;
  using EventHub = events::EventHub<Record>;

  struct ListFilter {
    std::optional<std::string> source_id;
    bool                       active_only = false;
  };

  TransferEngine(std::shared_ptr<db::Repository> repository, std::shared_ptr<source::SourceRegistry> registry,
                 storage::SourceDriverPtr local_driver, tierbridge::runtime::config::TransferConfig config);
  ~TransferEngine();

  TransferEngine(const TransferEngine&)            = delete;
  TransferEngine& operator=(const TransferEngine&) = delete;

  // Re-queues persisted Pending/InProgress transfers, then starts workers.
  void Start();
  void Stop();

  bool Running() const {
    return running_;
  }

  Record EnqueueUpload(const std::string& source_id, const std::string& local_path, const std::string& remote_path);
  Record EnqueueDownload(const std::string& source_id, const std::string& remote_path, const std::string& local_path);

  // No-ops when the transfer is not in a state the call applies to.
  void Pause(const std::string& id);
  void Resume(const std::string& id, const std::string& source_id);
  void Cancel(const std::string& id);

  Record              Get(const std::string& id) const;
  std::vector<Record> List(const ListFilter& filter) const;

  // Returns as soon as the transfer is terminal, or the latest snapshot on timeout.
  Record Wait(const std::string& id, std::chrono::milliseconds timeout) const;

  EventHub::Token Subscribe(const std::string& id, EventHub::Callback callback);
  void            Unsubscribe(EventHub::Token token);

  EventHub& Events() {
    return events_;
  }

  // Drops terminal transfers beyond the newest `keep`. Returns how many went.
  size_t Prune(size_t keep);

 private:
  struct Entry {
    db::model::TransferRecord record;
    SpeedWindow               speed;
    uint32_t                  attempts   = 0;
    uint64_t                  generation = 0; // bumped whenever a worker claims the transfer
  };

  Record Enqueue(tierbridge::vfs::core::v1::TransferKind kind, const std::string& source_id, const std::string& local_path,
                 const std::string& remote_path);

  void WorkerLoop();
  void TickerLoop();
  void Run(const TransferTask& task);
  bool Transfer(const std::string& id, uint64_t generation);

  std::shared_ptr<arrow::Buffer> ReadPart(const std::string& id, uint64_t generation, storage::SourceDriver& reader,
                                          const std::string& path, uint64_t offset, uint64_t length);

  // Requires mutex_.
  Entry&       Find(const std::string& id);
  const Entry& Find(const std::string& id) const;
  bool         StillMine(const std::string& id, uint64_t generation) const;
  void         Persist(const db::model::TransferRecord& record);
  Record       Snapshot(const Entry& entry) const;
  void         MarkTerminal(Entry& entry, tierbridge::vfs::core::v1::TransferStatus status, const std::string& error,
                            tierbridge::vfs::core::v1::TransferErrorCode code);

  void Publish(const Record& record);
  void Fail(const std::string& id, uint64_t generation, const std::string& error, tierbridge::vfs::core::v1::TransferErrorCode code);

  std::shared_ptr<db::Repository>             repository_;
  std::shared_ptr<source::SourceRegistry>     registry_;
  storage::SourceDriverPtr                    local_driver_;
  tierbridge::runtime::config::TransferConfig config_;

  TransferScheduler scheduler_;
  EventHub          events_;

  mutable std::mutex                     mutex_;
  mutable std::condition_variable        changed_;
  std::unordered_map<std::string, Entry> entries_;

  std::vector<std::thread> workers_;
  std::thread              ticker_;
  std::atomic<bool>        running_{false};
};

} // namespace tierbridge::transfer
