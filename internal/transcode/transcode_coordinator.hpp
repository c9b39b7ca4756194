#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "config/config.pb.h"
#include "internal/events/event_hub.hpp"
#include "internal/storage/source_driver.hpp"
#include "internal/transcode/transcoder.hpp"
#include "tierbridge/vfs/core/v1/types.pb.h"

namespace tierbridge::source {
class SourceRegistry;
}
namespace tierbridge::fileops {
class FileOperations;
}

namespace tierbridge::transcode {

inline constexpr const char* kTranscodeProgressTopic = "transcode-progress";

/*
  TranscodeCoordinator

  Converts a video on a mounted source into another container and stores
  the result next to it as "<stem>.<format>" (or the next free copy name).

  Per job, on a worker thread:
    STARTED      file is warmed and copied into a private staging folder
    TRANSCODING  Transcoder runs on the host copy
    UPLOADING    output is copied back to the source
    COMPLETED / ERROR
*/
class TranscodeCoordinator {
 public:
  using TranscodeHandle   = tierbridge::vfs::core::v1::TranscodeHandle;
  using TranscodeProgress = tierbridge::vfs::core::v1::TranscodeProgress;
  using EventHub          = events::EventHub<TranscodeProgress>;

  TranscodeCoordinator(std::shared_ptr<source::SourceRegistry> registry, std::shared_ptr<fileops::FileOperations> files,
                       std::shared_ptr<Transcoder> transcoder, storage::SourceDriverPtr local_driver,
                       tierbridge::runtime::config::TranscodeConfig config, std::string staging_dir);
  ~TranscodeCoordinator();

  TranscodeCoordinator(const TranscodeCoordinator&)            = delete;
  TranscodeCoordinator& operator=(const TranscodeCoordinator&) = delete;

  void Start();
  void Stop();

  TranscodeHandle Transcode(const std::string& source_id, const std::string& file_path, const std::string& format);

  TranscodeProgress Status(const std::string& job_id) const;

  // Latest progress; returns early once completed or errored.
  TranscodeProgress Wait(const std::string& job_id, std::chrono::milliseconds timeout) const;

  EventHub& Events() {
    return events_;
  }

 private:
  struct Job {
    TranscodeHandle   handle;
    TranscodeProgress latest;
  };

  void WorkerLoop();
  void Run(const TranscodeHandle& handle);

  void Publish(const std::string& job_id, tierbridge::vfs::core::v1::TranscodeState state, uint32_t progress,
               const std::string& error = "");

  std::shared_ptr<source::SourceRegistry>      registry_;
  std::shared_ptr<fileops::FileOperations>     files_;
  std::shared_ptr<Transcoder>                  transcoder_;
  storage::SourceDriverPtr                     local_driver_;
  tierbridge::runtime::config::TranscodeConfig config_;
  std::string                                  staging_dir_;

  EventHub events_;

  mutable std::mutex                   mutex_;
  mutable std::condition_variable      changed_;
  std::deque<std::string>              pending_;
  std::unordered_map<std::string, Job> jobs_;
  std::deque<std::string>              finished_;

  std::vector<std::thread> workers_;
  std::atomic<bool>        running_{false};
};

} // namespace tierbridge::transcode
