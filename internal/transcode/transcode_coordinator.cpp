#include "transcode_coordinator.hpp"

#include <filesystem>

#include "internal/fileops/file_operations.hpp"
#include "internal/observability/logging.hpp"
#include "internal/source/source_registry.hpp"
#include "internal/storage/common/path_utils.hpp"
#include "internal/transcode/transcode_formats.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace tierbridge::transcode {

using namespace tierbridge::vfs::core::v1;
using observability::ErrorField;
using observability::IntField;
using observability::StringField;

namespace {

constexpr size_t kMaxFinishedJobs = 256;

// Phase boundaries on the single 0..100 progress scale.
constexpr uint32_t kStagedProgress     = 10;
constexpr uint32_t kTranscodedProgress = 90;

bool IsTerminal(TranscodeState state) {
  return state == TRANSCODE_STATE_COMPLETED || state == TRANSCODE_STATE_ERROR;
}

} // namespace

TranscodeCoordinator::TranscodeCoordinator(std::shared_ptr<source::SourceRegistry> registry, std::shared_ptr<fileops::FileOperations> files,
                                           std::shared_ptr<Transcoder> transcoder, storage::SourceDriverPtr local_driver,
                                           tierbridge::runtime::config::TranscodeConfig config, std::string staging_dir)
    : registry_(std::move(registry)),
      files_(std::move(files)),
      transcoder_(std::move(transcoder)),
      local_driver_(std::move(local_driver)),
      config_(std::move(config)),
      staging_dir_(std::move(staging_dir)) {
  if (config_.workers() == 0) config_.set_workers(1);
  if (staging_dir_.empty()) {
    staging_dir_ = (std::filesystem::temp_directory_path() / "tierbridge-transcode").string();
  }
}

TranscodeCoordinator::~TranscodeCoordinator() {
  Stop();
}

void TranscodeCoordinator::Start() {
  if (running_.exchange(true)) return;
  for (uint32_t i = 0; i < config_.workers(); ++i) {
    workers_.emplace_back(&TranscodeCoordinator::WorkerLoop, this);
  }
}

void TranscodeCoordinator::Stop() {
  if (!running_.exchange(false)) return;

  changed_.notify_all();
  for (auto& worker : workers_) {
    if (worker.joinable()) worker.join();
  }
  workers_.clear();

  std::deque<std::string> abandoned;
  {
    std::lock_guard lock(mutex_);
    abandoned.swap(pending_);
  }
  for (const auto& id : abandoned) {
    Publish(id, TRANSCODE_STATE_ERROR, 0, "transcode coordinator stopped");
  }
}

TranscodeCoordinator::TranscodeHandle TranscodeCoordinator::Transcode(const std::string& source_id, const std::string& file_path,
                                                                      const std::string& format) {
  if (!config_.enabled()) {
    throw util::InvalidState("transcoding is disabled");
  }
  if (!IsSupportedFormat(format)) {
    throw std::invalid_argument("unsupported transcode format: " + format);
  }

  registry_->Resolve(source_id);
  if (!registry_->HasCapability(source_id, CAPABILITY_TRANSCODE)) {
    throw util::InvalidState("source " + source_id + " does not support transcoding");
  }

  const auto normalized = storage::common::NormalizeTarget(file_path);
  const auto stat       = registry_->Driver(source_id)->Stat(normalized);
  if (!stat) {
    throw util::NotFound("file not found: " + normalized);
  }
  if (stat->is_directory || !HasVideoExtension(normalized)) {
    throw std::invalid_argument("not a video file: " + normalized);
  }

  const auto output = OutputPathFor(normalized, format);
  if (output == normalized) {
    throw std::invalid_argument(normalized + " is already " + format);
  }

  TranscodeHandle handle;
  handle.set_job_id(util::NewId());
  handle.set_source_id(source_id);
  handle.set_file_path(normalized);
  handle.set_format(format);
  handle.set_output_path(output);

  TranscodeProgress progress;
  progress.set_job_id(handle.job_id());
  progress.set_file_path(normalized);
  progress.set_status(TRANSCODE_STATE_STARTED);

  {
    std::lock_guard lock(mutex_);
    if (!running_) {
      throw util::InvalidState("transcode coordinator is not running");
    }
    jobs_.emplace(handle.job_id(), Job{handle, progress});
    pending_.push_back(handle.job_id());
  }
  changed_.notify_all();

  TIERBRIDGE_LOG_INFO("transcode queued", {StringField("job_id", handle.job_id()), StringField("source_id", source_id),
                                            StringField("path", normalized), StringField("format", format)});
  events_.Publish(kTranscodeProgressTopic, progress);
  return handle;
}

TranscodeCoordinator::TranscodeProgress TranscodeCoordinator::Status(const std::string& job_id) const {
  std::lock_guard lock(mutex_);
  auto            it = jobs_.find(job_id);
  if (it == jobs_.end()) {
    throw util::NotFound("transcode job not found: " + job_id);
  }
  return it->second.latest;
}

TranscodeCoordinator::TranscodeProgress TranscodeCoordinator::Wait(const std::string& job_id, std::chrono::milliseconds timeout) const {
  std::unique_lock lock(mutex_);
  if (jobs_.find(job_id) == jobs_.end()) {
    throw util::NotFound("transcode job not found: " + job_id);
  }
  changed_.wait_for(lock, timeout, [&] {
    auto it = jobs_.find(job_id);
    return it == jobs_.end() || IsTerminal(it->second.latest.status());
  });

  auto it = jobs_.find(job_id);
  if (it == jobs_.end()) {
    throw util::NotFound("transcode job not found: " + job_id);
  }
  return it->second.latest;
}

// ---------------------------------------------------------------------------
// Workers
// ---------------------------------------------------------------------------

void TranscodeCoordinator::WorkerLoop() {
  while (true) {
    TranscodeHandle handle;
    {
      std::unique_lock lock(mutex_);
      changed_.wait(lock, [&] { return !running_ || !pending_.empty(); });
      if (!running_) return;
      handle = jobs_.at(pending_.front()).handle;
      pending_.pop_front();
    }
    Run(handle);
  }
}

void TranscodeCoordinator::Run(const TranscodeHandle& handle) {
  const auto staging = storage::common::DestPath(staging_dir_, handle.job_id());

  try {
    local_driver_->Mkdir(staging);

    // Warms the file and copies it to the host.
    const auto input = files_->PlaceInto({handle.source_id(), handle.file_path()}, source::kNativeSourceId, staging, false, {});
    Publish(handle.job_id(), TRANSCODE_STATE_TRANSCODING, kStagedProgress);

    const auto output = storage::common::DestPath(staging, storage::common::BaseName(handle.output_path()));
    transcoder_->Transcode(input, output, handle.format(), [&](uint32_t percent) {
      Publish(handle.job_id(), TRANSCODE_STATE_TRANSCODING,
              kStagedProgress + percent * (kTranscodedProgress - kStagedProgress) / 100);
    });

    Publish(handle.job_id(), TRANSCODE_STATE_UPLOADING, kTranscodedProgress);
    const auto stored = files_->PlaceInto({source::kNativeSourceId, output}, handle.source_id(),
                                          storage::common::ParentPath(handle.file_path()), false, {});

    TIERBRIDGE_LOG_INFO("transcode completed", {StringField("job_id", handle.job_id()), StringField("source_id", handle.source_id()),
                                                 StringField("path", handle.file_path()), StringField("output", stored)});
    Publish(handle.job_id(), TRANSCODE_STATE_COMPLETED, 100);
  } catch (const std::exception& e) {
    TIERBRIDGE_LOG_ERROR("transcode failed", {StringField("job_id", handle.job_id()), StringField("path", handle.file_path()),
                                              ErrorField(e)});
    Publish(handle.job_id(), TRANSCODE_STATE_ERROR, 0, e.what());
  }

  try {
    local_driver_->DeleteRecursive(staging);
  } catch (const std::exception& e) {
    TIERBRIDGE_LOG_WARN("transcode staging cleanup failed", {StringField("staging", staging), ErrorField(e)});
  }
}

void TranscodeCoordinator::Publish(const std::string& job_id, TranscodeState state, uint32_t progress, const std::string& error) {
  TranscodeProgress event;
  {
    std::lock_guard lock(mutex_);
    auto            it = jobs_.find(job_id);
    if (it == jobs_.end()) return;

    auto& latest = it->second.latest;
    latest.set_status(state);
    latest.set_progress(progress);
    latest.set_error(error);
    event = latest;

    if (IsTerminal(state)) {
      finished_.push_back(job_id);
      while (finished_.size() > kMaxFinishedJobs) {
        jobs_.erase(finished_.front());
        finished_.pop_front();
      }
    }
  }
  changed_.notify_all();
  events_.Publish(kTranscodeProgressTopic, event);
}

} // namespace tierbridge::transcode
