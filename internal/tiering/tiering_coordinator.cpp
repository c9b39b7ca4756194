#include "tiering_coordinator.hpp"

#include <algorithm>

#include "internal/db/api/db_errors.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/source/source_registry.hpp"
#include "internal/storage/common/path_utils.hpp"
#include "internal/tiering/storage_class.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace tierbridge::tiering {

using namespace tierbridge::vfs::core::v1;
using observability::BytesField;
using observability::ErrorField;
using observability::IntField;
using observability::StringField;

namespace {

constexpr uint64_t kDefaultReadChunk         = 1ull * 1024 * 1024;
constexpr uint64_t kDefaultMaxBlockingSec    = 900;
constexpr size_t   kMaxFinishedRequests      = 1024;
constexpr int32_t  kResidencyPriority        = 100;
constexpr auto     kResidencyGrace           = std::chrono::seconds(60);

std::string FileKey(const std::string& source_id, const std::string& path) {
  return source_id + '\n' + path;
}

bool IsTerminal(WarmState state) {
  return state == WARM_STATE_COMPLETED || state == WARM_STATE_ERROR;
}

} // namespace

TieringCoordinator::TieringCoordinator(std::shared_ptr<db::Repository> repository, std::shared_ptr<source::SourceRegistry> registry,
                                       tierbridge::runtime::config::TieringConfig config)
    : repository_(std::move(repository)), registry_(std::move(registry)), config_(std::move(config)) {
  if (config_.workers() == 0) config_.set_workers(1);
  if (config_.read_chunk_bytes() == 0) config_.set_read_chunk_bytes(kDefaultReadChunk);
  if (config_.max_blocking_retrieval_sec() == 0) config_.set_max_blocking_retrieval_sec(kDefaultMaxBlockingSec);
}

TieringCoordinator::~TieringCoordinator() {
  Stop();
}

void TieringCoordinator::Start() {
  if (running_.exchange(true)) return;
  for (uint32_t i = 0; i < config_.workers(); ++i) {
    workers_.emplace_back(&TieringCoordinator::WorkerLoop, this);
  }
}

void TieringCoordinator::Stop() {
  if (!running_.exchange(false)) return;

  queue_.Shutdown();
  changed_.notify_all();
  for (auto& worker : workers_) {
    if (worker.joinable()) worker.join();
  }
  workers_.clear();

  // Whatever is still queued will never run.
  std::vector<std::string> abandoned;
  {
    std::lock_guard lock(mutex_);
    for (const auto& [id, request] : requests_) {
      if (!IsTerminal(request.latest.status())) abandoned.push_back(id);
    }
  }
  for (const auto& id : abandoned) {
    Publish(id, WARM_STATE_ERROR, 0, std::nullopt, std::nullopt, "tiering coordinator stopped");
  }
}

// ---------------------------------------------------------------------------
// Tier state
// ---------------------------------------------------------------------------

TieringCoordinator::TierStatus TieringCoordinator::TierOf(const std::string& source_id, const std::string& path) const {
  const auto mounted = registry_->Resolve(source_id);
  if (!registry_->HasCapability(source_id, CAPABILITY_TIERING)) {
    return TIER_STATUS_HOT;
  }

  const auto normalized = storage::common::NormalizeTarget(path);

  std::optional<db::model::FileTierRecord> record;
  {
    auto tx = repository_->Begin();
    record  = repository_->GetFileTier(*tx, source_id, normalized);
    tx->Commit();
  }
  if (record && record->tier != TIER_STATUS_UNSPECIFIED) {
    return record->tier;
  }
  if (mounted.default_tier() != TIER_STATUS_UNSPECIFIED) {
    return mounted.default_tier();
  }
  return source::SourceRegistry::DefaultTierFor(mounted.category());
}

uint64_t TieringCoordinator::RetrievalSecFor(TierStatus tier) const {
  const auto& latency = config_.retrieval_sec();
  switch (tier) {
    case TIER_STATUS_WARM:
      return latency.warm_sec();
    case TIER_STATUS_COLD:
      return latency.cold_sec();
    case TIER_STATUS_NEARLINE:
      return latency.nearline_sec();
    case TIER_STATUS_ARCHIVE:
      return latency.archive_sec();
    default:
      return 0;
  }
}

uint64_t TieringCoordinator::EstimateRetrievalSec(const std::string& source_id, const std::string& path) const {
  return RetrievalSecFor(TierOf(source_id, path));
}

void TieringCoordinator::SetTier(const std::string& source_id, const std::string& path, TierStatus tier) {
  db::model::FileTierRecord record;
  record.source_id     = source_id;
  record.path          = path;
  record.tier          = tier;
  record.updated_at_ms = util::NowMillis();

  auto tx = repository_->Begin();
  db::ThrowIfDbError(repository_->UpsertFileTier(*tx, record), "set tier of " + path);
  tx->Commit();
}

// ---------------------------------------------------------------------------
// Warming
// ---------------------------------------------------------------------------

TieringCoordinator::WarmHandle TieringCoordinator::Warm(const std::string& source_id, const std::string& path, int32_t priority) {
  const auto normalized = storage::common::NormalizeTarget(path);
  const auto tier       = TierOf(source_id, normalized);

  WarmHandle handle;
  handle.set_request_id(util::NewId());
  handle.set_source_id(source_id);
  handle.set_path(normalized);

  WarmProgress progress;
  progress.set_request_id(handle.request_id());
  progress.set_file_path(normalized);

  if (tier == TIER_STATUS_HOT) {
    progress.set_status(WARM_STATE_COMPLETED);
    progress.set_progress(100);
    {
      std::lock_guard lock(mutex_);
      requests_.emplace(handle.request_id(), Request{handle, progress, tier, false});
      Retire(handle.request_id());
    }
    changed_.notify_all();

    TIERBRIDGE_LOG_INFO("warm skipped, file already hot", {StringField("source_id", source_id), StringField("path", normalized)});
    events_.Publish(kWarmProgressTopic, progress);
    return handle;
  }

  auto stat = registry_->Driver(source_id)->Stat(normalized);
  if (!stat) {
    throw util::NotFound("file not found: " + normalized);
  }
  if (stat->is_directory) {
    throw std::invalid_argument("cannot warm a directory: " + normalized);
  }

  {
    std::lock_guard lock(mutex_);
    const auto      key = FileKey(source_id, normalized);
    if (auto it = active_by_file_.find(key); it != active_by_file_.end()) {
      return requests_.at(it->second).handle;
    }

    handle.set_estimated_retrieval_sec(RetrievalSecFor(tier));
    progress.set_status(WARM_STATE_WARMING);
    progress.set_progress(0);
    progress.set_total_bytes(stat->size);

    requests_.emplace(handle.request_id(), Request{handle, progress, tier, false});
    active_by_file_.emplace(key, handle.request_id());
  }

  TIERBRIDGE_LOG_INFO("warm requested", {StringField("request_id", handle.request_id()), StringField("source_id", source_id),
                                          StringField("path", normalized), StringField("tier", TierName(tier)),
                                          IntField("estimated_retrieval_sec", static_cast<int64_t>(handle.estimated_retrieval_sec())),
                                          IntField("priority", priority)});

  events_.Publish(kWarmProgressTopic, progress);
  queue_.Enqueue({handle.request_id(), source_id, normalized, priority, 0});
  return handle;
}

TieringCoordinator::WarmProgress TieringCoordinator::WaitWarm(const std::string& request_id, std::chrono::milliseconds timeout) const {
  std::unique_lock lock(mutex_);
  if (requests_.find(request_id) == requests_.end()) {
    throw util::NotFound("warm request not found: " + request_id);
  }

  changed_.wait_for(lock, timeout, [&] {
    auto it = requests_.find(request_id);
    return it == requests_.end() || IsTerminal(it->second.latest.status());
  });

  auto it = requests_.find(request_id);
  if (it == requests_.end()) {
    throw util::NotFound("warm request not found: " + request_id);
  }
  return it->second.latest;
}

void TieringCoordinator::CancelWarm(const std::string& request_id) {
  {
    std::lock_guard lock(mutex_);
    auto            it = requests_.find(request_id);
    if (it == requests_.end()) {
      throw util::NotFound("warm request not found: " + request_id);
    }
    if (IsTerminal(it->second.latest.status())) return;
    it->second.canceled = true;
  }
  changed_.notify_all();

  TIERBRIDGE_LOG_INFO("warm canceled", {StringField("request_id", request_id)});
  Publish(request_id, WARM_STATE_ERROR, 0, std::nullopt, std::nullopt, "canceled");
}

void TieringCoordinator::EnsureResident(const std::string& source_id, const std::string& path, const ResidencyPolicy& policy) {
  const auto tier = TierOf(source_id, path);
  if (tier == TIER_STATUS_HOT) return;

  const auto eta = RetrievalSecFor(tier);
  if (!policy.block || eta > config_.max_blocking_retrieval_sec()) {
    throw util::RetrievalRequired(eta);
  }

  const auto timeout = policy.timeout.count() > 0 ? policy.timeout
                                                  : std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::seconds(eta) + kResidencyGrace);

  const auto handle   = Warm(source_id, path, kResidencyPriority);
  const auto progress = WaitWarm(handle.request_id(), timeout);
  switch (progress.status()) {
    case WARM_STATE_COMPLETED:
      return;
    case WARM_STATE_ERROR:
      throw std::runtime_error("warming " + handle.path() + " failed: " + progress.error());
    default:
      throw util::RetrievalRequired(eta);
  }
}

// ---------------------------------------------------------------------------
// Bulk tier change
// ---------------------------------------------------------------------------

TieringCoordinator::SyncResult TieringCoordinator::ChangeTier(const std::string& source_id, const std::vector<std::string>& paths,
                                                              TierStatus target) {
  if (target == TIER_STATUS_UNSPECIFIED) {
    throw std::invalid_argument("target tier must be set");
  }

  const auto mounted = registry_->Resolve(source_id);
  if (!registry_->HasCapability(source_id, CAPABILITY_TIERING)) {
    throw util::InvalidState("source " + source_id + " does not support tiering");
  }
  auto driver = registry_->Driver(source_id);

  const auto started = std::chrono::steady_clock::now();

  SyncResult result;
  auto       fail = [&](const std::string& path, const std::string& error) {
    result.set_files_failed(result.files_failed() + 1);
    result.add_errors(path + ": " + error);
  };

  struct Promotion {
    std::string path;
    WarmHandle  handle;
  };
  std::vector<Promotion> promotions;

  for (const auto& raw : paths) {
    try {
      const auto path = storage::common::NormalizeTarget(raw);
      auto       stat = driver->Stat(path);
      if (!stat) throw util::NotFound("file not found");
      if (stat->is_directory) throw std::invalid_argument("is a directory");

      const auto current = TierOf(source_id, path);
      if (current == target) {
        result.set_files_skipped(result.files_skipped() + 1);
        continue;
      }

      if (target == TIER_STATUS_HOT) {
        auto handle = Warm(source_id, path);
        if (handle.estimated_retrieval_sec() > config_.max_blocking_retrieval_sec()) {
          // The warm keeps running; the caller sees the estimate.
          throw util::RetrievalRequired(handle.estimated_retrieval_sec());
        }
        promotions.push_back({path, std::move(handle)});
        continue;
      }

      SetTier(source_id, path, target);
      result.set_files_synced(result.files_synced() + 1);
      TIERBRIDGE_LOG_INFO("tier changed", {StringField("source_id", source_id), StringField("path", path),
                                            StringField("from", TierName(current)), StringField("to", TierName(target)),
                                            StringField("storage_class", StorageClassFor(mounted.provider(), target))});
    } catch (const std::exception& e) {
      fail(raw, e.what());
    }
  }

  for (const auto& promotion : promotions) {
    try {
      const auto timeout  = std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::seconds(promotion.handle.estimated_retrieval_sec()) + kResidencyGrace);
      const auto progress = WaitWarm(promotion.handle.request_id(), timeout);
      if (progress.status() == WARM_STATE_COMPLETED) {
        result.set_files_synced(result.files_synced() + 1);
        result.set_bytes_transferred(result.bytes_transferred() + progress.total_bytes());
        TIERBRIDGE_LOG_INFO("tier changed", {StringField("source_id", source_id), StringField("path", promotion.path),
                                              StringField("to", TierName(target)),
                                              StringField("storage_class", StorageClassFor(mounted.provider(), target))});
      } else if (progress.status() == WARM_STATE_ERROR) {
        fail(promotion.path, progress.error());
      } else {
        fail(promotion.path, "retrieval still in progress");
      }
    } catch (const std::exception& e) {
      fail(promotion.path, e.what());
    }
  }

  result.set_duration_ms(static_cast<uint64_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started).count()));

  TIERBRIDGE_LOG_INFO("tier change finished", {StringField("source_id", source_id), StringField("target", TierName(target)),
                                                 IntField("synced", result.files_synced()), IntField("skipped", result.files_skipped()),
                                                 IntField("failed", result.files_failed())});
  return result;
}

// ---------------------------------------------------------------------------
// Workers
// ---------------------------------------------------------------------------

void TieringCoordinator::WorkerLoop() {
  while (running_) {
    auto task = queue_.Dequeue();
    if (!task) break;

    try {
      Run(*task);
    } catch (const std::exception& e) {
      TIERBRIDGE_LOG_ERROR("warm worker failed", {StringField("request_id", task->request_id), ErrorField(e)});
    }
  }
}

void TieringCoordinator::Run(const WarmTask& task) {
  const auto& id = task.request_id;

  TierStatus from = TIER_STATUS_UNSPECIFIED;
  uint64_t   eta  = 0;
  {
    std::lock_guard lock(mutex_);
    auto            it = requests_.find(id);
    if (it == requests_.end() || it->second.canceled || IsTerminal(it->second.latest.status())) return;
    from = it->second.from;
    eta  = it->second.handle.estimated_retrieval_sec();
  }

  const auto started = std::chrono::steady_clock::now();
  uint64_t   done    = 0;
  uint64_t   total   = 0;

  try {
    // Backend retrieval latency of the current tier.
    {
      std::unique_lock lock(mutex_);
      changed_.wait_for(lock, std::chrono::seconds(eta), [&] {
        auto it = requests_.find(id);
        return !running_ || it == requests_.end() || it->second.canceled;
      });
      auto it = requests_.find(id);
      if (it == requests_.end() || it->second.canceled) return;
    }
    if (!running_) return;

    auto driver = registry_->Driver(task.source_id);
    auto stat   = driver->Stat(task.path);
    if (!stat) throw util::NotFound("file not found: " + task.path);
    total = stat->size;

    while (done < total) {
      const auto chunk = std::min<uint64_t>(config_.read_chunk_bytes(), total - done);
      auto       data  = driver->ReadAt(task.path, done, chunk);
      if (data->size() == 0) {
        throw std::runtime_error("short read at offset " + std::to_string(done) + " of " + task.path);
      }
      done += static_cast<uint64_t>(data->size());

      const auto pct = static_cast<uint32_t>(storage::common::ProgressPercentage(done, total));
      if (!Publish(id, WARM_STATE_WARMING, std::min<uint32_t>(pct, 99), done, total) || !running_) return;
    }

    SetTier(task.source_id, task.path, TIER_STATUS_HOT);
  } catch (const std::exception& e) {
    TIERBRIDGE_LOG_ERROR("warm failed", {StringField("request_id", id), StringField("path", task.path), ErrorField(e)});
    Publish(id, WARM_STATE_ERROR, static_cast<uint32_t>(storage::common::ProgressPercentage(done, total)), done, total, e.what());
    return;
  }

  const auto elapsed = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started).count();
  observability::Metrics::Instance().ObserveWarmDurationMs(TierName(from), elapsed);

  TIERBRIDGE_LOG_INFO("warm completed", {StringField("request_id", id), StringField("source_id", task.source_id),
                                          StringField("path", task.path), StringField("from", TierName(from)),
                                          BytesField("bytes", total)});
  Publish(id, WARM_STATE_COMPLETED, 100, total, total);
}

bool TieringCoordinator::Publish(const std::string& request_id, WarmState state, uint32_t progress, std::optional<uint64_t> bytes,
                                 std::optional<uint64_t> total, const std::string& error) {
  WarmProgress event;
  {
    std::lock_guard lock(mutex_);
    auto            it = requests_.find(request_id);
    if (it == requests_.end()) return false;

    auto& request = it->second;
    if (IsTerminal(request.latest.status())) return false;
    if (request.canceled && state != WARM_STATE_ERROR) return false;

    request.latest.set_status(state);
    request.latest.set_progress(progress);
    if (bytes) request.latest.set_bytes_transferred(*bytes);
    if (total) request.latest.set_total_bytes(*total);
    request.latest.set_error(error);
    event = request.latest;

    if (IsTerminal(state)) {
      active_by_file_.erase(FileKey(request.handle.source_id(), request.handle.path()));
      Retire(request_id);
    }
  }
  changed_.notify_all();

  events_.Publish(kWarmProgressTopic, event);
  return true;
}

void TieringCoordinator::Retire(const std::string& request_id) {
  finished_.push_back(request_id);
  while (finished_.size() > kMaxFinishedRequests) {
    requests_.erase(finished_.front());
    finished_.pop_front();
  }
}

} // namespace tierbridge::tiering
