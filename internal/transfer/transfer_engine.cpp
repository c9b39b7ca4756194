#include "transfer_engine.hpp"

#include <arrow/buffer.h>

#include <algorithm>
#include <cstring>

#include "internal/db/api/db_errors.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/source/source_registry.hpp"
#include "internal/storage/common/arrow_utils.hpp"
#include "internal/storage/common/path_utils.hpp"
#include "internal/transfer/transfer_error.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace tierbridge::transfer {

using namespace tierbridge::vfs::core::v1;
using observability::BytesField;
using observability::ErrorField;
using observability::IntField;
using observability::StringField;

namespace {

constexpr uint64_t kDefaultPartSize = 5ull * 1024 * 1024;
constexpr uint64_t kReadChunkBytes  = 1ull * 1024 * 1024;

bool IsTerminal(TransferStatus status) {
  return status == TRANSFER_STATUS_COMPLETED || status == TRANSFER_STATUS_FAILED || status == TRANSFER_STATUS_CANCELED;
}

const char* KindName(TransferKind kind) {
  return kind == TRANSFER_KIND_UPLOAD ? "upload" : "download";
}

uint32_t PartCount(uint64_t total, uint64_t part_size) {
  return static_cast<uint32_t>((total + part_size - 1) / part_size);
}

void SetTimestamp(google::protobuf::Timestamp* out, uint64_t ms) {
  *out = util::ToProto(util::FromUnixMillis(ms));
}

} // namespace

std::string TransferTopic(const std::string& transfer_id) {
  return "transfer:" + transfer_id;
}

TransferEngine::TransferEngine(std::shared_ptr<db::Repository> repository, std::shared_ptr<source::SourceRegistry> registry,
                               storage::SourceDriverPtr local_driver, tierbridge::runtime::config::TransferConfig config)
    : repository_(std::move(repository)),
      registry_(std::move(registry)),
      local_driver_(std::move(local_driver)),
      config_(std::move(config)),
      scheduler_(config_.per_source_concurrency()) {
  if (config_.part_size_bytes() == 0) config_.set_part_size_bytes(kDefaultPartSize);
  if (config_.workers() == 0) config_.set_workers(1);
  if (config_.max_part_attempts() == 0) config_.set_max_part_attempts(1);
  if (config_.progress_interval_ms() == 0) config_.set_progress_interval_ms(1000);
  if (config_.speed_window_ms() == 0) config_.set_speed_window_ms(5000);
}

TransferEngine::~TransferEngine() {
  Stop();
}

// ---------------------------------------------------------------------------
// Lifecycle
// ---------------------------------------------------------------------------

void TransferEngine::Start() {
  if (running_.exchange(true)) return;

  std::vector<db::model::TransferRecord> rows;
  {
    auto tx = repository_->Begin();
    rows    = repository_->ListTransfers(*tx);
    tx->Commit();
  }

  std::vector<TransferTask> requeue;
  {
    std::lock_guard lock(mutex_);
    for (auto& row : rows) {
      if (row.status == TRANSFER_STATUS_PENDING || row.status == TRANSFER_STATUS_IN_PROGRESS) {
        row.status        = TRANSFER_STATUS_PENDING;
        row.updated_at_ms = util::NowMillis();
        Persist(row);
        requeue.push_back({row.id, row.source_id});
      }
      Entry entry;
      entry.record = row;
      entry.speed  = SpeedWindow(std::chrono::milliseconds(config_.speed_window_ms()));
      entries_.insert_or_assign(row.id, std::move(entry));
    }
  }

  for (auto& task : requeue) {
    TIERBRIDGE_LOG_INFO("transfer recovered", {StringField("transfer_id", task.transfer_id), StringField("source_id", task.source_id)});
    scheduler_.Enqueue(std::move(task));
  }

  for (uint32_t i = 0; i < config_.workers(); ++i) {
    workers_.emplace_back(&TransferEngine::WorkerLoop, this);
  }
  ticker_ = std::thread(&TransferEngine::TickerLoop, this);
}

void TransferEngine::Stop() {
  if (!running_.exchange(false)) return;

  scheduler_.Shutdown();
  changed_.notify_all();

  for (auto& worker : workers_) {
    if (worker.joinable()) worker.join();
  }
  workers_.clear();
  if (ticker_.joinable()) ticker_.join();
}

// ---------------------------------------------------------------------------
// Commands
// ---------------------------------------------------------------------------

TransferEngine::Record TransferEngine::EnqueueUpload(const std::string& source_id, const std::string& local_path,
                                                     const std::string& remote_path) {
  return Enqueue(TRANSFER_KIND_UPLOAD, source_id, local_path, remote_path);
}

TransferEngine::Record TransferEngine::EnqueueDownload(const std::string& source_id, const std::string& remote_path,
                                                       const std::string& local_path) {
  return Enqueue(TRANSFER_KIND_DOWNLOAD, source_id, local_path, remote_path);
}

TransferEngine::Record TransferEngine::Enqueue(TransferKind kind, const std::string& source_id, const std::string& local_path,
                                               const std::string& remote_path) {
  registry_->Resolve(source_id);

  const auto local  = storage::common::NormalizeTarget(local_path);
  const auto remote = storage::common::NormalizeTarget(remote_path);

  auto        reader    = kind == TRANSFER_KIND_UPLOAD ? local_driver_ : registry_->Driver(source_id);
  const auto& read_path = kind == TRANSFER_KIND_UPLOAD ? local : remote;

  auto stat = reader->Stat(read_path);
  if (!stat) {
    throw util::NotFound(std::string(KindName(kind)) + " source not found: " + read_path);
  }
  if (stat->is_directory) {
    throw std::invalid_argument("cannot transfer a directory: " + read_path);
  }

  db::model::TransferRecord record;
  record.id            = util::NewId();
  record.kind          = kind;
  record.source_id     = source_id;
  record.local_path    = local;
  record.remote_path   = remote;
  record.total_size    = stat->size;
  record.part_size     = config_.part_size_bytes();
  record.total_parts   = PartCount(record.total_size, record.part_size);
  record.status        = TRANSFER_STATUS_PENDING;
  record.created_at_ms = util::NowMillis();
  record.updated_at_ms = record.created_at_ms;

  {
    auto tx = repository_->Begin();
    db::ThrowIfDbError(repository_->InsertTransfer(*tx, record), "enqueue " + std::string(KindName(kind)));
    tx->Commit();
  }

  Record snapshot;
  {
    std::lock_guard lock(mutex_);
    Entry           entry;
    entry.record = record;
    entry.speed  = SpeedWindow(std::chrono::milliseconds(config_.speed_window_ms()));
    snapshot     = Snapshot(entry);
    entries_.insert_or_assign(record.id, std::move(entry));
  }

  TIERBRIDGE_LOG_INFO("transfer enqueued", {StringField("transfer_id", record.id), StringField("kind", KindName(kind)),
                                             StringField("source_id", source_id), BytesField("total_size", record.total_size),
                                             IntField("total_parts", record.total_parts)});

  Publish(snapshot);
  scheduler_.Enqueue({record.id, source_id});
  return snapshot;
}

void TransferEngine::Pause(const std::string& id) {
  Record snapshot;
  {
    std::lock_guard lock(mutex_);
    auto&           entry  = Find(id);
    const auto      status = entry.record.status;
    if (status != TRANSFER_STATUS_PENDING && status != TRANSFER_STATUS_IN_PROGRESS) return;

    if (status == TRANSFER_STATUS_PENDING) scheduler_.Remove(id);

    auto updated          = entry.record;
    updated.status        = TRANSFER_STATUS_PAUSED;
    updated.updated_at_ms = util::NowMillis();
    Persist(updated);
    entry.record = updated;
    entry.speed.Clear();
    snapshot = Snapshot(entry);
  }
  changed_.notify_all();

  TIERBRIDGE_LOG_INFO("transfer paused", {StringField("transfer_id", id), BytesField("bytes_transferred", snapshot.bytes_transferred())});
  Publish(snapshot);
}

void TransferEngine::Resume(const std::string& id, const std::string& source_id) {
  // Re-resolving the source re-validates that it is still mounted.
  registry_->Resolve(source_id);

  Record snapshot;
  {
    std::lock_guard lock(mutex_);
    auto&           entry = Find(id);
    if (entry.record.source_id != source_id) {
      throw std::invalid_argument("transfer " + id + " belongs to source " + entry.record.source_id);
    }
    if (entry.record.status != TRANSFER_STATUS_PAUSED) return;

    auto updated          = entry.record;
    updated.status        = TRANSFER_STATUS_PENDING;
    updated.updated_at_ms = util::NowMillis();
    Persist(updated);
    entry.record = updated;
    snapshot     = Snapshot(entry);
  }

  TIERBRIDGE_LOG_INFO("transfer resumed", {StringField("transfer_id", id), IntField("part_index", snapshot.part_index())});
  Publish(snapshot);
  scheduler_.Enqueue({id, source_id});
}

void TransferEngine::Cancel(const std::string& id) {
  Record snapshot;
  {
    std::lock_guard lock(mutex_);
    auto&           entry = Find(id);
    if (IsTerminal(entry.record.status)) return;

    scheduler_.Remove(id);
    MarkTerminal(entry, TRANSFER_STATUS_CANCELED, "", TRANSFER_ERROR_CODE_UNSPECIFIED);
    snapshot = Snapshot(entry);
  }
  changed_.notify_all();

  TIERBRIDGE_LOG_INFO("transfer canceled", {StringField("transfer_id", id), BytesField("bytes_transferred", snapshot.bytes_transferred())});
  Publish(snapshot);
}

// ---------------------------------------------------------------------------
// Queries
// ---------------------------------------------------------------------------

TransferEngine::Record TransferEngine::Get(const std::string& id) const {
  std::lock_guard lock(mutex_);
  return Snapshot(Find(id));
}

std::vector<TransferEngine::Record> TransferEngine::List(const ListFilter& filter) const {
  std::vector<Record> out;
  {
    std::lock_guard lock(mutex_);
    for (const auto& [id, entry] : entries_) {
      if (filter.source_id && entry.record.source_id != *filter.source_id) continue;
      if (filter.active_only && IsTerminal(entry.record.status)) continue;
      out.push_back(Snapshot(entry));
    }
  }
  std::sort(out.begin(), out.end(), [](const Record& a, const Record& b) {
    const auto ta = util::ToUnixMillis(a.created_at());
    const auto tb = util::ToUnixMillis(b.created_at());
    if (ta != tb) return ta < tb;
    return a.id() < b.id();
  });
  return out;
}

TransferEngine::Record TransferEngine::Wait(const std::string& id, std::chrono::milliseconds timeout) const {
  std::unique_lock lock(mutex_);
  Find(id);
  changed_.wait_for(lock, timeout, [&] {
    auto it = entries_.find(id);
    return it == entries_.end() || IsTerminal(it->second.record.status);
  });
  return Snapshot(Find(id));
}

TransferEngine::EventHub::Token TransferEngine::Subscribe(const std::string& id, EventHub::Callback callback) {
  {
    std::lock_guard lock(mutex_);
    Find(id);
  }
  return events_.Subscribe(TransferTopic(id), std::move(callback));
}

void TransferEngine::Unsubscribe(EventHub::Token token) {
  events_.Unsubscribe(token);
}

size_t TransferEngine::Prune(size_t keep) {
  std::lock_guard lock(mutex_);

  std::vector<const Entry*> terminal;
  for (const auto& [id, entry] : entries_) {
    if (IsTerminal(entry.record.status)) terminal.push_back(&entry);
  }
  if (terminal.size() <= keep) return 0;

  std::sort(terminal.begin(), terminal.end(), [](const Entry* a, const Entry* b) {
    if (a->record.completed_at_ms != b->record.completed_at_ms) return a->record.completed_at_ms > b->record.completed_at_ms;
    return a->record.id > b->record.id;
  });

  std::vector<std::string> doomed;
  for (size_t i = keep; i < terminal.size(); ++i) {
    doomed.push_back(terminal[i]->record.id);
  }

  auto tx = repository_->Begin();
  for (const auto& id : doomed) {
    db::ThrowIfDbError(repository_->DeleteTransfer(*tx, id), "prune transfer " + id);
  }
  tx->Commit();

  for (const auto& id : doomed) {
    entries_.erase(id);
  }
  return doomed.size();
}

// ---------------------------------------------------------------------------
// Workers
// ---------------------------------------------------------------------------

void TransferEngine::WorkerLoop() {
  while (running_) {
    auto task = scheduler_.Dequeue();
    if (!task) break;

    try {
      Run(*task);
    } catch (const std::exception& e) {
      TIERBRIDGE_LOG_ERROR("transfer worker failed", {StringField("transfer_id", task->transfer_id), ErrorField(e)});
    }
    scheduler_.Release(task->source_id);
  }
}

void TransferEngine::TickerLoop() {
  while (running_) {
    std::vector<Record> active;
    {
      std::unique_lock lock(mutex_);
      changed_.wait_for(lock, std::chrono::milliseconds(config_.progress_interval_ms()), [this] { return !running_; });
      if (!running_) break;
      for (const auto& [id, entry] : entries_) {
        if (entry.record.status == TRANSFER_STATUS_IN_PROGRESS) active.push_back(Snapshot(entry));
      }
    }

    for (const auto& record : active) {
      Publish(record);
    }

    if (config_.history_retention() > 0) {
      try {
        Prune(config_.history_retention());
      } catch (const std::exception& e) {
        TIERBRIDGE_LOG_WARN("transfer history prune failed", {ErrorField(e)});
      }
    }
  }
}

void TransferEngine::Run(const TransferTask& task) {
  const auto& id = task.transfer_id;

  uint64_t generation = 0;
  Record   snapshot;
  {
    std::lock_guard lock(mutex_);
    auto            it = entries_.find(id);
    if (it == entries_.end() || it->second.record.status != TRANSFER_STATUS_PENDING) return;

    auto& entry           = it->second;
    auto  updated         = entry.record;
    updated.status        = TRANSFER_STATUS_IN_PROGRESS;
    updated.updated_at_ms = util::NowMillis();
    Persist(updated);
    entry.record   = updated;
    entry.attempts = 0;
    entry.speed.Reset(SpeedWindow::Clock::now());
    generation = ++entry.generation;
    snapshot   = Snapshot(entry);
  }

  TIERBRIDGE_LOG_INFO("transfer started", {StringField("transfer_id", id), IntField("part_index", snapshot.part_index()),
                                            IntField("total_parts", snapshot.total_parts())});
  Publish(snapshot);

  const auto started = std::chrono::steady_clock::now();
  try {
    if (Transfer(id, generation)) {
      const auto elapsed = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started).count();
      observability::Metrics::Instance().ObserveTransferDurationMs(KindName(snapshot.kind()), elapsed);
    }
  } catch (const std::exception& e) {
    Fail(id, generation, e.what(), ClassifyError(e));
  }
}

bool TransferEngine::Transfer(const std::string& id, uint64_t generation) {
  db::model::TransferRecord record;
  {
    std::lock_guard lock(mutex_);
    record = Find(id).record;
  }

  const bool upload     = record.kind == TRANSFER_KIND_UPLOAD;
  auto       remote     = registry_->Driver(record.source_id);
  auto       reader     = upload ? local_driver_ : remote;
  auto       writer     = upload ? remote : local_driver_;
  const auto read_path  = upload ? record.local_path : record.remote_path;
  const auto write_path = upload ? record.remote_path : record.local_path;

  const uint32_t max_attempts = config_.max_part_attempts();
  const auto     backoff      = std::chrono::milliseconds(config_.retry_backoff_ms());

  // Runs fn with bounded retries. Returns false when the transfer stopped
  // being ours while backing off.
  auto with_retry = [&](const char* what, const auto& fn) -> bool {
    for (uint32_t attempt = 1;; ++attempt) {
      try {
        return fn();
      } catch (const std::exception& e) {
        if (util::IsPermanent(e) || attempt >= max_attempts) throw;
        TIERBRIDGE_LOG_WARN("transfer step failed, retrying", {StringField("transfer_id", id), StringField("step", what),
                                                                IntField("attempt", attempt), ErrorField(e)});
        std::unique_lock lock(mutex_);
        Find(id).attempts = attempt;
        changed_.wait_for(lock, backoff * attempt, [&] { return !StillMine(id, generation); });
        if (!StillMine(id, generation)) return false;
      }
    }
  };

  for (;;) {
    uint32_t part = 0;
    {
      std::lock_guard lock(mutex_);
      if (!StillMine(id, generation)) return false;
      part = Find(id).record.part_index;
    }
    if (part >= record.total_parts) break;

    const uint64_t offset = static_cast<uint64_t>(part) * record.part_size;
    const uint64_t length = std::min<uint64_t>(record.part_size, record.total_size - offset);

    const bool written = with_retry("part", [&] {
      auto buffer = ReadPart(id, generation, *reader, read_path, offset, length);
      if (!buffer) return false;
      {
        std::lock_guard lock(mutex_);
        if (!StillMine(id, generation)) return false;
      }
      writer->WritePart(write_path, part, buffer);
      return true;
    });
    if (!written) return false;

    Record snapshot;
    bool   paused = false;
    {
      std::lock_guard lock(mutex_);
      auto&           entry = Find(id);
      // A part that finished after pause still counts; after cancel the record is frozen.
      if (entry.generation != generation || IsTerminal(entry.record.status)) return false;

      auto updated = entry.record;
      updated.bytes_transferred += length;
      updated.part_index    = part + 1;
      updated.updated_at_ms = util::NowMillis();
      Persist(updated);
      entry.record   = updated;
      entry.attempts = 0;
      if (entry.record.status == TRANSFER_STATUS_IN_PROGRESS) {
        entry.speed.Add(length, SpeedWindow::Clock::now());
      }
      paused   = entry.record.status != TRANSFER_STATUS_IN_PROGRESS;
      snapshot = Snapshot(entry);
    }

    observability::Metrics::Instance().AddTransferredBytes(record.source_id, length);
    if (observability::Enabled(spdlog::level::debug)) {
      TIERBRIDGE_LOG_DEBUG("part persisted", {StringField("transfer_id", id), IntField("part", part + 1),
                                              IntField("total_parts", record.total_parts),
                                              BytesField("bytes_transferred", snapshot.bytes_transferred())});
    }
    Publish(snapshot);
    if (paused || !running_) return false;
  }

  const bool finalized = with_retry("finalize", [&] {
    {
      std::lock_guard lock(mutex_);
      if (!StillMine(id, generation)) return false;
    }
    writer->FinalizeParts(write_path, record.total_parts);
    return true;
  });
  if (!finalized) return false;

  Record snapshot;
  {
    std::lock_guard lock(mutex_);
    auto&           entry = Find(id);
    if (entry.generation != generation || IsTerminal(entry.record.status)) return false;
    MarkTerminal(entry, TRANSFER_STATUS_COMPLETED, "", TRANSFER_ERROR_CODE_UNSPECIFIED);
    snapshot = Snapshot(entry);
  }
  changed_.notify_all();

  TIERBRIDGE_LOG_INFO("transfer completed", {StringField("transfer_id", id), StringField("kind", KindName(record.kind)),
                                              BytesField("bytes_transferred", snapshot.bytes_transferred())});
  Publish(snapshot);
  return true;
}

std::shared_ptr<arrow::Buffer> TransferEngine::ReadPart(const std::string& id, uint64_t generation, storage::SourceDriver& reader,
                                                        const std::string& path, uint64_t offset, uint64_t length) {
  auto buffer = storage::common::Unwrap(arrow::AllocateResizableBuffer(static_cast<int64_t>(length)));

  uint64_t done = 0;
  while (done < length) {
    {
      std::lock_guard lock(mutex_);
      if (!StillMine(id, generation)) return nullptr;
    }

    const uint64_t chunk = std::min(kReadChunkBytes, length - done);
    auto           data  = reader.ReadAt(path, offset + done, chunk);
    if (data->size() == 0) {
      throw std::runtime_error("short read at offset " + std::to_string(offset + done) + " of " + path);
    }
    std::memcpy(buffer->mutable_data() + done, data->data(), static_cast<size_t>(data->size()));
    done += static_cast<uint64_t>(data->size());
  }
  return std::shared_ptr<arrow::Buffer>(std::move(buffer));
}

void TransferEngine::Fail(const std::string& id, uint64_t generation, const std::string& error, TransferErrorCode code) {
  Record snapshot;
  {
    std::lock_guard lock(mutex_);
    auto            it = entries_.find(id);
    if (it == entries_.end() || it->second.generation != generation || IsTerminal(it->second.record.status)) return;
    try {
      MarkTerminal(it->second, TRANSFER_STATUS_FAILED, error, code);
    } catch (const std::exception& e) {
      TIERBRIDGE_LOG_ERROR("failed to persist transfer failure", {StringField("transfer_id", id), ErrorField(e)});
      return;
    }
    snapshot = Snapshot(it->second);
  }
  changed_.notify_all();

  TIERBRIDGE_LOG_ERROR("transfer failed", {StringField("transfer_id", id), StringField("error", error),
                                            StringField("error_code", TransferErrorCode_Name(code))});
  Publish(snapshot);
}

// ---------------------------------------------------------------------------
// Helpers (mutex_ held)
// ---------------------------------------------------------------------------

TransferEngine::Entry& TransferEngine::Find(const std::string& id) {
  auto it = entries_.find(id);
  if (it == entries_.end()) throw util::NotFound("transfer not found: " + id);
  return it->second;
}

const TransferEngine::Entry& TransferEngine::Find(const std::string& id) const {
  auto it = entries_.find(id);
  if (it == entries_.end()) throw util::NotFound("transfer not found: " + id);
  return it->second;
}

bool TransferEngine::StillMine(const std::string& id, uint64_t generation) const {
  auto it = entries_.find(id);
  return running_ && it != entries_.end() && it->second.generation == generation && it->second.record.status == TRANSFER_STATUS_IN_PROGRESS;
}

void TransferEngine::Persist(const db::model::TransferRecord& record) {
  auto tx = repository_->Begin();
  db::ThrowIfDbError(repository_->UpdateTransfer(*tx, record), "persist transfer " + record.id);
  tx->Commit();
}

void TransferEngine::MarkTerminal(Entry& entry, TransferStatus status, const std::string& error, TransferErrorCode code) {
  auto updated            = entry.record;
  updated.status          = status;
  updated.error           = error;
  updated.error_code      = code;
  updated.updated_at_ms   = util::NowMillis();
  updated.completed_at_ms = updated.updated_at_ms;
  Persist(updated);
  entry.record = updated;
  entry.speed.Clear();
}

TransferEngine::Record TransferEngine::Snapshot(const Entry& entry) const {
  const auto& r = entry.record;

  Record out;
  out.set_id(r.id);
  out.set_kind(r.kind);
  out.set_source_id(r.source_id);
  out.set_local_path(r.local_path);
  out.set_remote_path(r.remote_path);
  out.set_total_size(r.total_size);
  out.set_bytes_transferred(r.bytes_transferred);
  out.set_part_index(r.part_index);
  out.set_total_parts(r.total_parts);
  out.set_part_size(r.part_size);
  out.set_status(r.status);
  out.set_error(r.error);
  out.set_error_code(r.error_code);
  out.set_attempts(entry.attempts);
  SetTimestamp(out.mutable_created_at(), r.created_at_ms);
  SetTimestamp(out.mutable_updated_at(), r.updated_at_ms);
  if (r.completed_at_ms != 0) SetTimestamp(out.mutable_completed_at(), r.completed_at_ms);

  if (r.status == TRANSFER_STATUS_IN_PROGRESS) {
    if (auto rate = entry.speed.Rate(SpeedWindow::Clock::now())) {
      out.set_speed_bytes_per_sec(*rate);
      if (*rate > 0.0) {
        out.set_eta_sec(static_cast<double>(r.total_size - r.bytes_transferred) / *rate);
      }
    }
  }
  return out;
}

void TransferEngine::Publish(const Record& record) {
  events_.Publish(TransferTopic(record.id()), record);
  events_.Publish(kTransferProgressTopic, record);
}

} // namespace tierbridge::transfer
