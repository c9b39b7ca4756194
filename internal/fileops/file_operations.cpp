#include "file_operations.hpp"

#include <algorithm>
#include <filesystem>
#include <optional>

#include "internal/ledger/operation_ledger.hpp"
#include "internal/observability/logging.hpp"
#include "internal/source/source_registry.hpp"
#include "internal/storage/common/path_utils.hpp"
#include "internal/transcode/transcode_formats.hpp"
#include "internal/transfer/transfer_engine.hpp"
#include "internal/transfer/transfer_error.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace tierbridge::fileops {

using namespace tierbridge::vfs::core::v1;
using observability::BytesField;
using observability::ErrorField;
using observability::IntField;
using observability::StringField;
using storage::common::BaseName;
using storage::common::DestPath;
using storage::common::IsSelfOrDescendant;
using storage::common::NormalizeTarget;
using storage::common::ParentPath;

namespace {

constexpr auto kTransferPoll = std::chrono::seconds(1);

std::string Describe(const Location& location) {
  return location.source_id + ":" + location.path;
}

Location Normalized(const Location& location) {
  return {location.source_id, NormalizeTarget(location.path)};
}

// Host directory holding one downloaded file; removed on scope exit.
class StagingDir {
 public:
  StagingDir(storage::SourceDriverPtr driver, std::string path) : driver_(std::move(driver)), path_(std::move(path)) {
  }

  ~StagingDir() {
    try {
      driver_->DeleteRecursive(path_);
    } catch (const std::exception& e) {
      TIERBRIDGE_LOG_WARN("staging cleanup failed", {StringField("path", path_), ErrorField(e)});
    }
  }

  StagingDir(const StagingDir&)            = delete;
  StagingDir& operator=(const StagingDir&) = delete;

  const std::string& path() const {
    return path_;
  }

 private:
  storage::SourceDriverPtr driver_;
  std::string              path_;
};

} // namespace

FileOperations::FileOperations(std::shared_ptr<source::SourceRegistry> registry, std::shared_ptr<transfer::TransferEngine> transfers,
                               std::shared_ptr<tiering::TieringCoordinator> tiering, std::shared_ptr<ledger::OperationLedger> ledger,
                               storage::SourceDriverPtr local_driver, std::string staging_dir)
    : registry_(std::move(registry)),
      transfers_(std::move(transfers)),
      tiering_(std::move(tiering)),
      ledger_(std::move(ledger)),
      local_driver_(std::move(local_driver)),
      staging_dir_(std::move(staging_dir)) {
  if (staging_dir_.empty()) {
    staging_dir_ = (std::filesystem::temp_directory_path() / "tierbridge-staging").string();
  }
  staging_dir_ = NormalizeTarget(staging_dir_);
}

// ---------------------------------------------------------------------------
// Single-path commands
// ---------------------------------------------------------------------------

MoveResult FileOperations::Move(const Location& from, const Location& to, const ResidencyPolicy& policy) {
  const auto src = Normalized(from);
  const auto dst = Normalized(to);
  registry_->Resolve(src.source_id);
  registry_->Resolve(dst.source_id);

  if (source::SourceRegistry::SameSource(src.source_id, dst.source_id) && IsSelfOrDescendant(dst.path, src.path)) {
    throw std::invalid_argument("cannot move " + src.path + " into itself");
  }

  auto guard = locks_.Lock(dst.source_id, dst.path);
  auto stat  = StatOrThrow(src);
  if (Occupied(dst.source_id, dst.path)) {
    throw util::AlreadyExists("destination exists: " + Describe(dst));
  }
  return DoMove(src, dst, stat, policy);
}

CopyResult FileOperations::Copy(const Location& from, const Location& to, bool recursive, const ResidencyPolicy& policy) {
  const auto src = Normalized(from);
  const auto dst = Normalized(to);
  registry_->Resolve(src.source_id);
  registry_->Resolve(dst.source_id);

  if (source::SourceRegistry::SameSource(src.source_id, dst.source_id) && IsSelfOrDescendant(dst.path, src.path)) {
    throw std::invalid_argument("cannot copy " + src.path + " into itself");
  }

  auto guard = locks_.Lock(dst.source_id, dst.path);
  auto stat  = StatOrThrow(src);
  if (stat.is_directory && !recursive) {
    throw std::invalid_argument(src.path + " is a directory; recursive copy required");
  }
  if (Occupied(dst.source_id, dst.path)) {
    throw util::AlreadyExists("destination exists: " + Describe(dst));
  }
  return DoCopy(src, dst, stat, policy);
}

void FileOperations::Rename(const std::string& source_id, const std::string& from, const std::string& to) {
  const auto src = NormalizeTarget(from);
  if (src == "/") {
    throw std::invalid_argument("cannot rename the root");
  }
  if (to.empty()) {
    throw std::invalid_argument("new name must not be empty");
  }

  std::string target;
  if (to.find('/') != std::string::npos) {
    target = NormalizeTarget(to);
    if (ParentPath(target) != ParentPath(src)) {
      throw std::invalid_argument("rename must stay in " + ParentPath(src));
    }
  } else {
    target = DestPath(ParentPath(src), to);
  }
  if (target == src) return;

  auto driver = registry_->Driver(source_id);
  auto guard  = locks_.Lock(source_id, target);
  auto stat   = StatOrThrow({source_id, src});
  if (Occupied(source_id, target)) {
    throw util::AlreadyExists("destination exists: " + source_id + ":" + target);
  }

  const auto op = ledger_->Begin(OPERATION_TYPE_MOVE, source_id, src, target, stat.is_directory ? 0 : stat.size);
  try {
    driver->Move(src, target);
  } catch (const std::exception& e) {
    ledger_->Fail(op, e.what());
    throw;
  }
  ledger_->Complete(op);

  TIERBRIDGE_LOG_INFO("renamed", {StringField("source_id", source_id), StringField("from", src), StringField("to", target)});
}

void FileOperations::DeleteRecursive(const std::string& source_id, const std::string& path) {
  const auto target = NormalizeTarget(path);
  auto       driver = registry_->Driver(source_id);

  auto guard = locks_.Lock(source_id, target);
  auto stat  = driver->Stat(target);
  if (!stat) {
    TIERBRIDGE_LOG_DEBUG("delete of absent path", {StringField("source_id", source_id), StringField("path", target)});
    return;
  }

  const auto op = ledger_->Begin(OPERATION_TYPE_DELETE, source_id, target, "", stat->is_directory ? 0 : stat->size);
  try {
    driver->DeleteRecursive(target);
  } catch (const std::exception& e) {
    ledger_->Fail(op, e.what());
    throw;
  }
  ledger_->Complete(op);

  TIERBRIDGE_LOG_INFO("deleted", {StringField("source_id", source_id), StringField("path", target),
                                   observability::BoolField("directory", stat->is_directory)});
}

void FileOperations::Mkdir(const std::string& source_id, const std::string& path) {
  const auto target = NormalizeTarget(path);
  auto       driver = registry_->Driver(source_id);

  auto guard = locks_.Lock(source_id, target);
  driver->Mkdir(target);

  TIERBRIDGE_LOG_INFO("directory created", {StringField("source_id", source_id), StringField("path", target)});
}

std::vector<FileOperations::FileEntry> FileOperations::List(const std::string& source_id, const std::string& dir, bool recursive) const {
  auto       driver        = registry_->Driver(source_id);
  const bool can_tier      = registry_->HasCapability(source_id, CAPABILITY_TIERING);
  const bool can_transcode = registry_->HasCapability(source_id, CAPABILITY_TRANSCODE);

  std::vector<FileEntry> out;
  for (const auto& stat : driver->List(NormalizeTarget(dir), recursive)) {
    FileEntry entry;
    entry.set_source_id(source_id);
    entry.set_path(stat.path);
    entry.set_is_directory(stat.is_directory);
    entry.set_size(stat.size);

    const auto tier = stat.is_directory ? TIER_STATUS_HOT : tiering_->TierOf(source_id, stat.path);
    entry.set_tier_status(tier);
    entry.set_can_warm(can_tier && !stat.is_directory && tier != TIER_STATUS_HOT);
    entry.set_can_transcode(can_transcode && !stat.is_directory && transcode::HasVideoExtension(stat.path));
    out.push_back(std::move(entry));
  }

  std::sort(out.begin(), out.end(), [](const FileEntry& a, const FileEntry& b) { return a.path() < b.path(); });
  return out;
}

// ---------------------------------------------------------------------------
// Batches
// ---------------------------------------------------------------------------

FileOperations::BatchResult FileOperations::MoveBatch(const std::string& from_source_id, const std::vector<std::string>& paths,
                                                      const std::string& to_source_id, const std::string& dest_dir,
                                                      const ResidencyPolicy& policy) {
  return Batch(from_source_id, paths, to_source_id, dest_dir, /*move=*/true, policy);
}

FileOperations::BatchResult FileOperations::CopyBatch(const std::string& from_source_id, const std::vector<std::string>& paths,
                                                      const std::string& to_source_id, const std::string& dest_dir,
                                                      const ResidencyPolicy& policy) {
  return Batch(from_source_id, paths, to_source_id, dest_dir, /*move=*/false, policy);
}

FileOperations::BatchResult FileOperations::Batch(const std::string& from_source_id, const std::vector<std::string>& paths,
                                                  const std::string& to_source_id, const std::string& dest_dir, bool move,
                                                  const ResidencyPolicy& policy) {
  BatchResult result;
  for (const auto& path : paths) {
    try {
      result.add_pasted_paths(PlaceInto({from_source_id, path}, to_source_id, dest_dir, move, policy));
      result.set_files_pasted(result.files_pasted() + 1);
    } catch (const std::exception& e) {
      result.set_files_failed(result.files_failed() + 1);
      result.add_errors(path + ": " + e.what());
    }
  }

  TIERBRIDGE_LOG_INFO(move ? "move batch finished" : "copy batch finished",
                      {StringField("from_source_id", from_source_id), StringField("to_source_id", to_source_id),
                       StringField("dest_dir", dest_dir), IntField("succeeded", result.files_pasted()),
                       IntField("failed", result.files_failed())});
  return result;
}

std::string FileOperations::PlaceInto(const Location& from, const std::string& to_source_id, const std::string& dest_dir, bool move,
                                      const ResidencyPolicy& policy) {
  const auto src = Normalized(from);
  const auto dir = NormalizeTarget(dest_dir);
  if (src.path == "/") {
    throw std::invalid_argument("cannot place the root of a source");
  }

  const bool same_source = source::SourceRegistry::SameSource(src.source_id, to_source_id);
  if (same_source && IsSelfOrDescendant(dir, src.path)) {
    throw std::invalid_argument("cannot place " + src.path + " inside itself");
  }

  auto dst_driver = registry_->Driver(to_source_id);
  if (dir != "/") {
    auto dir_stat = dst_driver->Stat(dir);
    if (!dir_stat || !dir_stat->is_directory) {
      throw util::NotFound("destination folder not found: " + to_source_id + ":" + dir);
    }
  }

  const auto name = BaseName(src.path);
  const auto stat = StatOrThrow(src);

  // Moving a file into the folder it already sits in changes nothing.
  if (move && same_source && ParentPath(src.path) == dir) {
    return src.path;
  }

  // The chosen path stays locked until the write below finished; other
  // pickers skip locked names.
  std::optional<PathLocks::Guard> guard;
  std::string                     dest_path;
  {
    auto naming = naming_locks_.Lock(to_source_id, dir);
    for (;;) {
      const auto free_name = storage::common::NextAvailableName(dir, name, stat.is_directory, [&](const std::string& candidate) {
        return locks_.Held(to_source_id, candidate) || Occupied(to_source_id, candidate);
      });
      dest_path = DestPath(dir, free_name);
      guard.emplace(locks_.Lock(to_source_id, dest_path));
      // A single-path command may have taken the name between the pick and the lock.
      if (!Occupied(to_source_id, dest_path)) break;
      guard.reset();
    }
  }
  const Location dst{to_source_id, dest_path};

  if (move) {
    DoMove(src, dst, stat, policy);
  } else {
    DoCopy(src, dst, stat, policy);
  }
  return dst.path;
}

// ---------------------------------------------------------------------------
// Execution (destination lock held)
// ---------------------------------------------------------------------------

MoveResult FileOperations::DoMove(const Location& from, const Location& to, const storage::FileStat& stat, const ResidencyPolicy& policy) {
  const auto op = ledger_->Begin(OPERATION_TYPE_MOVE, from.source_id, from.path, to.path, stat.is_directory ? 0 : stat.size);

  MoveResult result;
  result.dest_path = to.path;
  try {
    if (source::SourceRegistry::IsMove(from.source_id, to.source_id) &&
        registry_->HasCapability(from.source_id, CAPABILITY_ATOMIC_RENAME)) {
      registry_->Driver(from.source_id)->Move(from.path, to.path);
    } else {
      // The source goes only after the destination is complete.
      result.bytes_transferred = TransferTree(from, to, stat, policy);
      registry_->Driver(from.source_id)->DeleteRecursive(from.path);
    }
    result.source_deleted = true;
  } catch (const std::exception& e) {
    ledger_->Fail(op, e.what());
    throw;
  }
  ledger_->Complete(op);

  TIERBRIDGE_LOG_INFO("moved", {StringField("from", Describe(from)), StringField("to", Describe(to)),
                                 BytesField("bytes_transferred", result.bytes_transferred)});
  return result;
}

CopyResult FileOperations::DoCopy(const Location& from, const Location& to, const storage::FileStat& stat, const ResidencyPolicy& policy) {
  const auto op = ledger_->Begin(OPERATION_TYPE_COPY, from.source_id, from.path, to.path, stat.is_directory ? 0 : stat.size);

  CopyResult result;
  result.dest_path = to.path;
  try {
    if (source::SourceRegistry::SameSource(from.source_id, to.source_id)) {
      auto driver = registry_->Driver(from.source_id);
      if (stat.is_directory) {
        for (const auto& entry : driver->List(from.path, /*recursive=*/true)) {
          if (entry.is_directory) continue;
          tiering_->EnsureResident(from.source_id, entry.path, policy);
          result.bytes_transferred += entry.size;
        }
      } else {
        tiering_->EnsureResident(from.source_id, from.path, policy);
        result.bytes_transferred = stat.size;
      }
      driver->Copy(from.path, to.path);
    } else {
      result.bytes_transferred = TransferTree(from, to, stat, policy);
    }
  } catch (const std::exception& e) {
    ledger_->Fail(op, e.what());
    throw;
  }
  ledger_->Complete(op);

  TIERBRIDGE_LOG_INFO("copied", {StringField("from", Describe(from)), StringField("to", Describe(to)),
                                  BytesField("bytes_transferred", result.bytes_transferred)});
  return result;
}

uint64_t FileOperations::TransferTree(const Location& from, const Location& to, const storage::FileStat& stat,
                                      const ResidencyPolicy& policy) {
  if (!stat.is_directory) {
    return TransferFile(from, to, policy);
  }

  auto src = registry_->Driver(from.source_id);
  auto dst = registry_->Driver(to.source_id);
  if (!dst->Exists(to.path)) dst->Mkdir(to.path);

  const size_t prefix = from.path.size() + 1;
  uint64_t     total  = 0;
  // Directories come before their contents in a recursive listing.
  for (const auto& entry : src->List(from.path, /*recursive=*/true)) {
    const auto target = DestPath(to.path, entry.path.substr(prefix));
    if (entry.is_directory) {
      if (!dst->Exists(target)) dst->Mkdir(target);
      continue;
    }
    total += TransferFile({from.source_id, entry.path}, {to.source_id, target}, policy);
  }
  return total;
}

uint64_t FileOperations::TransferFile(const Location& from, const Location& to, const ResidencyPolicy& policy) {
  tiering_->EnsureResident(from.source_id, from.path, policy);

  auto host_path = registry_->Driver(from.source_id)->LocalPath(from.path);

  // A host-side destination is downloaded to directly.
  if (!host_path) {
    if (auto dest_host = registry_->Driver(to.source_id)->LocalPath(to.path)) {
      return Await(transfers_->EnqueueDownload(from.source_id, from.path, *dest_host).id(), policy).bytes_transferred();
    }
  }

  std::unique_ptr<StagingDir> staging;
  if (!host_path) {
    staging        = std::make_unique<StagingDir>(local_driver_, DestPath(staging_dir_, util::NewId()));
    const auto dst = DestPath(staging->path(), BaseName(from.path));
    Await(transfers_->EnqueueDownload(from.source_id, from.path, dst).id(), policy);
    host_path = dst;
  }

  const auto upload = Await(transfers_->EnqueueUpload(to.source_id, *host_path, to.path).id(), policy);
  return upload.bytes_transferred();
}

/*
  Blocks until the transfer is terminal. A transfer paused by its owner
  gets policy.timeout to be resumed (no grace when zero), then the caller
  gets InvalidState while the transfer itself stays paused.
*/
tierbridge::vfs::core::v1::TransferRecord FileOperations::Await(const std::string& transfer_id, const ResidencyPolicy& policy) const {
  std::optional<std::chrono::steady_clock::time_point> paused_since;
  for (;;) {
    if (!transfers_->Running()) {
      throw std::runtime_error("transfer engine is not running");
    }
    auto record = transfers_->Wait(transfer_id, kTransferPoll);
    switch (record.status()) {
      case TRANSFER_STATUS_COMPLETED:
        return record;
      case TRANSFER_STATUS_FAILED:
        transfer::ThrowTransferError(record.error_code(), record.error());
      case TRANSFER_STATUS_CANCELED:
        throw util::InvalidState("transfer " + transfer_id + " was canceled");
      case TRANSFER_STATUS_PAUSED: {
        const auto now = std::chrono::steady_clock::now();
        if (!paused_since) paused_since = now;
        if (now - *paused_since >= policy.timeout) {
          throw util::InvalidState("transfer " + transfer_id + " is paused");
        }
        break;
      }
      default:
        paused_since.reset();
        break;
    }
  }
}

bool FileOperations::Occupied(const std::string& source_id, const std::string& path) const {
  auto driver = registry_->Driver(source_id);
  return driver->Exists(path) || driver->HasPendingParts(path);
}

storage::FileStat FileOperations::StatOrThrow(const Location& location) const {
  auto stat = registry_->Driver(location.source_id)->Stat(location.path);
  if (!stat) {
    throw util::NotFound("not found: " + Describe(location));
  }
  return *stat;
}

} // namespace tierbridge::fileops
