#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "internal/fileops/path_locks.hpp"
#include "internal/storage/source_driver.hpp"
#include "internal/tiering/tiering_coordinator.hpp"
#include "tierbridge/vfs/core/v1/types.pb.h"

namespace tierbridge::source {
class SourceRegistry;
}
namespace tierbridge::transfer {
class TransferEngine;
}
namespace tierbridge::ledger {
class OperationLedger;
}

namespace tierbridge::fileops {

struct Location {
  std::string source_id;
  std::string path;
};

struct MoveResult {
  uint64_t    bytes_transferred = 0;
  bool        source_deleted    = false;
  std::string dest_path;
};

struct CopyResult {
  uint64_t    bytes_transferred = 0;
  std::string dest_path;
};

/*
  FileOperations

  POSIX-like file commands over mounted sources.

  Move vs copy:
    same source with atomic-rename      -> driver rename, no bytes move
    anything else                       -> download to staging, upload to
                                           the destination through the
                                           TransferEngine, then delete the
                                           source once the upload completed

  Files are gated through the TieringCoordinator before their bytes are
  read. Writes to one destination path are serialized. Batch commands pick
  a free "name copy" under a per-directory naming lock and keep the chosen
  path locked until its write finished, so two batches never land on the
  same name. Every move, copy and delete lands in the operation ledger.
*/
class FileOperations {
 public:
  using ResidencyPolicy = tiering::TieringCoordinator::ResidencyPolicy;
  using BatchResult     = tierbridge::vfs::core::v1::BatchResult;
  using FileEntry       = tierbridge::vfs::core::v1::FileEntry;

  FileOperations(std::shared_ptr<source::SourceRegistry> registry, std::shared_ptr<transfer::TransferEngine> transfers,
                 std::shared_ptr<tiering::TieringCoordinator> tiering, std::shared_ptr<ledger::OperationLedger> ledger,
                 storage::SourceDriverPtr local_driver, std::string staging_dir);

  // `to.path` is the full destination path; throws AlreadyExists when taken.
  MoveResult Move(const Location& from, const Location& to, const ResidencyPolicy& policy = {});
  CopyResult Copy(const Location& from, const Location& to, bool recursive, const ResidencyPolicy& policy = {});

  // Stays in the parent directory; `to` is a name or a sibling path.
  void Rename(const std::string& source_id, const std::string& from, const std::string& to);

  // Succeeds when the path does not exist.
  void DeleteRecursive(const std::string& source_id, const std::string& path);

  void Mkdir(const std::string& source_id, const std::string& path);

  std::vector<FileEntry> List(const std::string& source_id, const std::string& dir, bool recursive) const;

  /*
    Moves or copies each path into dest_dir under its own name, or the next
    free copy name. Per-path failures are collected as "<path>: <reason>";
    the batch never throws for them and never rolls back earlier files.
  */
  BatchResult MoveBatch(const std::string& from_source_id, const std::vector<std::string>& paths, const std::string& to_source_id,
                        const std::string& dest_dir, const ResidencyPolicy& policy = {});
  BatchResult CopyBatch(const std::string& from_source_id, const std::vector<std::string>& paths, const std::string& to_source_id,
                        const std::string& dest_dir, const ResidencyPolicy& policy = {});

  // Places one path into dest_dir. Returns the destination path.
  std::string PlaceInto(const Location& from, const std::string& to_source_id, const std::string& dest_dir, bool move,
                        const ResidencyPolicy& policy);

 private:
  BatchResult Batch(const std::string& from_source_id, const std::vector<std::string>& paths, const std::string& to_source_id,
                    const std::string& dest_dir, bool move, const ResidencyPolicy& policy);

  // Destination lock held by the caller.
  MoveResult DoMove(const Location& from, const Location& to, const storage::FileStat& stat, const ResidencyPolicy& policy);
  CopyResult DoCopy(const Location& from, const Location& to, const storage::FileStat& stat, const ResidencyPolicy& policy);

  // Streams one file or tree from one source to another through the engine.
  uint64_t TransferTree(const Location& from, const Location& to, const storage::FileStat& stat, const ResidencyPolicy& policy);
  uint64_t TransferFile(const Location& from, const Location& to, const ResidencyPolicy& policy);
  tierbridge::vfs::core::v1::TransferRecord Await(const std::string& transfer_id, const ResidencyPolicy& policy) const;

  // Existing file or directory, or an upload still writing parts.
  bool Occupied(const std::string& source_id, const std::string& path) const;

  storage::FileStat StatOrThrow(const Location& location) const;

  std::shared_ptr<source::SourceRegistry>      registry_;
  std::shared_ptr<transfer::TransferEngine>    transfers_;
  std::shared_ptr<tiering::TieringCoordinator> tiering_;
  std::shared_ptr<ledger::OperationLedger>     ledger_;
  storage::SourceDriverPtr                     local_driver_;
  std::string                                  staging_dir_;

  PathLocks locks_;
  // One name pick at a time per destination directory.
  PathLocks naming_locks_;
};

} // namespace tierbridge::fileops
