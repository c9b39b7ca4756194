#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include "config/config.pb.h"
#include "internal/db/api/repository.hpp"
#include "tierbridge/vfs/core/v1/types.pb.h"

namespace tierbridge::source {
class SourceRegistry;
}

namespace tierbridge::ledger {

/*
  OperationLedger

  History of file operations (upload, download, delete, move, copy).

      Begin -> InProgress -> {Completed | Failed | Canceled}

  Terminal entries are immutable. Listing keeps the most recent
  `retention_per_category` entries of each source category; Prune applies
  the same bound to storage and never touches in-progress entries.
*/
class OperationLedger {
 public:
  using Record         = tierbridge::vfs::core::v1::OperationRecord;
  using OperationType  = tierbridge::vfs::core::v1::OperationType;
  using SourceCategory = tierbridge::vfs::core::v1::SourceCategory;

  struct ListFilter {
    std::set<SourceCategory> categories; // empty means every category
  };

  OperationLedger(std::shared_ptr<db::Repository> repository, std::shared_ptr<source::SourceRegistry> registry,
                  tierbridge::runtime::config::LedgerConfig config);

  // Picks up the persisted sequence. Entries left in progress by a previous
  // run are failed.
  void Load();

  std::string Begin(OperationType type, const std::string& source_id, const std::string& source_path, const std::string& dest_path,
                    uint64_t file_size);

  void   Progress(const std::string& id, uint64_t bytes_processed);
  Record Complete(const std::string& id);
  Record Fail(const std::string& id, const std::string& error);
  Record Cancel(const std::string& id);

  // Appends an already finished entry.
  Record Append(db::model::OperationRecord record);

  Record              Get(const std::string& id) const;
  std::vector<Record> List(const ListFilter& filter) const;
  std::vector<Record> Active() const;

  size_t Prune();

  static Record ToProto(const db::model::OperationRecord& record);

 private:
  db::model::OperationRecord Fetch(const std::string& id) const;
  Record Finish(const std::string& id, tierbridge::vfs::core::v1::OperationStatus status, const std::string& error);

  std::shared_ptr<db::Repository>          repository_;
  std::shared_ptr<source::SourceRegistry>  registry_;
  tierbridge::runtime::config::LedgerConfig config_;

  mutable std::mutex mutex_;
  uint64_t           next_seq_ = 1;
};

} // namespace tierbridge::ledger
