#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "internal/transfer/transfer_engine.hpp"

namespace tierbridge::ledger {

class OperationLedger;

/*
  Mirrors user-initiated uploads and downloads into the operation ledger.
  Transfers started internally by file operations are not tracked here;
  those land in the ledger as the move or copy that caused them.
*/
class TransferJournal {
 public:
  TransferJournal(std::shared_ptr<transfer::TransferEngine> transfers, std::shared_ptr<OperationLedger> ledger);
  ~TransferJournal();

  TransferJournal(const TransferJournal&)            = delete;
  TransferJournal& operator=(const TransferJournal&) = delete;

  // Opens a ledger entry for the transfer and settles it once the transfer ends.
  void Track(const tierbridge::vfs::core::v1::TransferRecord& record);

  size_t Tracked() const;

 private:
  struct Entry {
    std::string                               operation_id;
    transfer::TransferEngine::EventHub::Token token = 0;
  };

  void Settle(const tierbridge::vfs::core::v1::TransferRecord& record);

  std::shared_ptr<transfer::TransferEngine> transfers_;
  std::shared_ptr<OperationLedger>          ledger_;

  mutable std::mutex                     mutex_;
  std::unordered_map<std::string, Entry> entries_; // transfer id -> entry
};

} // namespace tierbridge::ledger
