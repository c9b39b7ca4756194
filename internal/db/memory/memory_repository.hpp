#pragma once

#include <map>
#include <mutex>
#include <unordered_map>
#include <utility>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace tierbridge::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
 public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result                               InsertTransfer(Transaction&, const model::TransferRecord&) override;
  std::optional<model::TransferRecord> GetTransfer(Transaction&, const std::string&) override;
  std::vector<model::TransferRecord>   ListTransfers(Transaction&) override;
  Result                               UpdateTransfer(Transaction&, const model::TransferRecord&) override;
  Result                               DeleteTransfer(Transaction&, const std::string&) override;

  Result                                InsertOperation(Transaction&, const model::OperationRecord&) override;
  std::optional<model::OperationRecord> GetOperation(Transaction&, const std::string&) override;
  std::vector<model::OperationRecord>   ListOperations(Transaction&) override;
  Result                                UpdateOperation(Transaction&, const model::OperationRecord&) override;
  Result                                DeleteOperation(Transaction&, const std::string&) override;

  Result                               UpsertFileTier(Transaction&, const model::FileTierRecord&) override;
  std::optional<model::FileTierRecord> GetFileTier(Transaction&, const std::string& source_id, const std::string& path) override;
  Result                               DeleteFileTier(Transaction&, const std::string& source_id, const std::string& path) override;
  std::vector<model::FileTierRecord>   ListFileTiers(Transaction&, const std::string& source_id) override;

 private:
  friend class MemoryTransaction;

  struct State {
    std::unordered_map<std::string, model::TransferRecord>  transfers;
    std::unordered_map<std::string, model::OperationRecord> operations;
    // (source_id, path); ordered so ListFileTiers can range-scan one source.
    std::map<std::pair<std::string, std::string>, model::FileTierRecord> file_tiers;
  };

  std::mutex mutex_;
  State      committed_;
  uint64_t   committed_version_ = 0;
};

} // namespace tierbridge::db::memory
