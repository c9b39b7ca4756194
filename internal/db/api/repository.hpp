#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/file_tier_record.hpp"
#include "internal/db/model/operation_record.hpp"
#include "internal/db/model/transfer_record.hpp"

namespace tierbridge::db {

/*
  Repository abstraction.

  - All writes require a Transaction
  - Reads inside a transaction see its writes

  The DB is the source of truth for:
    transfer progress (resume after restart)
    the operation ledger
    per-file tier state
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Transfers
  // ---------------------------------------------------------------------

  virtual Result InsertTransfer(Transaction&, const model::TransferRecord&) = 0;

  virtual std::optional<model::TransferRecord> GetTransfer(Transaction&, const std::string& id) = 0;

  // Ordered by created_at_ms ascending.
  virtual std::vector<model::TransferRecord> ListTransfers(Transaction&) = 0;

  virtual Result UpdateTransfer(Transaction&, const model::TransferRecord&) = 0;

  virtual Result DeleteTransfer(Transaction&, const std::string& id) = 0;

  // ---------------------------------------------------------------------
  // Operation ledger
  // ---------------------------------------------------------------------

  virtual Result InsertOperation(Transaction&, const model::OperationRecord&) = 0;

  virtual std::optional<model::OperationRecord> GetOperation(Transaction&, const std::string& id) = 0;

  // Ordered by seq ascending.
  virtual std::vector<model::OperationRecord> ListOperations(Transaction&) = 0;

  virtual Result UpdateOperation(Transaction&, const model::OperationRecord&) = 0;

  virtual Result DeleteOperation(Transaction&, const std::string& id) = 0;

  // ---------------------------------------------------------------------
  // File tiers
  // ---------------------------------------------------------------------

  virtual Result UpsertFileTier(Transaction&, const model::FileTierRecord&) = 0;

  virtual std::optional<model::FileTierRecord> GetFileTier(Transaction&, const std::string& source_id, const std::string& path) = 0;

  virtual Result DeleteFileTier(Transaction&, const std::string& source_id, const std::string& path) = 0;

  virtual std::vector<model::FileTierRecord> ListFileTiers(Transaction&, const std::string& source_id) = 0;
};

} // namespace tierbridge::db
