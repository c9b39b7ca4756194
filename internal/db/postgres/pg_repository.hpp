#pragma once

#include "internal/db/api/repository.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace tierbridge::db::postgres {

class PgRepository final : public db::Repository {
 public:
  explicit PgRepository(std::shared_ptr<PgPool> pool);

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
  std::shared_ptr<PgPool> pool_;

  static PgTransaction& TX(Transaction& t);
  static Result         Translate(const std::exception&);
};

} // namespace tierbridge::db::postgres
