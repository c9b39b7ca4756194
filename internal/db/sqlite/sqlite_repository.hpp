#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace tierbridge::db::sqlite {

class SqliteRepository final : public db::Repository {
 public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

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
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result             Translate(sqlite3* db, int rc);
};

} // namespace tierbridge::db::sqlite
