#include "pg_repository.hpp"

namespace tierbridge::db::postgres {

namespace core = tierbridge::vfs::core::v1;

namespace {

model::TransferRecord ReadTransfer(const pqxx::row& row) {
  model::TransferRecord r;
  r.id                = row[0].c_str();
  r.kind              = static_cast<core::TransferKind>(row[1].as<int>());
  r.source_id         = row[2].c_str();
  r.local_path        = row[3].c_str();
  r.remote_path       = row[4].c_str();
  r.total_size        = row[5].as<uint64_t>();
  r.bytes_transferred = row[6].as<uint64_t>();
  r.part_index        = row[7].as<uint32_t>();
  r.total_parts       = row[8].as<uint32_t>();
  r.part_size         = row[9].as<uint64_t>();
  r.status            = static_cast<core::TransferStatus>(row[10].as<int>());
  r.error             = row[11].is_null() ? "" : row[11].c_str();
  r.error_code        = static_cast<core::TransferErrorCode>(row[12].as<int>());
  r.created_at_ms     = row[13].as<uint64_t>();
  r.updated_at_ms     = row[14].as<uint64_t>();
  r.completed_at_ms   = row[15].as<uint64_t>();
  return r;
}

model::OperationRecord ReadOperation(const pqxx::row& row) {
  model::OperationRecord r;
  r.id              = row[0].c_str();
  r.type            = static_cast<core::OperationType>(row[1].as<int>());
  r.source_id       = row[2].c_str();
  r.source_category = static_cast<core::SourceCategory>(row[3].as<int>());
  r.source_path     = row[4].c_str();
  r.dest_path       = row[5].is_null() ? "" : row[5].c_str();
  r.file_size       = row[6].as<uint64_t>();
  r.bytes_processed = row[7].as<uint64_t>();
  r.status          = static_cast<core::OperationStatus>(row[8].as<int>());
  r.error           = row[9].is_null() ? "" : row[9].c_str();
  r.started_at_ms   = row[10].as<uint64_t>();
  r.completed_at_ms = row[11].as<uint64_t>();
  r.seq             = row[12].as<uint64_t>();
  return r;
}

model::FileTierRecord ReadFileTier(const pqxx::row& row) {
  model::FileTierRecord r;
  r.source_id     = row[0].c_str();
  r.path          = row[1].c_str();
  r.tier          = static_cast<core::TierStatus>(row[2].as<int>());
  r.updated_at_ms = row[3].as<uint64_t>();
  return r;
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) {
    return Result::Err(ErrorCode::AlreadyExists, e.what());
  }
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::serialization_failure*>(&e)) {
    return Result::Err(ErrorCode::Busy, e.what());
  }
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) {
    return Result::Err(ErrorCode::Unavailable, e.what());
  }
  return Result::Err(ErrorCode::Internal, e.what());
}

// ------------------------------------------------------------------
// Transfers
// ------------------------------------------------------------------

Result PgRepository::InsertTransfer(Transaction& t, const model::TransferRecord& r) {
  try {
    TX(t).Work().exec_prepared("insert_transfer", r.id, static_cast<int>(r.kind), r.source_id, r.local_path, r.remote_path, r.total_size,
                               r.bytes_transferred, r.part_index, r.total_parts, r.part_size, static_cast<int>(r.status), r.error,
                               static_cast<int>(r.error_code), r.created_at_ms, r.updated_at_ms, r.completed_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::TransferRecord> PgRepository::GetTransfer(Transaction& t, const std::string& id) {
  auto res = TX(t).Work().exec_prepared("get_transfer", id);
  if (res.empty()) return std::nullopt;
  return ReadTransfer(res[0]);
}

std::vector<model::TransferRecord> PgRepository::ListTransfers(Transaction& t) {
  auto res = TX(t).Work().exec_prepared("list_transfers");

  std::vector<model::TransferRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(ReadTransfer(row));
  }
  return out;
}

Result PgRepository::UpdateTransfer(Transaction& t, const model::TransferRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared("update_transfer", r.id, static_cast<int>(r.kind), r.source_id, r.local_path, r.remote_path,
                                          r.total_size, r.bytes_transferred, r.part_index, r.total_parts, r.part_size,
                                          static_cast<int>(r.status), r.error, static_cast<int>(r.error_code), r.created_at_ms,
                                          r.updated_at_ms, r.completed_at_ms);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, "transfer not found: " + r.id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::DeleteTransfer(Transaction& t, const std::string& id) {
  try {
    TX(t).Work().exec_prepared("delete_transfer", id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Operations
// ------------------------------------------------------------------

Result PgRepository::InsertOperation(Transaction& t, const model::OperationRecord& r) {
  try {
    TX(t).Work().exec_prepared("insert_operation", r.id, static_cast<int>(r.type), r.source_id, static_cast<int>(r.source_category),
                               r.source_path, r.dest_path, r.file_size, r.bytes_processed, static_cast<int>(r.status), r.error,
                               r.started_at_ms, r.completed_at_ms, r.seq);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::OperationRecord> PgRepository::GetOperation(Transaction& t, const std::string& id) {
  auto res = TX(t).Work().exec_prepared("get_operation", id);
  if (res.empty()) return std::nullopt;
  return ReadOperation(res[0]);
}

std::vector<model::OperationRecord> PgRepository::ListOperations(Transaction& t) {
  auto res = TX(t).Work().exec_prepared("list_operations");

  std::vector<model::OperationRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(ReadOperation(row));
  }
  return out;
}

Result PgRepository::UpdateOperation(Transaction& t, const model::OperationRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared("update_operation", r.id, static_cast<int>(r.type), r.source_id, static_cast<int>(r.source_category),
                                          r.source_path, r.dest_path, r.file_size, r.bytes_processed, static_cast<int>(r.status), r.error,
                                          r.started_at_ms, r.completed_at_ms, r.seq);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, "operation not found: " + r.id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::DeleteOperation(Transaction& t, const std::string& id) {
  try {
    TX(t).Work().exec_prepared("delete_operation", id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// File tiers
// ------------------------------------------------------------------

Result PgRepository::UpsertFileTier(Transaction& t, const model::FileTierRecord& r) {
  try {
    TX(t).Work().exec_prepared("upsert_file_tier", r.source_id, r.path, static_cast<int>(r.tier), r.updated_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::FileTierRecord> PgRepository::GetFileTier(Transaction& t, const std::string& source_id, const std::string& path) {
  auto res = TX(t).Work().exec_prepared("get_file_tier", source_id, path);
  if (res.empty()) return std::nullopt;
  return ReadFileTier(res[0]);
}

Result PgRepository::DeleteFileTier(Transaction& t, const std::string& source_id, const std::string& path) {
  try {
    TX(t).Work().exec_prepared("delete_file_tier", source_id, path);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::FileTierRecord> PgRepository::ListFileTiers(Transaction& t, const std::string& source_id) {
  auto res = TX(t).Work().exec_prepared("list_file_tiers", source_id);

  std::vector<model::FileTierRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(ReadFileTier(row));
  }
  return out;
}

} // namespace tierbridge::db::postgres
