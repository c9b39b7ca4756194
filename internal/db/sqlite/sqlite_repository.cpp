#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <stdexcept>

#include "internal/db/sql/sql_queries.hpp"

namespace tierbridge::db::sqlite {

using tierbridge::db::ErrorCode;
using tierbridge::db::Result;

namespace core = tierbridge::vfs::core::v1;

namespace {

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindI32(sqlite3_stmt* st, int idx, int v) {
  sqlite3_bind_int(st, idx, v);
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

int ColI32(sqlite3_stmt* st, int col) {
  return sqlite3_column_int(st, col);
}

/*
  Finalizes on scope exit so early returns cannot leak statements.
*/
class Statement {
 public:
  Statement(sqlite3* db, const char* sql) {
    if (sqlite3_prepare_v2(db, sql, -1, &st_, nullptr) != SQLITE_OK) {
      throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db));
    }
  }
  ~Statement() {
    sqlite3_finalize(st_);
  }

  Statement(const Statement&)            = delete;
  Statement& operator=(const Statement&) = delete;

  sqlite3_stmt* get() const {
    return st_;
  }

 private:
  sqlite3_stmt* st_ = nullptr;
};

// Binds every column but id starting at idx; returns the next free index.
int BindTransferBody(sqlite3_stmt* st, int idx, const model::TransferRecord& r) {
  BindI32(st, idx++, static_cast<int>(r.kind));
  BindText(st, idx++, r.source_id);
  BindText(st, idx++, r.local_path);
  BindText(st, idx++, r.remote_path);
  BindU64(st, idx++, r.total_size);
  BindU64(st, idx++, r.bytes_transferred);
  BindU64(st, idx++, r.part_index);
  BindU64(st, idx++, r.total_parts);
  BindU64(st, idx++, r.part_size);
  BindI32(st, idx++, static_cast<int>(r.status));
  BindText(st, idx++, r.error);
  BindI32(st, idx++, static_cast<int>(r.error_code));
  BindU64(st, idx++, r.created_at_ms);
  BindU64(st, idx++, r.updated_at_ms);
  BindU64(st, idx++, r.completed_at_ms);
  return idx;
}

model::TransferRecord ReadTransfer(sqlite3_stmt* st) {
  model::TransferRecord r;
  r.id                = ColText(st, 0);
  r.kind              = static_cast<core::TransferKind>(ColI32(st, 1));
  r.source_id         = ColText(st, 2);
  r.local_path        = ColText(st, 3);
  r.remote_path       = ColText(st, 4);
  r.total_size        = ColU64(st, 5);
  r.bytes_transferred = ColU64(st, 6);
  r.part_index        = static_cast<uint32_t>(ColU64(st, 7));
  r.total_parts       = static_cast<uint32_t>(ColU64(st, 8));
  r.part_size         = ColU64(st, 9);
  r.status            = static_cast<core::TransferStatus>(ColI32(st, 10));
  r.error             = ColText(st, 11);
  r.error_code        = static_cast<core::TransferErrorCode>(ColI32(st, 12));
  r.created_at_ms     = ColU64(st, 13);
  r.updated_at_ms     = ColU64(st, 14);
  r.completed_at_ms   = ColU64(st, 15);
  return r;
}

int BindOperationBody(sqlite3_stmt* st, int idx, const model::OperationRecord& r) {
  BindI32(st, idx++, static_cast<int>(r.type));
  BindText(st, idx++, r.source_id);
  BindI32(st, idx++, static_cast<int>(r.source_category));
  BindText(st, idx++, r.source_path);
  BindText(st, idx++, r.dest_path);
  BindU64(st, idx++, r.file_size);
  BindU64(st, idx++, r.bytes_processed);
  BindI32(st, idx++, static_cast<int>(r.status));
  BindText(st, idx++, r.error);
  BindU64(st, idx++, r.started_at_ms);
  BindU64(st, idx++, r.completed_at_ms);
  BindU64(st, idx++, r.seq);
  return idx;
}

model::OperationRecord ReadOperation(sqlite3_stmt* st) {
  model::OperationRecord r;
  r.id              = ColText(st, 0);
  r.type            = static_cast<core::OperationType>(ColI32(st, 1));
  r.source_id       = ColText(st, 2);
  r.source_category = static_cast<core::SourceCategory>(ColI32(st, 3));
  r.source_path     = ColText(st, 4);
  r.dest_path       = ColText(st, 5);
  r.file_size       = ColU64(st, 6);
  r.bytes_processed = ColU64(st, 7);
  r.status          = static_cast<core::OperationStatus>(ColI32(st, 8));
  r.error           = ColText(st, 9);
  r.started_at_ms   = ColU64(st, 10);
  r.completed_at_ms = ColU64(st, 11);
  r.seq             = ColU64(st, 12);
  return r;
}

model::FileTierRecord ReadFileTier(sqlite3_stmt* st) {
  model::FileTierRecord r;
  r.source_id     = ColText(st, 0);
  r.path          = ColText(st, 1);
  r.tier          = static_cast<core::TierStatus>(ColI32(st, 2));
  r.updated_at_ms = ColU64(st, 3);
  return r;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      if (rc == SQLITE_CONSTRAINT_PRIMARYKEY || rc == SQLITE_CONSTRAINT_UNIQUE) {
        return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
      }
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::Unavailable, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corrupt, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::Internal, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Transfers
// ------------------------------------------------------------------

Result SqliteRepository::InsertTransfer(Transaction& t, const model::TransferRecord& r) {
  auto*     db = TX(t).Handle();
  Statement st(db, sql::INSERT_TRANSFER);

  BindText(st.get(), 1, r.id);
  BindTransferBody(st.get(), 2, r);

  return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::TransferRecord> SqliteRepository::GetTransfer(Transaction& t, const std::string& id) {
  Statement st(TX(t).Handle(), sql::SELECT_TRANSFER);
  BindText(st.get(), 1, id);

  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
  return ReadTransfer(st.get());
}

std::vector<model::TransferRecord> SqliteRepository::ListTransfers(Transaction& t) {
  Statement                          st(TX(t).Handle(), sql::LIST_TRANSFERS);
  std::vector<model::TransferRecord> out;
  while (sqlite3_step(st.get()) == SQLITE_ROW) {
    out.push_back(ReadTransfer(st.get()));
  }
  return out;
}

Result SqliteRepository::UpdateTransfer(Transaction& t, const model::TransferRecord& r) {
  auto*     db = TX(t).Handle();
  Statement st(db, sql::UPDATE_TRANSFER);

  const int next = BindTransferBody(st.get(), 1, r);
  BindText(st.get(), next, r.id);

  int rc = sqlite3_step(st.get());
  if (rc == SQLITE_DONE && sqlite3_changes(db) == 0) {
    return Result::Err(ErrorCode::NotFound, "transfer not found: " + r.id);
  }
  return Translate(db, rc);
}

Result SqliteRepository::DeleteTransfer(Transaction& t, const std::string& id) {
  auto*     db = TX(t).Handle();
  Statement st(db, sql::DELETE_TRANSFER);
  BindText(st.get(), 1, id);
  return Translate(db, sqlite3_step(st.get()));
}

// ------------------------------------------------------------------
// Operations
// ------------------------------------------------------------------

Result SqliteRepository::InsertOperation(Transaction& t, const model::OperationRecord& r) {
  auto*     db = TX(t).Handle();
  Statement st(db, sql::INSERT_OPERATION);

  BindText(st.get(), 1, r.id);
  BindOperationBody(st.get(), 2, r);

  return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::OperationRecord> SqliteRepository::GetOperation(Transaction& t, const std::string& id) {
  Statement st(TX(t).Handle(), sql::SELECT_OPERATION);
  BindText(st.get(), 1, id);

  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
  return ReadOperation(st.get());
}

std::vector<model::OperationRecord> SqliteRepository::ListOperations(Transaction& t) {
  Statement                           st(TX(t).Handle(), sql::LIST_OPERATIONS);
  std::vector<model::OperationRecord> out;
  while (sqlite3_step(st.get()) == SQLITE_ROW) {
    out.push_back(ReadOperation(st.get()));
  }
  return out;
}

Result SqliteRepository::UpdateOperation(Transaction& t, const model::OperationRecord& r) {
  auto*     db = TX(t).Handle();
  Statement st(db, sql::UPDATE_OPERATION);

  const int next = BindOperationBody(st.get(), 1, r);
  BindText(st.get(), next, r.id);

  int rc = sqlite3_step(st.get());
  if (rc == SQLITE_DONE && sqlite3_changes(db) == 0) {
    return Result::Err(ErrorCode::NotFound, "operation not found: " + r.id);
  }
  return Translate(db, rc);
}

Result SqliteRepository::DeleteOperation(Transaction& t, const std::string& id) {
  auto*     db = TX(t).Handle();
  Statement st(db, sql::DELETE_OPERATION);
  BindText(st.get(), 1, id);
  return Translate(db, sqlite3_step(st.get()));
}

// ------------------------------------------------------------------
// File tiers
// ------------------------------------------------------------------

Result SqliteRepository::UpsertFileTier(Transaction& t, const model::FileTierRecord& r) {
  auto*     db = TX(t).Handle();
  Statement st(db, sql::UPSERT_FILE_TIER);

  BindText(st.get(), 1, r.source_id);
  BindText(st.get(), 2, r.path);
  BindI32(st.get(), 3, static_cast<int>(r.tier));
  BindU64(st.get(), 4, r.updated_at_ms);

  return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::FileTierRecord> SqliteRepository::GetFileTier(Transaction& t, const std::string& source_id, const std::string& path) {
  Statement st(TX(t).Handle(), sql::SELECT_FILE_TIER);
  BindText(st.get(), 1, source_id);
  BindText(st.get(), 2, path);

  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
  return ReadFileTier(st.get());
}

Result SqliteRepository::DeleteFileTier(Transaction& t, const std::string& source_id, const std::string& path) {
  auto*     db = TX(t).Handle();
  Statement st(db, sql::DELETE_FILE_TIER);
  BindText(st.get(), 1, source_id);
  BindText(st.get(), 2, path);
  return Translate(db, sqlite3_step(st.get()));
}

std::vector<model::FileTierRecord> SqliteRepository::ListFileTiers(Transaction& t, const std::string& source_id) {
  Statement st(TX(t).Handle(), sql::LIST_FILE_TIERS);
  BindText(st.get(), 1, source_id);

  std::vector<model::FileTierRecord> out;
  while (sqlite3_step(st.get()) == SQLITE_ROW) {
    out.push_back(ReadFileTier(st.get()));
  }
  return out;
}

} // namespace tierbridge::db::sqlite
